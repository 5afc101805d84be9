// Licensed to the Apache Software Foundation (ASF) under one
// or more contributor license agreements.  See the NOTICE file
// distributed with this work for additional information
// regarding copyright ownership.  The ASF licenses this file
// to you under the Apache License, Version 2.0 (the
// "License"); you may not use this file except in compliance
// with the License.  You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "csi/utils.hpp"

#include <stout/foreach.hpp>

using std::ostream;
using std::string;

using google::protobuf::Map;

namespace csi {
namespace v1 {

ostream& operator<<(
    ostream& stream,
    const VolumeCapability::AccessMode::Mode& mode)
{
  // NOTE: proto3 enums are open, so a peer may send a value outside of
  // the ones we know about.
  if (!VolumeCapability::AccessMode::Mode_IsValid(mode)) {
    return stream << "UNKNOWN(" << static_cast<int>(mode) << ")";
  }

  return stream << VolumeCapability::AccessMode::Mode_Name(mode);
}


} // namespace v1 {
} // namespace csi {


namespace nfscsi {
namespace csi {

hashmap<string, string> toParameters(const Map<string, string>& map)
{
  hashmap<string, string> parameters;

  foreach (const auto& value, map) {
    parameters[value.first] = value.second;
  }

  return parameters;
}


Map<string, string> toVolumeContext(const hashmap<string, string>& parameters)
{
  Map<string, string> context;

  foreachpair (const string& key, const string& value, parameters) {
    context[key] = value;
  }

  return context;
}


string accessTypeName(const v1::VolumeCapability& capability)
{
  switch (capability.access_type_case()) {
    case v1::VolumeCapability::kBlock:
      return "block";
    case v1::VolumeCapability::kMount:
      return "mount";
    case v1::VolumeCapability::ACCESS_TYPE_NOT_SET:
      break;
  }

  return "unset";
}

} // namespace csi {
} // namespace nfscsi {
