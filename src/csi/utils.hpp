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

#ifndef __CSI_UTILS_HPP__
#define __CSI_UTILS_HPP__

#include <string>

#include <google/protobuf/map.h>

#include <nfscsi/csi/v1.hpp>

#include <stout/hashmap.hpp>

namespace nfscsi {
namespace csi {

// Converts the string map of a CSI request (`parameters` or
// `volume_context`) into the key-value form consumed by the volume code.
hashmap<std::string, std::string> toParameters(
    const google::protobuf::Map<std::string, std::string>& map);


google::protobuf::Map<std::string, std::string> toVolumeContext(
    const hashmap<std::string, std::string>& parameters);


// Returns the name of the access type set in the capability, or
// "unset" if neither `mount` nor `block` is present.
std::string accessTypeName(const v1::VolumeCapability& capability);

} // namespace csi {
} // namespace nfscsi {

#endif // __CSI_UTILS_HPP__
