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

#include "volume/capability.hpp"

#include <stout/stringify.hpp>

#include "csi/utils.hpp"

namespace nfscsi {
namespace internal {
namespace volume {

using csi::v1::VolumeCapability;

Option<Error> validateVolumeCapability(
    const Option<VolumeCapability>& capability)
{
  if (capability.isNone()) {
    return Error("volume capability is missing");
  }

  if (!capability->has_access_mode()) {
    return Error("volume capability access mode is missing");
  }

  const VolumeCapability::AccessMode::Mode mode =
    capability->access_mode().mode();

  switch (mode) {
    case VolumeCapability::AccessMode::SINGLE_NODE_WRITER:
    case VolumeCapability::AccessMode::SINGLE_NODE_READER_ONLY:
    case VolumeCapability::AccessMode::MULTI_NODE_READER_ONLY:
    case VolumeCapability::AccessMode::MULTI_NODE_SINGLE_WRITER:
    case VolumeCapability::AccessMode::MULTI_NODE_MULTI_WRITER:
      break;
    default:
      return Error("unsupported access mode: " + stringify(mode));
  }

  if (capability->access_type_case() ==
      VolumeCapability::ACCESS_TYPE_NOT_SET) {
    return Error("volume capability access type is missing");
  }

  if (!capability->has_mount()) {
    return Error(
        "only mount access type is supported, got '" +
        csi::accessTypeName(capability.get()) + "'");
  }

  return None();
}

} // namespace volume {
} // namespace internal {
} // namespace nfscsi {
