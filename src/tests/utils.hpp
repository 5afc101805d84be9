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

#ifndef __TESTS_UTILS_HPP__
#define __TESTS_UTILS_HPP__

#include <string>
#include <vector>

#include <nfscsi/csi/v1.hpp>

#include <stout/foreach.hpp>

namespace nfscsi {
namespace internal {
namespace tests {

inline csi::v1::VolumeCapability createMountCapability(
    csi::v1::VolumeCapability::AccessMode::Mode mode,
    const std::vector<std::string>& mountFlags = {})
{
  csi::v1::VolumeCapability capability;
  capability.mutable_access_mode()->set_mode(mode);

  csi::v1::VolumeCapability::MountVolume* mount =
    capability.mutable_mount();

  foreach (const std::string& flag, mountFlags) {
    mount->add_mount_flags(flag);
  }

  return capability;
}


inline csi::v1::VolumeCapability createBlockCapability(
    csi::v1::VolumeCapability::AccessMode::Mode mode)
{
  csi::v1::VolumeCapability capability;
  capability.mutable_access_mode()->set_mode(mode);
  capability.mutable_block();

  return capability;
}

} // namespace tests {
} // namespace internal {
} // namespace nfscsi {

#endif // __TESTS_UTILS_HPP__
