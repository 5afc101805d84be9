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

#ifndef __VOLUME_CAPABILITY_HPP__
#define __VOLUME_CAPABILITY_HPP__

#include <nfscsi/csi/v1.hpp>

#include <stout/error.hpp>
#include <stout/option.hpp>

namespace nfscsi {
namespace internal {
namespace volume {

// Checks whether the plugin can serve a volume with the given
// capability. An NFS share can be attached by any number of nodes, so
// every single- and multi-node access mode is accepted, but only as a
// file system mount: block volumes are never supported.
//
// Returns None() if the capability is supported, otherwise an Error
// describing the first reason it is not. A missing capability is
// represented as None().
Option<Error> validateVolumeCapability(
    const Option<csi::v1::VolumeCapability>& capability);

} // namespace volume {
} // namespace internal {
} // namespace nfscsi {

#endif // __VOLUME_CAPABILITY_HPP__
