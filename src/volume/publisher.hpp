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

#ifndef __VOLUME_PUBLISHER_HPP__
#define __VOLUME_PUBLISHER_HPP__

#include <condition_variable>
#include <mutex>
#include <string>

#include <nfscsi/csi/v1.hpp>

#include <process/grpc.hpp>
#include <process/owned.hpp>

#include <stout/hashmap.hpp>
#include <stout/hashset.hpp>
#include <stout/nothing.hpp>
#include <stout/option.hpp>
#include <stout/try.hpp>

#include "linux/mounter.hpp"

namespace nfscsi {
namespace internal {
namespace volume {

// Options every NFS mount starts with. Client side locking is disabled
// so that the mount does not depend on rpc.statd, which is usually not
// running inside the plugin container.
constexpr char DEFAULT_MOUNT_OPTION[] = "nolock";
constexpr char READONLY_MOUNT_OPTION[] = "ro";
constexpr char NFS_FS_TYPE[] = "nfs";

// Permissions of target paths created by the plugin.
constexpr int TARGET_PATH_MODE = 0750;


// Attaches NFS volumes to target paths on this node and detaches them.
// Both operations are idempotent: the host mount table is queried on
// every call to decide whether there is anything left to do, so a retry
// after a partial failure (or a restart of the plugin) converges.
//
// Operations on the same target path are serialized. Operations on
// different target paths run concurrently.
class VolumePublisher
{
public:
  explicit VolumePublisher(const process::Owned<Mounter>& mounter);

  // Mounts the NFS share described by `parameters` (the volume context)
  // at `targetPath`, creating the directory if needed. Succeeds without
  // mounting again if `targetPath` is already a mount point; the options
  // of an existing mount are not reconciled. Only the target directory
  // itself gets `TARGET_PATH_MODE`, missing parents get the default mode.
  Try<Nothing, process::grpc::StatusError> publish(
      const std::string& volumeId,
      const std::string& targetPath,
      const Option<csi::v1::VolumeCapability>& capability,
      const hashmap<std::string, std::string>& parameters,
      bool readonly);

  // Unmounts `targetPath` and removes the directory. Succeeds if the
  // target path is already gone or is not a mount point. A target path
  // that cannot be stat'ed is unmounted if the mount table lists it and
  // fails the call otherwise.
  Try<Nothing, process::grpc::StatusError> unpublish(
      const std::string& volumeId,
      const std::string& targetPath);

private:
  class TargetLock;

  void acquire(const std::string& targetPath);
  void release(const std::string& targetPath);

  process::Owned<Mounter> mounter;

  std::mutex mutex;
  std::condition_variable released;
  hashset<std::string> targets;
};

} // namespace volume {
} // namespace internal {
} // namespace nfscsi {

#endif // __VOLUME_PUBLISHER_HPP__
