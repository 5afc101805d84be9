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

#include "volume/publisher.hpp"

#include <errno.h>

#include <sys/stat.h>
#include <sys/types.h>

#include <vector>

#include <glog/logging.h>

#include <stout/error.hpp>
#include <stout/foreach.hpp>
#include <stout/os.hpp>
#include <stout/path.hpp>
#include <stout/stringify.hpp>
#include <stout/synchronized.hpp>

#include "volume/capability.hpp"
#include "volume/source.hpp"

using std::string;
using std::vector;

using grpc::Status;

using process::Owned;

using process::grpc::StatusError;

namespace nfscsi {
namespace internal {
namespace volume {

using csi::v1::VolumeCapability;

// Returns whether `path` exists. Unlike `os::exists`, only a missing
// path yields false: any other `lstat` failure (e.g., ESTALE on the
// mount point of an NFS export that went away) is an error.
static Try<bool> exists(const string& path)
{
  struct stat s;

  if (::lstat(path.c_str(), &s) < 0) {
    if (errno == ENOENT) {
      return false;
    }

    return ErrnoError("Failed to stat '" + path + "'");
  }

  return true;
}


// Creates the target directory with `TARGET_PATH_MODE`. Missing parent
// directories are created as well, with the default mode: only the leaf
// is restricted.
static Try<Nothing> createTargetPath(const string& targetPath)
{
  const string parent = Path(targetPath).dirname();

  Try<Nothing> mkdir = os::mkdir(parent);
  if (mkdir.isError()) {
    return Error(
        "Failed to create parent directory '" + parent + "': " +
        mkdir.error());
  }

  if (::mkdir(targetPath.c_str(), TARGET_PATH_MODE) < 0) {
    return ErrnoError("Failed to create directory '" + targetPath + "'");
  }

  // The umask may have masked out some of the requested bits.
  Try<Nothing> chmod = os::chmod(targetPath, TARGET_PATH_MODE);
  if (chmod.isError()) {
    return Error("Failed to set permissions: " + chmod.error());
  }

  return Nothing();
}


// Holds the per-target lock of a publisher for the scope of a call.
// Spellings of the same path (`/a/b`, `/a/b/`, `/a//b`) share a lock.
class VolumePublisher::TargetLock
{
public:
  TargetLock(VolumePublisher* _publisher, const string& _targetPath)
    : publisher(_publisher), targetPath(normalize(_targetPath))
  {
    publisher->acquire(targetPath);
  }

  ~TargetLock()
  {
    publisher->release(targetPath);
  }

private:
  VolumePublisher* publisher;
  const string targetPath;
};


VolumePublisher::VolumePublisher(const Owned<Mounter>& _mounter)
  : mounter(_mounter) {}


Try<Nothing, StatusError> VolumePublisher::publish(
    const string& volumeId,
    const string& targetPath,
    const Option<VolumeCapability>& capability,
    const hashmap<string, string>& parameters,
    bool readonly)
{
  if (volumeId.empty()) {
    return StatusError(Status(grpc::INVALID_ARGUMENT, "Volume ID is required"));
  }

  if (targetPath.empty()) {
    return StatusError(
        Status(grpc::INVALID_ARGUMENT, "Target path is required"));
  }

  Option<Error> error = validateVolumeCapability(capability);
  if (error.isSome()) {
    return StatusError(Status(grpc::INVALID_ARGUMENT, error->message));
  }

  VLOG(1) << "Sub-path for volume '" << volumeId << "': '"
          << getSubPath(parameters) << "'";

  Try<MountSource> source = resolveMountSource(parameters);
  if (source.isError()) {
    return StatusError(Status(
        grpc::INVALID_ARGUMENT,
        "Failed to get volume source: " + source.error()));
  }

  const string from = stringify(source.get());

  TargetLock lock(this, targetPath);

  Try<bool> exists = volume::exists(targetPath);
  if (exists.isError()) {
    return StatusError(Status(
        grpc::INTERNAL,
        "Failed to check target path of volume '" + volumeId + "': " +
          exists.error()));
  }

  // Creation of the target path is the responsibility of the plugin.
  if (!exists.get()) {
    Try<Nothing> create = createTargetPath(targetPath);
    if (create.isError()) {
      return StatusError(Status(
          grpc::INTERNAL,
          "Failed to create target path '" + targetPath + "' for volume '" +
            volumeId + "': " + create.error()));
    }
  }

  Try<bool> mounted = mounter->isMountPoint(targetPath);
  if (mounted.isError()) {
    return StatusError(Status(
        grpc::INTERNAL,
        "Failed to check mount point '" + targetPath + "': " +
          mounted.error()));
  }

  if (mounted.get()) {
    VLOG(1) << "Target path '" << targetPath << "' of volume '" << volumeId
            << "' is already mounted";
    return Nothing();
  }

  vector<string> options = {DEFAULT_MOUNT_OPTION};

  foreach (const string& flag, capability->mount().mount_flags()) {
    options.push_back(flag);
  }

  if (readonly) {
    options.push_back(READONLY_MOUNT_OPTION);
  }

  VLOG(1) << "Mounting NFS '" << from << "' at '" << targetPath
          << "' with options " << stringify(options);

  Try<Nothing> mount = mounter->mount(from, targetPath, NFS_FS_TYPE, options);
  if (mount.isError()) {
    return StatusError(Status(
        grpc::INTERNAL,
        "Failed to mount NFS '" + from + "' at '" + targetPath + "': " +
          mount.error()));
  }

  LOG(INFO) << "Mounted NFS '" << from << "' at '" << targetPath
            << "' for volume '" << volumeId << "'";

  return Nothing();
}


Try<Nothing, StatusError> VolumePublisher::unpublish(
    const string& volumeId,
    const string& targetPath)
{
  if (volumeId.empty()) {
    return StatusError(Status(grpc::INVALID_ARGUMENT, "Volume ID is required"));
  }

  if (targetPath.empty()) {
    return StatusError(
        Status(grpc::INVALID_ARGUMENT, "Target path is required"));
  }

  TargetLock lock(this, targetPath);

  Try<bool> exists = volume::exists(targetPath);
  if (exists.isSome() && !exists.get()) {
    VLOG(1) << "Target path '" << targetPath << "' of volume '" << volumeId
            << "' does not exist, nothing to unmount";
    return Nothing();
  }

  // A target path that cannot be stat'ed may still be a mount point, e.g.,
  // a stale NFS mount, so the mount table decides what to do with it.
  if (exists.isError()) {
    LOG(WARNING) << "Failed to check target path of volume '" << volumeId
                 << "': " << exists.error();
  }

  Try<bool> mounted = mounter->isMountPoint(targetPath);
  if (mounted.isError()) {
    return StatusError(Status(
        grpc::INTERNAL,
        "Failed to check mount point '" + targetPath + "': " +
          mounted.error()));
  }

  if (!mounted.get()) {
    if (exists.isError()) {
      return StatusError(Status(
          grpc::INTERNAL,
          "Failed to check target path of volume '" + volumeId + "': " +
            exists.error()));
    }

    VLOG(1) << "Target path '" << targetPath << "' of volume '" << volumeId
            << "' is not mounted";

    Try<Nothing> rmdir = os::rmdir(targetPath, false);
    if (rmdir.isError()) {
      LOG(WARNING) << "Failed to remove target path '" << targetPath
                   << "': " << rmdir.error();
    }

    return Nothing();
  }

  Try<Nothing> unmount = mounter->unmount(targetPath);
  if (unmount.isError()) {
    return StatusError(Status(
        grpc::INTERNAL,
        "Failed to unmount '" + targetPath + "': " + unmount.error()));
  }

  Try<Nothing> rmdir = os::rmdir(targetPath, false);
  if (rmdir.isError()) {
    return StatusError(Status(
        grpc::INTERNAL,
        "Failed to remove target path '" + targetPath + "': " +
          rmdir.error()));
  }

  LOG(INFO) << "Unmounted '" << targetPath << "' for volume '" << volumeId
            << "'";

  return Nothing();
}


void VolumePublisher::acquire(const string& targetPath)
{
  std::unique_lock<std::mutex> lock(mutex);

  if (targets.contains(targetPath)) {
    VLOG(1) << "Waiting for the in-flight operation on target path '"
            << targetPath << "'";
  }

  released.wait(lock, [&]() { return !targets.contains(targetPath); });
  targets.insert(targetPath);
}


void VolumePublisher::release(const string& targetPath)
{
  synchronized (mutex) {
    targets.erase(targetPath);
  }

  released.notify_all();
}

} // namespace volume {
} // namespace internal {
} // namespace nfscsi {
