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

#include "linux/mounter.hpp"

#include <glog/logging.h>

#include <stout/error.hpp>
#include <stout/foreach.hpp>
#include <stout/os.hpp>
#include <stout/result.hpp>

#include <stout/os/realpath.hpp>

#include "linux/fs.hpp"

#include "volume/source.hpp"

using std::string;
using std::vector;

namespace nfscsi {
namespace internal {

Try<Mounter*> Mounter::create()
{
  if (!os::exists(fs::PROC_MOUNTS)) {
    return Error(
        "Cannot query mounts: '" + string(fs::PROC_MOUNTS) +
        "' does not exist (is /proc mounted?)");
  }

  Mounter* mounter = new LinuxMounter();

  return mounter;
}


Try<bool> LinuxMounter::isMountPoint(const string& target)
{
  // Mount points are recorded with their canonical path. A path that
  // exists but cannot be resolved (e.g., ESTALE below a stale NFS mount
  // point) is looked up as given.
  string path;

  Result<string> realpath = os::realpath(target);
  if (realpath.isSome()) {
    path = realpath.get();
  } else if (realpath.isNone()) {
    return Error("'" + target + "' does not exist");
  } else {
    VLOG(1) << "Failed to get realpath of '" << target << "': "
            << realpath.error();

    path = volume::normalize(target);
  }

  Try<fs::MountTable> table = fs::MountTable::read(fs::PROC_MOUNTS);
  if (table.isError()) {
    return Error("Failed to read mount table: " + table.error());
  }

  foreach (const fs::MountTable::Entry& entry, table->entries) {
    if (entry.dir == path) {
      return true;
    }
  }

  return false;
}


Try<Nothing> LinuxMounter::mount(
    const string& source,
    const string& target,
    const string& fsType,
    const vector<string>& options)
{
  return fs::mount(source, target, fsType, options);
}


Try<Nothing> LinuxMounter::unmount(const string& target)
{
  return fs::unmount(target);
}

} // namespace internal {
} // namespace nfscsi {
