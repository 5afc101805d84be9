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

#include "linux/fs.hpp"

#include <errno.h>
#include <mntent.h>
#include <stdio.h>

#include <linux/limits.h>

#include <sys/mount.h>
#include <sys/wait.h>

#include <glog/logging.h>

#include <process/future.hpp>
#include <process/io.hpp>
#include <process/subprocess.hpp>

#include <stout/error.hpp>
#include <stout/option.hpp>
#include <stout/stringify.hpp>
#include <stout/strings.hpp>

#include <stout/os/constants.hpp>

using std::string;
using std::vector;

using process::Future;
using process::Subprocess;

using process::subprocess;


namespace nfscsi {
namespace internal {
namespace fs {

Try<MountTable> MountTable::read(const string& path)
{
  MountTable table;

  FILE* file = ::setmntent(path.c_str(), "r");
  if (file == nullptr) {
    return ErrnoError("Failed to open '" + path + "'");
  }

  while (true) {
    struct mntent mntentBuffer;
    char strBuffer[PATH_MAX];
    struct mntent* mntent =
      ::getmntent_r(file, &mntentBuffer, strBuffer, sizeof(strBuffer));
    if (mntent == nullptr) {
      // nullptr means the end of entries.
      break;
    }

    MountTable::Entry entry(mntent->mnt_fsname,
                            mntent->mnt_dir,
                            mntent->mnt_type,
                            mntent->mnt_opts,
                            mntent->mnt_freq,
                            mntent->mnt_passno);
    table.entries.push_back(entry);
  }

  ::endmntent(file);

  return table;
}


Try<Nothing> mount(
    const string& source,
    const string& target,
    const string& type,
    const vector<string>& options)
{
  vector<string> argv = {"mount", "-t", type};

  if (!options.empty()) {
    argv.push_back("-o");
    argv.push_back(strings::join(",", options));
  }

  argv.push_back(source);
  argv.push_back(target);

  const string command = strings::join(" ", argv);

  VLOG(1) << "Running '" << command << "'";

  // NOTE: The arguments are passed to mount(8) without a shell, so the
  // source (which embeds a user supplied sub-path) is never interpreted.
  Try<Subprocess> s = subprocess(
      "mount",
      argv,
      Subprocess::PATH(os::DEV_NULL),
      Subprocess::PATH(os::DEV_NULL),
      Subprocess::PIPE());

  if (s.isError()) {
    return Error("Failed to execute '" + command + "': " + s.error());
  }

  // The helper's diagnostics (e.g., "access denied by server") are only
  // printed on stderr.
  Future<string> error = process::io::read(s->err().get());
  Future<Option<int>> status = s->status();

  status.await();
  error.await();

  if (!status.isReady()) {
    return Error(
        "Failed to get the exit status of '" + command + "': " +
        (status.isFailed() ? status.failure() : "discarded"));
  }

  if (status->isNone()) {
    return Error("Failed to reap '" + command + "'");
  }

  const int wstatus = status->get();

  const string output = error.isReady() ? strings::trim(error.get()) : "";

  if (WIFEXITED(wstatus) && WEXITSTATUS(wstatus) == 0) {
    return Nothing();
  }

  string message = WIFEXITED(wstatus)
    ? "mount exited with status " + stringify(WEXITSTATUS(wstatus))
    : "mount terminated abnormally (wait status " + stringify(wstatus) + ")";

  if (!output.empty()) {
    message += ": " + output;
  }

  return Error(message);
}


Try<Nothing> unmount(const string& target, int flags)
{
  // The prototype of function 'umount2' on Linux is as follows:
  // int umount2(const char *target, int flags);
  if (::umount2(target.c_str(), flags) < 0) {
    return ErrnoError("Failed to unmount '" + target + "'");
  }

  return Nothing();
}

} // namespace fs {
} // namespace internal {
} // namespace nfscsi {
