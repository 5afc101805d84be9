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

#ifndef __LINUX_FS_HPP__
#define __LINUX_FS_HPP__

#include <string>
#include <vector>

#include <stout/nothing.hpp>
#include <stout/try.hpp>

namespace nfscsi {
namespace internal {
namespace fs {

// The kernel's view of the mount table of the calling process.
constexpr char PROC_MOUNTS[] = "/proc/mounts";


// Structure describing a mount table (e.g. /etc/mtab or /proc/mounts).
struct MountTable {
  // Structure describing a mount table entry. This is a wrapper for struct
  // mntent defined in <mntent.h>.
  struct Entry {
    Entry() : freq(0), passno(0) {}

    Entry(const std::string& _fsname,
          const std::string& _dir,
          const std::string& _type,
          const std::string& _opts,
          int _freq,
          int _passno)
      : fsname(_fsname),
        dir(_dir),
        type(_type),
        opts(_opts),
        freq(_freq),
        passno(_passno)
    {}

    std::string fsname; // Device or server for filesystem.
    std::string dir;    // Directory mounted on.
    std::string type;   // Type of filesystem: ufs, nfs, etc.
    std::string opts;   // Comma-separated options for fs.
    int freq;           // Dump frequency (in days).
    int passno;         // Pass number for `fsck'.
  };

  // Read the mount table from a file.
  // @param   path    The path of the file storing the mount table.
  // @return  An instance of MountTable if success.
  static Try<MountTable> read(const std::string& path);

  std::vector<Entry> entries;
};


// Mount a file system through mount(8), which dispatches to the
// file system specific helper (e.g. mount.nfs) that resolves the
// server address and negotiates the protocol version.
// @param   source    The remote source, e.g. `server:/export`.
// @param   target    Directory to be attached to.
// @param   type      File system type passed with `-t`.
// @param   options   Mount options, joined with commas and passed with
//                    `-o`. Omitted if empty.
// @return  Whether the mount operation succeeds. On failure the error
//          carries the exit status and what mount(8) wrote to stderr.
Try<Nothing> mount(
    const std::string& source,
    const std::string& target,
    const std::string& type,
    const std::vector<std::string>& options);


// Unmount a file system.
// @param   target    The (topmost) directory where the file system attaches.
// @param   flags     Unmount flags.
// @return  Whether the unmount operation succeeds.
Try<Nothing> unmount(const std::string& target, int flags = 0);

} // namespace fs {
} // namespace internal {
} // namespace nfscsi {

#endif // __LINUX_FS_HPP__
