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

#include <string>

#include <gtest/gtest.h>

#include <process/owned.hpp>

#include <stout/gtest.hpp>
#include <stout/os.hpp>
#include <stout/path.hpp>
#include <stout/strings.hpp>
#include <stout/try.hpp>

#include <stout/tests/utils.hpp>

#include "linux/fs.hpp"
#include "linux/mounter.hpp"

using std::string;

namespace nfscsi {
namespace internal {
namespace tests {

using fs::MountTable;

class FsTest : public TemporaryDirectoryTest {};


TEST_F(FsTest, MountTableRead)
{
  const string table = path::join(sandbox.get(), "mounts");

  ASSERT_SOME(os::write(
      table,
      "proc /proc proc rw,nosuid,nodev,noexec,relatime 0 0\n"
      "10.0.0.1:/exports/data /var/lib/kubelet/pods/1/volumes/data nfs "
      "rw,relatime,vers=4.1,nolock,addr=10.0.0.1 0 0\n"));

  Try<MountTable> mounts = MountTable::read(table);
  ASSERT_SOME(mounts);
  ASSERT_EQ(2u, mounts->entries.size());

  const MountTable::Entry& proc = mounts->entries[0];
  EXPECT_EQ("proc", proc.fsname);
  EXPECT_EQ("/proc", proc.dir);
  EXPECT_EQ("proc", proc.type);
  EXPECT_EQ("rw,nosuid,nodev,noexec,relatime", proc.opts);

  const MountTable::Entry& nfs = mounts->entries[1];
  EXPECT_EQ("10.0.0.1:/exports/data", nfs.fsname);
  EXPECT_EQ("/var/lib/kubelet/pods/1/volumes/data", nfs.dir);
  EXPECT_EQ("nfs", nfs.type);
  EXPECT_EQ("rw,relatime,vers=4.1,nolock,addr=10.0.0.1", nfs.opts);
}


TEST_F(FsTest, MountTableReadEmpty)
{
  const string table = path::join(sandbox.get(), "mounts");
  ASSERT_SOME(os::write(table, ""));

  Try<MountTable> mounts = MountTable::read(table);
  ASSERT_SOME(mounts);
  EXPECT_TRUE(mounts->entries.empty());
}


TEST_F(FsTest, MountTableReadMissing)
{
  EXPECT_ERROR(MountTable::read(path::join(sandbox.get(), "missing")));
}


TEST_F(FsTest, UnmountNotMounted)
{
  const string target = path::join(sandbox.get(), "target");
  ASSERT_SOME(os::mkdir(target));

  EXPECT_ERROR(fs::unmount(target));
}


// A failed mount reports what mount(8) wrote to stderr.
TEST_F(FsTest, MountFailure)
{
  const string target = path::join(sandbox.get(), "target");
  ASSERT_SOME(os::mkdir(target));

  Try<Nothing> mount = fs::mount("none", target, "nfscsi-invalid", {});
  ASSERT_ERROR(mount);

  const string prefix = "mount exited with status ";
  ASSERT_TRUE(strings::startsWith(mount.error(), prefix)) << mount.error();

  size_t separator = mount.error().find(": ", prefix.size());
  ASSERT_NE(string::npos, separator) << mount.error();
  EXPECT_FALSE(strings::trim(mount.error().substr(separator + 2)).empty())
    << mount.error();
}


TEST_F(FsTest, LinuxMounterIsMountPoint)
{
  Try<Mounter*> create = Mounter::create();
  ASSERT_SOME(create);

  process::Owned<Mounter> mounter(create.get());

  EXPECT_SOME_TRUE(mounter->isMountPoint("/proc"));

  // Mount points are matched by their canonical path.
  EXPECT_SOME_TRUE(mounter->isMountPoint("/proc/../proc/"));

  EXPECT_SOME_FALSE(mounter->isMountPoint(sandbox.get()));

  EXPECT_ERROR(mounter->isMountPoint(path::join(sandbox.get(), "missing")));
}

} // namespace tests {
} // namespace internal {
} // namespace nfscsi {
