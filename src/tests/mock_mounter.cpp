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

#include "tests/mock_mounter.hpp"

#include <stout/error.hpp>

#include "volume/source.hpp"

using std::string;
using std::vector;

using ::testing::_;
using ::testing::Invoke;

namespace nfscsi {
namespace internal {
namespace tests {

MockMounter::MockMounter()
{
  EXPECT_CALL(*this, isMountPoint(_))
    .WillRepeatedly(Invoke(this, &MockMounter::_isMountPoint));

  EXPECT_CALL(*this, mount(_, _, _, _))
    .WillRepeatedly(Invoke(this, &MockMounter::_mount));

  EXPECT_CALL(*this, unmount(_))
    .WillRepeatedly(Invoke(this, &MockMounter::_unmount));
}


MockMounter::~MockMounter()
{
}


Try<bool> MockMounter::_isMountPoint(const string& target)
{
  return mounts.contains(volume::normalize(target));
}


Try<Nothing> MockMounter::_mount(
    const string& source,
    const string& target,
    const string& fsType,
    const vector<string>& options)
{
  const string path = volume::normalize(target);

  if (mounts.contains(path)) {
    return Error("'" + target + "' is already mounted");
  }

  mounts[path] = Mount{source, fsType, options};

  return Nothing();
}


Try<Nothing> MockMounter::_unmount(const string& target)
{
  const string path = volume::normalize(target);

  if (!mounts.contains(path)) {
    return Error("'" + target + "' is not mounted");
  }

  mounts.erase(path);

  return Nothing();
}

} // namespace tests {
} // namespace internal {
} // namespace nfscsi {
