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

#ifndef __TESTS_MOCK_MOUNTER_HPP__
#define __TESTS_MOCK_MOUNTER_HPP__

#include <string>
#include <vector>

#include <gmock/gmock.h>

#include <stout/hashmap.hpp>
#include <stout/nothing.hpp>
#include <stout/try.hpp>

#include "linux/mounter.hpp"

namespace nfscsi {
namespace internal {
namespace tests {

// Definition of a mock mounter to be used in tests with gmock. By
// default all calls operate on an in-memory mount table, so tests only
// set expectations for the calls they want to count or fail.
class MockMounter : public Mounter
{
public:
  struct Mount
  {
    std::string source;
    std::string fsType;
    std::vector<std::string> options;
  };

  MockMounter();
  virtual ~MockMounter();

  MOCK_METHOD1(isMountPoint, Try<bool>(const std::string& target));

  MOCK_METHOD4(mount, Try<Nothing>(
      const std::string& source,
      const std::string& target,
      const std::string& fsType,
      const std::vector<std::string>& options));

  MOCK_METHOD1(unmount, Try<Nothing>(const std::string& target));

  Try<bool> _isMountPoint(const std::string& target);

  Try<Nothing> _mount(
      const std::string& source,
      const std::string& target,
      const std::string& fsType,
      const std::vector<std::string>& options);

  Try<Nothing> _unmount(const std::string& target);

  // Keyed by the normalized target path.
  hashmap<std::string, Mount> mounts;
};

} // namespace tests {
} // namespace internal {
} // namespace nfscsi {

#endif // __TESTS_MOCK_MOUNTER_HPP__
