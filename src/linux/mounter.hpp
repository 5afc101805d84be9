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

#ifndef __LINUX_MOUNTER_HPP__
#define __LINUX_MOUNTER_HPP__

#include <string>
#include <vector>

#include <stout/nothing.hpp>
#include <stout/try.hpp>

namespace nfscsi {
namespace internal {

// The mount utilities of the host. The host mount table is the only
// record of what is mounted: implementations must query it on every
// call and never cache mount state.
class Mounter
{
public:
  // Returns the mounter backed by the kernel of this host.
  static Try<Mounter*> create();

  virtual ~Mounter() {}

  // Returns whether `target` is a mount point. Fails if `target` does
  // not exist.
  virtual Try<bool> isMountPoint(const std::string& target) = 0;

  virtual Try<Nothing> mount(
      const std::string& source,
      const std::string& target,
      const std::string& fsType,
      const std::vector<std::string>& options) = 0;

  virtual Try<Nothing> unmount(const std::string& target) = 0;
};


class LinuxMounter : public Mounter
{
public:
  virtual ~LinuxMounter() {}

  Try<bool> isMountPoint(const std::string& target) override;

  Try<Nothing> mount(
      const std::string& source,
      const std::string& target,
      const std::string& fsType,
      const std::vector<std::string>& options) override;

  Try<Nothing> unmount(const std::string& target) override;
};

} // namespace internal {
} // namespace nfscsi {

#endif // __LINUX_MOUNTER_HPP__
