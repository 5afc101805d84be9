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

#ifndef __PLUGIN_FLAGS_HPP__
#define __PLUGIN_FLAGS_HPP__

#include <string>

#include <stout/flags.hpp>
#include <stout/option.hpp>

#include "logging/flags.hpp"

namespace nfscsi {
namespace internal {
namespace plugin {

constexpr char DEFAULT_ENDPOINT[] = "unix:///csi/csi.sock";
constexpr char DEFAULT_DRIVER_NAME[] = "nfs.csi.example.com";


class Flags : public virtual logging::Flags
{
public:
  Flags()
  {
    add(&Flags::endpoint,
        "endpoint",
        "Endpoint the plugin serves the CSI services on, either\n"
        "'unix://<path>' for a Unix domain socket or\n"
        "'tcp://<host>:<port>'.",
        DEFAULT_ENDPOINT);

    add(&Flags::node_id,
        "node_id",
        "Identifier of this node reported by 'NodeGetInfo'.\n"
        "Defaults to the hostname.");

    add(&Flags::driver_name,
        "driver_name",
        "Name of the plugin reported by 'GetPluginInfo'.",
        DEFAULT_DRIVER_NAME);
  }

  std::string endpoint;
  Option<std::string> node_id;
  std::string driver_name;
};

} // namespace plugin {
} // namespace internal {
} // namespace nfscsi {

#endif // __PLUGIN_FLAGS_HPP__
