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

#ifndef __PLUGIN_SERVER_HPP__
#define __PLUGIN_SERVER_HPP__

#include <memory>
#include <mutex>
#include <ostream>
#include <string>

#include <grpc++/server.h>

#include <process/owned.hpp>

#include <stout/nothing.hpp>
#include <stout/try.hpp>

#include "plugin/plugin.hpp"

namespace nfscsi {
namespace internal {
namespace plugin {

constexpr char UNIX_SCHEME[] = "unix://";
constexpr char TCP_SCHEME[] = "tcp://";


// The location the CSI services are served on.
struct Endpoint
{
  enum Type
  {
    UNIX,
    TCP
  };

  Type type;

  // The socket path for `UNIX`, `host:port` for `TCP`.
  std::string address;

  // Returns the address in the form understood by gRPC.
  std::string grpcAddress() const;
};


std::ostream& operator<<(std::ostream& stream, const Endpoint& endpoint);


// Parses `unix://<absolute path>` or `tcp://<host>:<port>`.
Try<Endpoint> parseEndpoint(const std::string& endpoint);


// Serves a plugin over gRPC on an endpoint. A stale socket left behind
// by a previous run is removed before binding to a Unix endpoint.
class PluginServer
{
public:
  PluginServer(
      const Endpoint& endpoint,
      const process::Owned<NfsCsiPlugin>& plugin);

  ~PluginServer();

  Try<Nothing> start();

  // Blocks until the server is stopped. Returns immediately if the
  // server has not been started.
  void wait();

  void stop();

private:
  const Endpoint endpoint;
  process::Owned<NfsCsiPlugin> plugin;

  std::mutex mutex;
  std::unique_ptr<grpc::Server> server;
  bool stopped;
};

} // namespace plugin {
} // namespace internal {
} // namespace nfscsi {

#endif // __PLUGIN_SERVER_HPP__
