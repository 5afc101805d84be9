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

#include "plugin/server.hpp"

#include <glog/logging.h>

#include <grpc++/server_builder.h>
#include <grpc++/security/server_credentials.h>

#include <stout/error.hpp>
#include <stout/os.hpp>
#include <stout/path.hpp>
#include <stout/stringify.hpp>
#include <stout/strings.hpp>
#include <stout/synchronized.hpp>
#include <stout/unreachable.hpp>

using std::string;

using grpc::InsecureServerCredentials;
using grpc::ServerBuilder;

using process::Owned;

namespace nfscsi {
namespace internal {
namespace plugin {

string Endpoint::grpcAddress() const
{
  switch (type) {
    case UNIX: return "unix:" + address;
    case TCP: return address;
  }

  UNREACHABLE();
}


std::ostream& operator<<(std::ostream& stream, const Endpoint& endpoint)
{
  switch (endpoint.type) {
    case Endpoint::UNIX: return stream << UNIX_SCHEME << endpoint.address;
    case Endpoint::TCP: return stream << TCP_SCHEME << endpoint.address;
  }

  UNREACHABLE();
}


Try<Endpoint> parseEndpoint(const string& endpoint)
{
  Endpoint result;

  if (strings::startsWith(endpoint, UNIX_SCHEME)) {
    result.type = Endpoint::UNIX;
    result.address = strings::remove(endpoint, UNIX_SCHEME, strings::PREFIX);

    if (!path::absolute(result.address)) {
      return Error(
          "Expecting an absolute socket path in endpoint '" + endpoint + "'");
    }
  } else if (strings::startsWith(endpoint, TCP_SCHEME)) {
    result.type = Endpoint::TCP;
    result.address = strings::remove(endpoint, TCP_SCHEME, strings::PREFIX);

    if (result.address.empty() ||
        result.address.find('/') != string::npos) {
      return Error(
          "Expecting '<host>:<port>' in endpoint '" + endpoint + "'");
    }
  } else {
    return Error(
        "Unsupported endpoint '" + endpoint + "', expecting '" +
        UNIX_SCHEME + "<path>' or '" + TCP_SCHEME + "<host>:<port>'");
  }

  return result;
}


PluginServer::PluginServer(
    const Endpoint& _endpoint,
    const Owned<NfsCsiPlugin>& _plugin)
  : endpoint(_endpoint),
    plugin(_plugin),
    stopped(false) {}


PluginServer::~PluginServer()
{
  stop();
}


Try<Nothing> PluginServer::start()
{
  synchronized (mutex) {
    if (server) {
      return Error("Server is already started");
    }

    if (stopped) {
      return Error("Server has been stopped");
    }

    if (endpoint.type == Endpoint::UNIX && os::exists(endpoint.address)) {
      VLOG(1) << "Removing stale socket '" << endpoint.address << "'";

      Try<Nothing> rm = os::rm(endpoint.address);
      if (rm.isError()) {
        return Error(
            "Failed to remove stale socket '" + endpoint.address + "': " +
            rm.error());
      }
    }

    ServerBuilder builder;
    builder.AddListeningPort(
        endpoint.grpcAddress(), InsecureServerCredentials());
    builder.RegisterService(
        static_cast<csi::v1::Identity::Service*>(plugin.get()));
    builder.RegisterService(
        static_cast<csi::v1::Controller::Service*>(plugin.get()));
    builder.RegisterService(
        static_cast<csi::v1::Node::Service*>(plugin.get()));

    server = builder.BuildAndStart();
    if (!server) {
      return Error("Failed to listen on '" + stringify(endpoint) + "'");
    }
  }

  LOG(INFO) << "Listening on '" << endpoint << "'";

  return Nothing();
}


void PluginServer::wait()
{
  grpc::Server* _server = nullptr;

  synchronized (mutex) {
    _server = server.get();
  }

  // The server is only released on destruction, so it outlives this call.
  if (_server != nullptr) {
    _server->Wait();
  }
}


void PluginServer::stop()
{
  synchronized (mutex) {
    if (stopped) {
      return;
    }

    stopped = true;

    if (server) {
      LOG(INFO) << "Stopping the server on '" << endpoint << "'";
      server->Shutdown();
    }
  }
}

} // namespace plugin {
} // namespace internal {
} // namespace nfscsi {
