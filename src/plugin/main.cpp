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

#include <iostream>
#include <string>

#include <glog/logging.h>

#include <nfscsi/version.hpp>

#include <process/owned.hpp>
#include <process/process.hpp>

#include <stout/exit.hpp>
#include <stout/flags.hpp>
#include <stout/foreach.hpp>
#include <stout/net.hpp>
#include <stout/try.hpp>

#include "linux/mounter.hpp"

#include "logging/logging.hpp"

#include "plugin/flags.hpp"
#include "plugin/plugin.hpp"
#include "plugin/server.hpp"

using std::cerr;
using std::cout;
using std::endl;
using std::string;

using process::Owned;

using nfscsi::internal::Mounter;

using nfscsi::internal::plugin::Endpoint;
using nfscsi::internal::plugin::Flags;
using nfscsi::internal::plugin::NfsCsiPlugin;
using nfscsi::internal::plugin::PluginServer;

using nfscsi::internal::plugin::parseEndpoint;


int main(int argc, char** argv)
{
  Flags flags;
  Try<flags::Warnings> load = flags.load("CSI_", argc, argv);

  if (flags.help) {
    cout << flags.usage() << endl;
    return EXIT_SUCCESS;
  }

  if (load.isError()) {
    cerr << flags.usage(load.error()) << endl;
    return EXIT_FAILURE;
  }

  nfscsi::internal::logging::initialize(argv[0], true, flags);

  // Log any flag warnings.
  foreach (const flags::Warning& warning, load->warnings) {
    LOG(WARNING) << warning.message;
  }

  Try<Endpoint> endpoint = parseEndpoint(flags.endpoint);
  if (endpoint.isError()) {
    EXIT(EXIT_FAILURE) << "Invalid '--endpoint': " << endpoint.error();
  }

  string nodeId;
  if (flags.node_id.isSome()) {
    nodeId = flags.node_id.get();
  } else {
    Try<string> hostname = net::hostname();
    if (hostname.isError()) {
      EXIT(EXIT_FAILURE)
        << "Failed to get the hostname, please specify '--node_id': "
        << hostname.error();
    }

    nodeId = hostname.get();
  }

  // Mount helpers are run as libprocess subprocesses.
  process::initialize();

  Try<Mounter*> mounter = Mounter::create();
  if (mounter.isError()) {
    EXIT(EXIT_FAILURE) << "Failed to create mounter: " << mounter.error();
  }

  LOG(INFO) << "Starting NFS CSI plugin " << NFSCSI_VERSION << " as '"
            << flags.driver_name << "' on node '" << nodeId << "'";

  Owned<NfsCsiPlugin> plugin(new NfsCsiPlugin(
      flags.driver_name,
      nodeId,
      Owned<Mounter>(mounter.get())));

  PluginServer server(endpoint.get(), plugin);

  Try<Nothing> start = server.start();
  if (start.isError()) {
    EXIT(EXIT_FAILURE) << "Failed to start the plugin: " << start.error();
  }

  server.wait();

  return EXIT_SUCCESS;
}
