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

#ifndef __PLUGIN_PLUGIN_HPP__
#define __PLUGIN_PLUGIN_HPP__

#include <string>

#include <grpc++/server_context.h>

#include <nfscsi/csi/v1.hpp>

#include <process/owned.hpp>

#include "linux/mounter.hpp"

#include "volume/publisher.hpp"

namespace nfscsi {
namespace internal {
namespace plugin {

// The CSI v1 Identity, Controller and Node services of the NFS plugin.
// Only the calls the plugin supports are overridden; every other call is
// answered with `UNIMPLEMENTED` by the generated service base classes.
class NfsCsiPlugin : public csi::v1::Identity::Service,
                     public csi::v1::Controller::Service,
                     public csi::v1::Node::Service
{
public:
  NfsCsiPlugin(
      const std::string& driverName,
      const std::string& nodeId,
      const process::Owned<Mounter>& mounter);

  // Identity RPCs.

  grpc::Status GetPluginInfo(
      grpc::ServerContext* context,
      const csi::v1::GetPluginInfoRequest* request,
      csi::v1::GetPluginInfoResponse* response) override;

  grpc::Status GetPluginCapabilities(
      grpc::ServerContext* context,
      const csi::v1::GetPluginCapabilitiesRequest* request,
      csi::v1::GetPluginCapabilitiesResponse* response) override;

  grpc::Status Probe(
      grpc::ServerContext* context,
      const csi::v1::ProbeRequest* request,
      csi::v1::ProbeResponse* response) override;

  // Controller RPCs.

  // Checks the parameters of a new volume and hands them back as the
  // volume context. No storage is allocated on the NFS server.
  grpc::Status CreateVolume(
      grpc::ServerContext* context,
      const csi::v1::CreateVolumeRequest* request,
      csi::v1::CreateVolumeResponse* response) override;

  // Never touches the data on the NFS server.
  grpc::Status DeleteVolume(
      grpc::ServerContext* context,
      const csi::v1::DeleteVolumeRequest* request,
      csi::v1::DeleteVolumeResponse* response) override;

  grpc::Status ValidateVolumeCapabilities(
      grpc::ServerContext* context,
      const csi::v1::ValidateVolumeCapabilitiesRequest* request,
      csi::v1::ValidateVolumeCapabilitiesResponse* response) override;

  grpc::Status ControllerGetCapabilities(
      grpc::ServerContext* context,
      const csi::v1::ControllerGetCapabilitiesRequest* request,
      csi::v1::ControllerGetCapabilitiesResponse* response) override;

  // Node RPCs.

  grpc::Status NodePublishVolume(
      grpc::ServerContext* context,
      const csi::v1::NodePublishVolumeRequest* request,
      csi::v1::NodePublishVolumeResponse* response) override;

  grpc::Status NodeUnpublishVolume(
      grpc::ServerContext* context,
      const csi::v1::NodeUnpublishVolumeRequest* request,
      csi::v1::NodeUnpublishVolumeResponse* response) override;

  grpc::Status NodeGetCapabilities(
      grpc::ServerContext* context,
      const csi::v1::NodeGetCapabilitiesRequest* request,
      csi::v1::NodeGetCapabilitiesResponse* response) override;

  grpc::Status NodeGetInfo(
      grpc::ServerContext* context,
      const csi::v1::NodeGetInfoRequest* request,
      csi::v1::NodeGetInfoResponse* response) override;

private:
  const std::string driverName;
  const std::string nodeId;

  volume::VolumePublisher publisher;
};

} // namespace plugin {
} // namespace internal {
} // namespace nfscsi {

#endif // __PLUGIN_PLUGIN_HPP__
