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

#include "plugin/plugin.hpp"

#include <glog/logging.h>

#include <nfscsi/version.hpp>

#include <process/grpc.hpp>

#include <stout/foreach.hpp>
#include <stout/hashmap.hpp>
#include <stout/nothing.hpp>
#include <stout/option.hpp>
#include <stout/try.hpp>

#include "csi/utils.hpp"

#include "volume/capability.hpp"
#include "volume/source.hpp"

using std::string;

using grpc::ServerContext;
using grpc::Status;

using process::Owned;

using process::grpc::StatusError;

namespace nfscsi {
namespace internal {
namespace plugin {

using csi::toParameters;
using csi::toVolumeContext;

using volume::MountSource;
using volume::PARAM_SERVER;
using volume::PARAM_SHARE;
using volume::PARAM_SUBPATH;

namespace v1 = csi::v1;


template <typename Request>
static inline void log(const Request& request)
{
  LOG(INFO) << request.GetDescriptor()->name() << " '" << request << "'";
}


// Logs a failed call and returns its status to the caller.
template <typename Request>
static inline Status fail(const Request& request, const Status& status)
{
  LOG(ERROR) << request.GetDescriptor()->name() << " failed: "
             << status.error_message();

  return status;
}


static inline Option<v1::VolumeCapability> getCapability(
    const v1::NodePublishVolumeRequest& request)
{
  if (!request.has_volume_capability()) {
    return None();
  }

  return request.volume_capability();
}


NfsCsiPlugin::NfsCsiPlugin(
    const string& _driverName,
    const string& _nodeId,
    const Owned<Mounter>& mounter)
  : driverName(_driverName),
    nodeId(_nodeId),
    publisher(mounter)
{
  LOG(INFO) << "Created NFS CSI plugin '" << driverName << "' on node '"
            << nodeId << "'";
}


Status NfsCsiPlugin::GetPluginInfo(
    ServerContext* context,
    const v1::GetPluginInfoRequest* request,
    v1::GetPluginInfoResponse* response)
{
  log(*request);

  response->set_name(driverName);
  response->set_vendor_version(NFSCSI_VERSION);

  return Status::OK;
}


Status NfsCsiPlugin::GetPluginCapabilities(
    ServerContext* context,
    const v1::GetPluginCapabilitiesRequest* request,
    v1::GetPluginCapabilitiesResponse* response)
{
  log(*request);

  response->add_capabilities()->mutable_service()->set_type(
      v1::PluginCapability::Service::CONTROLLER_SERVICE);

  return Status::OK;
}


Status NfsCsiPlugin::Probe(
    ServerContext* context,
    const v1::ProbeRequest* request,
    v1::ProbeResponse* response)
{
  log(*request);

  response->mutable_ready()->set_value(true);

  return Status::OK;
}


Status NfsCsiPlugin::CreateVolume(
    ServerContext* context,
    const v1::CreateVolumeRequest* request,
    v1::CreateVolumeResponse* response)
{
  log(*request);

  if (request->name().empty()) {
    return fail(
        *request, Status(grpc::INVALID_ARGUMENT, "Volume name is required"));
  }

  if (request->volume_capabilities().empty()) {
    return fail(
        *request,
        Status(grpc::INVALID_ARGUMENT, "Volume capabilities are required"));
  }

  foreach (const v1::VolumeCapability& capability,
           request->volume_capabilities()) {
    Option<Error> error = volume::validateVolumeCapability(capability);
    if (error.isSome()) {
      return fail(*request, Status(grpc::INVALID_ARGUMENT, error->message));
    }
  }

  const hashmap<string, string> parameters =
    toParameters(request->parameters());

  // The resolved source is not kept: it is resolved again from the volume
  // context when the volume is published.
  Try<MountSource> source = volume::resolveMountSource(parameters);
  if (source.isError()) {
    return fail(*request, Status(grpc::INVALID_ARGUMENT, source.error()));
  }

  const string subPath = volume::getSubPath(parameters);

  hashmap<string, string> volumeContext;
  volumeContext[PARAM_SERVER] = parameters.at(PARAM_SERVER);
  volumeContext[PARAM_SHARE] = parameters.at(PARAM_SHARE);

  if (!subPath.empty()) {
    volumeContext[PARAM_SUBPATH] = subPath;
  }

  VLOG(1) << "Created volume '" << request->name() << "' backed by NFS '"
          << source.get() << "'";

  v1::Volume* volume = response->mutable_volume();
  volume->set_volume_id(request->name());
  *volume->mutable_volume_context() = toVolumeContext(volumeContext);

  return Status::OK;
}


Status NfsCsiPlugin::DeleteVolume(
    ServerContext* context,
    const v1::DeleteVolumeRequest* request,
    v1::DeleteVolumeResponse* response)
{
  log(*request);

  if (request->volume_id().empty()) {
    return fail(
        *request, Status(grpc::INVALID_ARGUMENT, "Volume ID is required"));
  }

  VLOG(1) << "Deleted volume '" << request->volume_id()
          << "', the data on the NFS server is left untouched";

  return Status::OK;
}


Status NfsCsiPlugin::ValidateVolumeCapabilities(
    ServerContext* context,
    const v1::ValidateVolumeCapabilitiesRequest* request,
    v1::ValidateVolumeCapabilitiesResponse* response)
{
  log(*request);

  if (request->volume_id().empty()) {
    return fail(
        *request, Status(grpc::INVALID_ARGUMENT, "Volume ID is required"));
  }

  if (request->volume_capabilities().empty()) {
    return fail(
        *request,
        Status(grpc::INVALID_ARGUMENT, "Volume capabilities are required"));
  }

  foreach (const v1::VolumeCapability& capability,
           request->volume_capabilities()) {
    Option<Error> error = volume::validateVolumeCapability(capability);
    if (error.isSome()) {
      // An unsupported capability is a normal answer, not a failure.
      response->set_message(error->message);
      return Status::OK;
    }
  }

  *response->mutable_confirmed()->mutable_volume_capabilities() =
    request->volume_capabilities();

  return Status::OK;
}


Status NfsCsiPlugin::ControllerGetCapabilities(
    ServerContext* context,
    const v1::ControllerGetCapabilitiesRequest* request,
    v1::ControllerGetCapabilitiesResponse* response)
{
  log(*request);

  response->add_capabilities()->mutable_rpc()->set_type(
      v1::ControllerServiceCapability::RPC::CREATE_DELETE_VOLUME);

  return Status::OK;
}


Status NfsCsiPlugin::NodePublishVolume(
    ServerContext* context,
    const v1::NodePublishVolumeRequest* request,
    v1::NodePublishVolumeResponse* response)
{
  log(*request);

  Try<Nothing, StatusError> publish = publisher.publish(
      request->volume_id(),
      request->target_path(),
      getCapability(*request),
      toParameters(request->volume_context()),
      request->readonly());

  if (publish.isError()) {
    return fail(*request, publish.error().status);
  }

  return Status::OK;
}


Status NfsCsiPlugin::NodeUnpublishVolume(
    ServerContext* context,
    const v1::NodeUnpublishVolumeRequest* request,
    v1::NodeUnpublishVolumeResponse* response)
{
  log(*request);

  Try<Nothing, StatusError> unpublish =
    publisher.unpublish(request->volume_id(), request->target_path());

  if (unpublish.isError()) {
    return fail(*request, unpublish.error().status);
  }

  return Status::OK;
}


Status NfsCsiPlugin::NodeGetCapabilities(
    ServerContext* context,
    const v1::NodeGetCapabilitiesRequest* request,
    v1::NodeGetCapabilitiesResponse* response)
{
  log(*request);

  // Neither staging nor volume stats are supported.
  return Status::OK;
}


Status NfsCsiPlugin::NodeGetInfo(
    ServerContext* context,
    const v1::NodeGetInfoRequest* request,
    v1::NodeGetInfoResponse* response)
{
  log(*request);

  response->set_node_id(nodeId);

  return Status::OK;
}

} // namespace plugin {
} // namespace internal {
} // namespace nfscsi {
