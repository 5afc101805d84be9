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

#ifndef __VOLUME_SOURCE_HPP__
#define __VOLUME_SOURCE_HPP__

#include <ostream>
#include <string>

#include <stout/error.hpp>
#include <stout/hashmap.hpp>
#include <stout/option.hpp>
#include <stout/try.hpp>

namespace nfscsi {
namespace internal {
namespace volume {

// Keys recognized in the StorageClass parameters and in the volume
// context of a PersistentVolume.
constexpr char PARAM_SERVER[] = "server";
constexpr char PARAM_SHARE[] = "share";
constexpr char PARAM_SUBPATH[] = "subPath";

// The external provisioner (run with `--extra-create-metadata`) passes
// the annotations of the claim under this key as a JSON object.
constexpr char PVC_ANNOTATIONS_KEY[] = "csi.storage.k8s.io/pvc/annotations";

// Claim annotation that selects a sub-directory of the share.
constexpr char ANNOTATION_SUBPATH[] = "nfs.csi.example.com/subPath";

constexpr size_t MAX_SUBPATH_LENGTH = 4096;


// The remote location of an NFS volume, i.e., what `mount -t nfs`
// expects as its source once joined with a colon.
struct MountSource
{
  std::string server;
  std::string path;
};


std::ostream& operator<<(std::ostream& stream, const MountSource& source);


// Lexically normalizes a slash separated path: repeated separators are
// collapsed, `.` segments are dropped and `..` segments remove their
// parent. A `..` that cannot be resolved is kept in a relative path and
// dropped at the root of an absolute one. Never touches the filesystem.
std::string normalize(const std::string& path);


// Checks that a sub-path cannot be used to escape from the share it is
// appended to. The sub-path may come from a claim annotation, which is
// written by users that are less trusted than the author of the
// StorageClass, so anything that changes meaning after normalization is
// rejected. The empty sub-path is valid.
Option<Error> validateSubPath(const std::string& subPath);


// Extracts the sub-path annotation from the JSON encoded annotations of
// a claim. A blob that cannot be parsed or lacks the annotation yields
// None(): claims are not required to carry annotations at all.
Option<std::string> parseAnnotationSubPath(const std::string& annotations);


// Returns the sub-path for a volume. An explicit `subPath` parameter
// takes priority over the claim annotation. Returns the empty string if
// neither is set.
std::string getSubPath(const hashmap<std::string, std::string>& parameters);


// Resolves the NFS server and the path on that server to mount from the
// parameters of a volume. The share gets a leading slash if it lacks
// one, and a validated sub-path is appended to it.
Try<MountSource> resolveMountSource(
    const hashmap<std::string, std::string>& parameters);

} // namespace volume {
} // namespace internal {
} // namespace nfscsi {

#endif // __VOLUME_SOURCE_HPP__
