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

#include "volume/source.hpp"

#include <vector>

#include <glog/logging.h>

#include <stout/foreach.hpp>
#include <stout/json.hpp>
#include <stout/stringify.hpp>
#include <stout/strings.hpp>

using std::ostream;
using std::string;
using std::vector;

namespace nfscsi {
namespace internal {
namespace volume {

ostream& operator<<(ostream& stream, const MountSource& source)
{
  return stream << source.server << ":" << source.path;
}


string normalize(const string& path)
{
  if (path.empty()) {
    return ".";
  }

  const bool absolute = path[0] == '/';

  vector<string> segments;
  foreach (const string& segment, strings::tokenize(path, "/")) {
    if (segment == ".") {
      continue;
    }

    if (segment == "..") {
      if (!segments.empty() && segments.back() != "..") {
        segments.pop_back();
      } else if (!absolute) {
        segments.push_back(segment);
      }

      continue;
    }

    segments.push_back(segment);
  }

  const string normalized = strings::join("/", segments);

  if (absolute) {
    return "/" + normalized;
  }

  return normalized.empty() ? "." : normalized;
}


Option<Error> validateSubPath(const string& subPath)
{
  if (subPath.empty()) {
    return None();
  }

  if (subPath.size() > MAX_SUBPATH_LENGTH) {
    return Error(
        "subPath exceeds maximum length of " +
        stringify(MAX_SUBPATH_LENGTH) + " characters");
  }

  const string cleaned =
    strings::remove(normalize(subPath), "/", strings::PREFIX);

  // Any `..` left after normalization climbs out of the share.
  if (strings::startsWith(cleaned, "..") ||
      strings::contains(cleaned, "/..")) {
    return Error("subPath contains path traversal attempt: " + subPath);
  }

  // Normalization must not change the path beyond its leading and
  // trailing separators, otherwise it carries `.`, `..` or empty
  // segments that we refuse to interpret.
  const string original = strings::trim(
      strings::remove(subPath, "/", strings::PREFIX), strings::ANY, "/");

  const string normalized = strings::trim(cleaned, strings::ANY, "/");

  if (!original.empty() &&
      original != normalized &&
      !(original == "." && normalized.empty())) {
    return Error("subPath contains invalid path components: " + subPath);
  }

  if (subPath.find('\0') != string::npos) {
    return Error("subPath contains null byte");
  }

  return None();
}


Option<string> parseAnnotationSubPath(const string& annotations)
{
  Try<JSON::Object> json = JSON::parse<JSON::Object>(annotations);
  if (json.isError()) {
    VLOG(1) << "Failed to parse claim annotations: " << json.error();
    return None();
  }

  auto it = json->values.find(ANNOTATION_SUBPATH);
  if (it == json->values.end()) {
    return None();
  }

  if (!it->second.is<JSON::String>()) {
    VLOG(1) << "Ignoring annotation '" << ANNOTATION_SUBPATH
            << "' with a non-string value";
    return None();
  }

  return it->second.as<JSON::String>().value;
}


string getSubPath(const hashmap<string, string>& parameters)
{
  const Option<string> subPath = parameters.get(PARAM_SUBPATH);
  if (subPath.isSome() && !subPath->empty()) {
    return subPath.get();
  }

  const Option<string> annotations = parameters.get(PVC_ANNOTATIONS_KEY);
  if (annotations.isSome() && !annotations->empty()) {
    const Option<string> annotated = parseAnnotationSubPath(annotations.get());
    if (annotated.isSome()) {
      return annotated.get();
    }
  }

  return "";
}


Try<MountSource> resolveMountSource(const hashmap<string, string>& parameters)
{
  const Option<string> server = parameters.get(PARAM_SERVER);
  if (server.isNone() || server->empty()) {
    return Error("server parameter is required");
  }

  const Option<string> share = parameters.get(PARAM_SHARE);
  if (share.isNone() || share->empty()) {
    return Error("share parameter is required");
  }

  string path = share.get();
  if (!strings::startsWith(path, "/")) {
    path = "/" + path;
  }

  const string subPath = getSubPath(parameters);
  if (!subPath.empty()) {
    Option<Error> error = validateSubPath(subPath);
    if (error.isSome()) {
      return Error("invalid subPath: " + error->message);
    }

    path = strings::remove(path, "/", strings::SUFFIX) + "/" +
           strings::remove(subPath, "/", strings::PREFIX);

    VLOG(1) << "Combined NFS path '" << server.get() << ":" << path
            << "' from share '" << share.get() << "' and subPath '"
            << subPath << "'";
  }

  return MountSource{server.get(), path};
}

} // namespace volume {
} // namespace internal {
} // namespace nfscsi {
