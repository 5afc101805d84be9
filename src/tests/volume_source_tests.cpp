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

#include <string>

#include <gtest/gtest.h>

#include <stout/error.hpp>
#include <stout/foreach.hpp>
#include <stout/gtest.hpp>
#include <stout/hashmap.hpp>
#include <stout/option.hpp>
#include <stout/stringify.hpp>
#include <stout/try.hpp>

#include "volume/source.hpp"

using std::string;

namespace nfscsi {
namespace internal {
namespace tests {

using volume::ANNOTATION_SUBPATH;
using volume::MAX_SUBPATH_LENGTH;
using volume::MountSource;
using volume::PARAM_SERVER;
using volume::PARAM_SHARE;
using volume::PARAM_SUBPATH;
using volume::PVC_ANNOTATIONS_KEY;

using volume::getSubPath;
using volume::normalize;
using volume::parseAnnotationSubPath;
using volume::resolveMountSource;
using volume::validateSubPath;


TEST(VolumeSourceTest, Normalize)
{
  EXPECT_EQ(".", normalize(""));
  EXPECT_EQ(".", normalize("."));
  EXPECT_EQ("/", normalize("/"));
  EXPECT_EQ("/", normalize("/.."));
  EXPECT_EQ("a/b", normalize("a//b/"));
  EXPECT_EQ("b", normalize("a/../b"));
  EXPECT_EQ("../b", normalize("a/../../b"));
  EXPECT_EQ("/etc", normalize("/../etc"));
  EXPECT_EQ("/a/c", normalize("/a/./b/../c"));
}


TEST(VolumeSourceTest, ValidSubPath)
{
  EXPECT_NONE(validateSubPath(""));
  EXPECT_NONE(validateSubPath("app"));
  EXPECT_NONE(validateSubPath("team/app"));
  EXPECT_NONE(validateSubPath("/team/app"));
  EXPECT_NONE(validateSubPath("team/app/"));
  EXPECT_NONE(validateSubPath("."));
  EXPECT_NONE(validateSubPath("app..v2"));
  EXPECT_NONE(validateSubPath(string(MAX_SUBPATH_LENGTH, 'a')));
}


TEST(VolumeSourceTest, SubPathTraversal)
{
  const string subPaths[] = {
    "..",
    "../etc",
    "../../etc/passwd",
    "team/../../etc",
    "team/../.."
  };

  foreach (const string& subPath, subPaths) {
    Option<Error> error = validateSubPath(subPath);
    ASSERT_SOME(error) << subPath;
    EXPECT_EQ(
        "subPath contains path traversal attempt: " + subPath,
        error->message);
  }
}


TEST(VolumeSourceTest, SubPathInvalidComponents)
{
  const string subPaths[] = {
    "team/../app",
    "team/./app",
    "team//app",
    "/../etc",
    "/../../etc",
    "./app"
  };

  foreach (const string& subPath, subPaths) {
    Option<Error> error = validateSubPath(subPath);
    ASSERT_SOME(error) << subPath;
    EXPECT_EQ(
        "subPath contains invalid path components: " + subPath,
        error->message);
  }
}


TEST(VolumeSourceTest, SubPathTooLong)
{
  Option<Error> error = validateSubPath(string(MAX_SUBPATH_LENGTH + 1, 'a'));

  ASSERT_SOME(error);
  EXPECT_EQ(
      "subPath exceeds maximum length of " + stringify(MAX_SUBPATH_LENGTH) +
      " characters",
      error->message);
}


TEST(VolumeSourceTest, SubPathNullByte)
{
  Option<Error> error = validateSubPath(string("app\0data", 8));

  ASSERT_SOME(error);
  EXPECT_EQ("subPath contains null byte", error->message);
}


TEST(VolumeSourceTest, ParseAnnotationSubPath)
{
  EXPECT_SOME_EQ(
      "music",
      parseAnnotationSubPath(
          "{\"" + string(ANNOTATION_SUBPATH) + "\": \"music\"}"));

  EXPECT_SOME_EQ(
      "",
      parseAnnotationSubPath(
          "{\"" + string(ANNOTATION_SUBPATH) + "\": \"\"}"));

  EXPECT_NONE(parseAnnotationSubPath("{}"));
  EXPECT_NONE(parseAnnotationSubPath("{\"other/annotation\": \"music\"}"));
  EXPECT_NONE(parseAnnotationSubPath("not json"));
  EXPECT_NONE(parseAnnotationSubPath("[\"music\"]"));

  EXPECT_NONE(parseAnnotationSubPath(
      "{\"" + string(ANNOTATION_SUBPATH) + "\": 42}"));
}


TEST(VolumeSourceTest, SubPathPriority)
{
  hashmap<string, string> parameters;
  EXPECT_EQ("", getSubPath(parameters));

  parameters[PVC_ANNOTATIONS_KEY] =
    "{\"" + string(ANNOTATION_SUBPATH) + "\": \"music\"}";

  EXPECT_EQ("music", getSubPath(parameters));

  parameters[PARAM_SUBPATH] = "priority-path";
  EXPECT_EQ("priority-path", getSubPath(parameters));

  // An empty parameter does not hide the annotation.
  parameters[PARAM_SUBPATH] = "";
  EXPECT_EQ("music", getSubPath(parameters));

  parameters[PVC_ANNOTATIONS_KEY] = "garbage";
  EXPECT_EQ("", getSubPath(parameters));
}


TEST(VolumeSourceTest, ResolveMountSource)
{
  hashmap<string, string> parameters;
  parameters[PARAM_SERVER] = "nfs.example.com";
  parameters[PARAM_SHARE] = "/exports/data";

  Try<MountSource> source = resolveMountSource(parameters);
  ASSERT_SOME(source);
  EXPECT_EQ("nfs.example.com", source->server);
  EXPECT_EQ("/exports/data", source->path);
  EXPECT_EQ("nfs.example.com:/exports/data", stringify(source.get()));

  // A share without a leading slash gets one.
  parameters[PARAM_SHARE] = "exports/data";

  source = resolveMountSource(parameters);
  ASSERT_SOME(source);
  EXPECT_EQ("/exports/data", source->path);
}


TEST(VolumeSourceTest, ResolveMountSourceWithSubPath)
{
  hashmap<string, string> parameters;
  parameters[PARAM_SERVER] = "10.0.0.1";
  parameters[PARAM_SHARE] = "/data";
  parameters[PARAM_SUBPATH] = "app1";

  Try<MountSource> source = resolveMountSource(parameters);
  ASSERT_SOME(source);
  EXPECT_EQ("/data/app1", source->path);

  parameters[PARAM_SUBPATH] = "/app2";

  source = resolveMountSource(parameters);
  ASSERT_SOME(source);
  EXPECT_EQ("/data/app2", source->path);

  parameters[PARAM_SHARE] = "/data/";
  parameters[PARAM_SUBPATH] = "app3";

  source = resolveMountSource(parameters);
  ASSERT_SOME(source);
  EXPECT_EQ("/data/app3", source->path);

  parameters.erase(PARAM_SUBPATH);
  parameters[PVC_ANNOTATIONS_KEY] =
    "{\"" + string(ANNOTATION_SUBPATH) + "\": \"music\"}";

  source = resolveMountSource(parameters);
  ASSERT_SOME(source);
  EXPECT_EQ("/data/music", source->path);
}


TEST(VolumeSourceTest, ResolveMountSourceErrors)
{
  hashmap<string, string> parameters;

  Try<MountSource> source = resolveMountSource(parameters);
  ASSERT_ERROR(source);
  EXPECT_EQ("server parameter is required", source.error());

  parameters[PARAM_SERVER] = "10.0.0.1";

  source = resolveMountSource(parameters);
  ASSERT_ERROR(source);
  EXPECT_EQ("share parameter is required", source.error());

  parameters[PARAM_SHARE] = "";

  source = resolveMountSource(parameters);
  ASSERT_ERROR(source);
  EXPECT_EQ("share parameter is required", source.error());

  parameters[PARAM_SHARE] = "/data";
  parameters[PARAM_SUBPATH] = "../../etc/passwd";

  source = resolveMountSource(parameters);
  ASSERT_ERROR(source);
  EXPECT_EQ(
      "invalid subPath: subPath contains path traversal attempt: "
      "../../etc/passwd",
      source.error());

  // A traversal through the annotation is rejected the same way.
  parameters.erase(PARAM_SUBPATH);
  parameters[PVC_ANNOTATIONS_KEY] =
    "{\"" + string(ANNOTATION_SUBPATH) + "\": \"../secrets\"}";

  source = resolveMountSource(parameters);
  ASSERT_ERROR(source);
  EXPECT_EQ(
      "invalid subPath: subPath contains path traversal attempt: ../secrets",
      source.error());
}

} // namespace tests {
} // namespace internal {
} // namespace nfscsi {
