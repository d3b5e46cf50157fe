#include "desc/DepsDesc.hpp"
#include "support.hpp"

using namespace nativeBuild;
using namespace nativeBuild::test;

namespace {
json::object object(const char *text) { return json::parse(text).as_object(); }
}  // namespace

TEST(DepsDescTest, ProjectOnlyPaths) {
  DescriptorSet set{.project = object(R"({"paths": ["src"]})")};
  const auto config = mergeDescriptors(set);
  EXPECT_EQ(config.paths, std::vector<std::string>{"src"});
}

TEST(DepsDescTest, ProjectPathsWinOverInstallAndUser) {
  DescriptorSet set{
      .install = object(R"({"paths": ["base"], "compilePath": "out"})"),
      .user = object(R"({"paths": ["user"]})"),
      .project = object(R"({"paths": ["src"]})"),
  };
  const auto config = mergeDescriptors(set);
  EXPECT_EQ(config.paths, std::vector<std::string>{"src"});
  EXPECT_EQ(config.compilePath, "out");
}

TEST(DepsDescTest, NoDescriptorThrows) {
  EXPECT_THROW(mergeDescriptors(DescriptorSet{}), ConfigNotFound);
}

TEST(DepsDescTest, DefaultsWhenKeysAreMissing) {
  const auto config = mergeDescriptors({.user = object("{}")});
  EXPECT_TRUE(config.paths.empty());
  EXPECT_EQ(config.compilePath, "classes");
  EXPECT_EQ(config.compiler.command, "java");
  EXPECT_FALSE(config.compiler.args.empty());
}

TEST(DepsDescTest, NestedObjectsMergeKeyWise) {
  DescriptorSet set{
      .install = object(
          R"({"compiler": {"command": "java", "args": ["-e", "{unit}"]}})"),
      .project = object(R"({"compiler": {"command": "/opt/jdk/bin/java"}})"),
  };
  const auto config = mergeDescriptors(set);
  EXPECT_EQ(config.compiler.command, "/opt/jdk/bin/java");
  EXPECT_EQ(config.compiler.args, (std::vector<std::string>{"-e", "{unit}"}));
}

TEST(DepsDescTest, ArraysAreReplacedNotConcatenated) {
  const auto merged = mergeObjects(object(R"({"paths": ["a", "b"]})"),
                                   object(R"({"paths": ["c"]})"));
  EXPECT_EQ(merged.at("paths").as_array().size(), 1u);
}

TEST(DepsDescTest, MistypedValueKeepsDefault) {
  const auto config =
      mergeDescriptors({.project = object(R"({"compilePath": 42})")});
  EXPECT_EQ(config.compilePath, "classes");
}

class DescriptorSourceTest : public TempDirTest {};

TEST_F(DescriptorSourceTest, ReadsAllThreeLayers) {
  write("install/deps.json", R"({"compilePath": "install-classes"})");
  write("user/deps.json", R"({"paths": ["user-src"]})");
  write("project/deps.json", R"({"paths": ["src"]})");
  FileDescriptorSource source(
      {dir / "install/deps.json", dir / "user/deps.json",
       dir / "project/deps.json"});
  const auto config = mergeDescriptors(source.read());
  EXPECT_EQ(config.paths, std::vector<std::string>{"src"});
  EXPECT_EQ(config.compilePath, "install-classes");
}

TEST_F(DescriptorSourceTest, MissingFilesAreAbsentLayers) {
  FileDescriptorSource source(
      {dir / "none/deps.json", dir / "none/deps.json", dir / "deps.json"});
  const auto set = source.read();
  EXPECT_FALSE(set.install);
  EXPECT_FALSE(set.user);
  EXPECT_FALSE(set.project);
  EXPECT_THROW(mergeDescriptors(set), ConfigNotFound);
}

TEST_F(DescriptorSourceTest, MalformedDescriptorThrows) {
  const auto broken = write("deps.json", "{\"paths\": [");
  EXPECT_THROW(FileDescriptorSource::readDescriptor(broken),
               InvalidDescriptor);
  const auto array = write("array/deps.json", "[1, 2]");
  EXPECT_THROW(FileDescriptorSource::readDescriptor(array), InvalidDescriptor);
}

TEST(DescriptorLocationsTest, FollowsEnvironment) {
  MapEnvironment env({{"NATIVE_BUILD_HOME", "/opt/nb"},
                      {"XDG_CONFIG_HOME", "/home/u/.config"},
                      {"HOME", "/home/u"}});
  const auto locations = DescriptorLocations::resolve(env, "/work/app");
  EXPECT_EQ(locations.install, Path("/opt/nb/deps.json"));
  EXPECT_EQ(locations.user, Path("/home/u/.config/native-build/deps.json"));
  EXPECT_EQ(locations.project, Path("/work/app/deps.json"));
}

TEST(DescriptorLocationsTest, ConfigOverrideAndHomeFallback) {
  const auto overridden = DescriptorLocations::resolve(
      MapEnvironment({{"NATIVE_BUILD_CONFIG", "/etc/nb"}, {"HOME", "/h"}}),
      "/p");
  EXPECT_EQ(overridden.user, Path("/etc/nb/deps.json"));
  const auto fallback =
      DescriptorLocations::resolve(MapEnvironment({{"HOME", "/h"}}), "/p");
  EXPECT_EQ(fallback.user, Path("/h/.config/native-build/deps.json"));
}
