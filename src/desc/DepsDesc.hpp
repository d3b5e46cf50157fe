#pragma once

#include <boost/describe.hpp>
#include <boost/json.hpp>
#include <optional>
#include <string>
#include <vector>

#include "alias.hpp"
#include "env/Environment.hpp"
#include "macro.hpp"
#include "utils.hpp"

namespace nativeBuild {
DEF_EXCEPTION(ConfigNotFound, (),
              "no deps.json found at the install, user or project location");
DEF_EXCEPTION(InvalidDescriptor, (const Path &path, const std::string &reason),
              "invalid descriptor " + path.generic_string() + ": " + reason);

// The toolchain used to compile a single unit before native-image runs.
// {unit}, {compilePath} and {classpath} in args are substituted per unit.
struct HostCompilerDesc {
  std::string command = "java";
  std::vector<std::string> args = {
      "-cp", "{classpath}", "clojure.main", "-e",
      "(binding [*compile-path* \"{compilePath}\"] (compile '{unit}))"};

 private:
  BOOST_DESCRIBE_CLASS(HostCompilerDesc, (), (command, args), (), ())
};

struct DepsConfig {
  std::vector<std::string> paths;
  std::string compilePath = "classes";
  Merge<HostCompilerDesc> compiler;

  static DepsConfig create(const json::object &merged);

 private:
  BOOST_DESCRIBE_CLASS(DepsConfig, (), (paths, compilePath, compiler), (), ())
};

struct DescriptorSet {
  std::optional<json::object> install;
  std::optional<json::object> user;
  std::optional<json::object> project;
};

struct DescriptorLocations {
  Path install;
  Path user;
  Path project;

  static DescriptorLocations resolve(const Environment &env,
                                     const Path &projectDir);
};

class DescriptorSource {
 public:
  virtual ~DescriptorSource() = default;

  virtual DescriptorSet read() const = 0;
};

class FileDescriptorSource : public DescriptorSource {
 private:
  const DescriptorLocations locations;

 public:
  FileDescriptorSource(const DescriptorLocations &locations)
      : locations(locations) {}

  DescriptorSet read() const override;

  // An absent file yields nullopt. A file that is not a JSON object throws
  // InvalidDescriptor.
  static std::optional<json::object> readDescriptor(const Path &path);
};

// Later keys replace earlier ones, except that two objects under the same key
// are merged recursively.
json::object mergeObjects(json::object into, const json::object &from);

// Merges install, user and project left-to-right.
DepsConfig mergeDescriptors(const DescriptorSet &set);
}  // namespace nativeBuild
