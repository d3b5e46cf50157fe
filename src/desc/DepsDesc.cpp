#include "desc/DepsDesc.hpp"

#include <system_error>

#ifndef NATIVE_BUILD_DATADIR
#define NATIVE_BUILD_DATADIR "/usr/local/share/native-build"
#endif

namespace nativeBuild {
namespace {
constexpr auto descriptorName = "deps.json";

Path userConfigDir(const Environment &env) {
  if (const auto dir = env.get("NATIVE_BUILD_CONFIG")) return *dir;
  if (const auto dir = env.get("XDG_CONFIG_HOME"))
    return Path(*dir) / "native-build";
  if (const auto home = env.get("HOME"))
    return Path(*home) / ".config" / "native-build";
  return Path(".config") / "native-build";
}
}  // namespace

DepsConfig DepsConfig::create(const json::object &merged) {
  return json::value_to<Merge<DepsConfig>>(json::value(merged));
}

DescriptorLocations DescriptorLocations::resolve(const Environment &env,
                                                 const Path &projectDir) {
  const auto home = env.get("NATIVE_BUILD_HOME");
  return {
      .install = (home ? Path(*home) : Path(NATIVE_BUILD_DATADIR)) /
                 descriptorName,
      .user = userConfigDir(env) / descriptorName,
      .project = projectDir / descriptorName,
  };
}

std::optional<json::object> FileDescriptorSource::readDescriptor(
    const Path &path) {
  std::error_code ec;
  if (!fs::is_regular_file(path, ec)) return std::nullopt;
  json::value value;
  try {
    value = parseJson(path);
  } catch (const std::exception &e) {
    throw InvalidDescriptor(path, e.what());
  }
  if (!value.is_object()) throw InvalidDescriptor(path, "not a JSON object");
  return std::move(value.as_object());
}

DescriptorSet FileDescriptorSource::read() const {
  return {
      .install = readDescriptor(locations.install),
      .user = readDescriptor(locations.user),
      .project = readDescriptor(locations.project),
  };
}

json::object mergeObjects(json::object into, const json::object &from) {
  for (const auto &[key, value] : from) {
    auto *existing = into.if_contains(key);
    if (existing && existing->is_object() && value.is_object())
      *existing = mergeObjects(std::move(existing->as_object()),
                               value.as_object());
    else
      into.insert_or_assign(key, value);
  }
  return into;
}

DepsConfig mergeDescriptors(const DescriptorSet &set) {
  if (!set.install && !set.user && !set.project) throw ConfigNotFound();
  json::object merged;
  for (const auto *layer : {&set.install, &set.user, &set.project}) {
    if (*layer) merged = mergeObjects(std::move(merged), **layer);
  }
  return DepsConfig::create(merged);
}
}  // namespace nativeBuild
