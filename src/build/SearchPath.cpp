#include "build/SearchPath.hpp"

#include "utils.hpp"

namespace nativeBuild {
const std::string selfIdentifier = "native-build";

std::vector<std::string> processSearchPath(const Environment &env) {
  std::vector<std::string> entries;
  const auto classpath = env.get("CLASSPATH");
  if (!classpath) return entries;
  for (auto &entry : split(*classpath, env.pathSeparator())) {
    if (entry.empty() || entry.find(selfIdentifier) != std::string::npos)
      continue;
    entries.push_back(std::move(entry));
  }
  return entries;
}

std::string buildSearchPath(const Environment &env, const Path &scratchPath) {
  std::vector<std::string> entries{scratchPath.string()};
  for (auto &entry : processSearchPath(env)) entries.push_back(std::move(entry));
  return join(entries, env.pathSeparator());
}

std::string hostClasspath(const Environment &env, const Path &scratchPath,
                          const std::vector<Path> &sourceRoots) {
  std::vector<std::string> entries{scratchPath.string()};
  for (const auto &root : sourceRoots) entries.push_back(root.string());
  for (auto &entry : processSearchPath(env)) entries.push_back(std::move(entry));
  return join(entries, env.pathSeparator());
}
}  // namespace nativeBuild
