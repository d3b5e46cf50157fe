#include "env/Environment.hpp"

#include <cstdlib>

namespace nativeBuild {
std::optional<std::string> SystemEnvironment::get(
    const std::string &name) const {
  const auto *value = std::getenv(name.c_str());
  if (value == nullptr) return std::nullopt;
  return std::string(value);
}

char SystemEnvironment::pathSeparator() const {
#ifdef _WIN32
  return ';';
#else
  return ':';
#endif
}

bool SystemEnvironment::isWindows() const {
#ifdef _WIN32
  return true;
#else
  return false;
#endif
}
}  // namespace nativeBuild
