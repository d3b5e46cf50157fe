#pragma once

#include <optional>
#include <string>
#include <vector>

#include "alias.hpp"

namespace nativeBuild {
struct BuildOptions {
  std::string entryUnit;
  // Comma separated units compiled before the entry unit.
  std::string precompile;
  // Overrides the descriptor's compilePath.
  std::optional<Path> compilePath;
  std::optional<Path> nativeImagePath;
  bool echo = false;
  // Passed to native-image verbatim.
  std::vector<std::string> extraArgs;
};
}  // namespace nativeBuild
