#pragma once

#include <optional>

#include "alias.hpp"
#include "env/Environment.hpp"

namespace nativeBuild {
// Looks for native-image in $GRAALVM_HOME/bin, $GRAALVM_HOME and then every
// $PATH entry. Returns the absolute path of the first match.
std::optional<Path> findNativeImage(const Environment &env);
}  // namespace nativeBuild
