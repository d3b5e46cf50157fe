#pragma once

#include <string>

#include "alias.hpp"
#include "macro.hpp"

namespace nativeBuild {
DEF_EXCEPTION(IOFailure, (const Path &path, const std::string &cause),
              "cannot prepare " + path.generic_string() + ": " + cause);

// Empties path, deleting children before their parents, and creates it when
// missing.
void prepareScratchDir(const Path &path);
}  // namespace nativeBuild
