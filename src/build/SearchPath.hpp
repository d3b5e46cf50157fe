#pragma once

#include <string>
#include <vector>

#include "alias.hpp"
#include "env/Environment.hpp"

namespace nativeBuild {
// Search path entries containing this are the tool's own and are dropped.
extern const std::string selfIdentifier;

// $CLASSPATH entries, minus empty entries and the tool's own.
std::vector<std::string> processSearchPath(const Environment &env);

// scratchPath followed by processSearchPath(env).
std::string buildSearchPath(const Environment &env, const Path &scratchPath);

// scratchPath, then the source roots, then processSearchPath(env). Used while
// compiling units, when the sources themselves must be visible.
std::string hostClasspath(const Environment &env, const Path &scratchPath,
                          const std::vector<Path> &sourceRoots);
}  // namespace nativeBuild
