#pragma once

#include <functional>
#include <string>
#include <vector>

#include "build/BuildOptions.hpp"
#include "env/Environment.hpp"
#include "macro.hpp"

namespace nativeBuild {
DEF_EXCEPTION(MissingEntryUnit, (),
              "Main namespace required e.g. \"script\" if main file is "
              "./script.clj");

struct CommandLine {
  BuildOptions options;
  bool help = false;
  std::string helpText;
};

// Everything after the first `--` goes to native-image untouched. A missing
// --native-image-path is filled in by findNativeImage.
CommandLine parseCommandLine(const std::vector<std::string> &args,
                             const Environment &env);

using BuildFunc = std::function<int(const BuildOptions &)>;

// Parses args, runs the pre-flight checks and calls build. Returns the
// process exit code.
int runCommandLine(const std::vector<std::string> &args,
                   const Environment &env, const BuildFunc &build);
}  // namespace nativeBuild
