#pragma once

#include <string>
#include <vector>

#include "alias.hpp"
#include "env/Environment.hpp"
#include "process/process.hpp"

namespace nativeBuild {
class NativeImage {
 private:
  const Path bin;
  const Environment &env;
  const process::Runner &runner;

 public:
  NativeImage(const Path &bin, const Environment &env,
              const process::Runner &runner)
      : bin(bin), env(env), runner(runner) {}

  // extraArgs, then `-cp searchPath` and entryPoint when given, then
  // --no-server, which native-image does not support on Windows.
  std::vector<std::string> args(const std::vector<std::string> &extraArgs,
                                const std::string &searchPath,
                                const std::string &entryPoint) const;

  int invoke(const std::vector<std::string> &extraArgs,
             const std::string &searchPath, const std::string &entryPoint,
             bool echo,
             const process::LineSink &sink = process::printLine) const;
};
}  // namespace nativeBuild
