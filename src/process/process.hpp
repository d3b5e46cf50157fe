#pragma once

#include <functional>
#include <string>
#include <system_error>
#include <vector>

#include "alias.hpp"
#include "macro.hpp"

namespace nativeBuild {
namespace process {
DEF_EXCEPTION(ProcessError, (const std::error_code &ec),
              "process error: " + ec.message());
DEF_EXCEPTION(LaunchFailure, (const Path &exe, const std::string &cause),
              "failed to launch " + exe.generic_string() + ": " + cause);

using LineSink = std::function<void(const std::string &)>;

// Absolute path of name on $PATH, or an empty path.
Path findExecutable(const std::string &name);

// Writes a line of child output to stdout and flushes it.
void printLine(const std::string &line);

// Renders an invocation the way a user would type it, quoting arguments
// that contain spaces.
std::string commandLine(const Path &exe, const std::vector<std::string> &args);

class Runner {
 public:
  virtual ~Runner() = default;

  // Runs exe (searched on $PATH when it is a bare name) with stderr merged into stdout, feeding every output line to
  // sink as it arrives. Blocks until the child exits and returns its exit
  // code.
  virtual int run(const Path &exe, const std::vector<std::string> &args,
                  const LineSink &sink) const = 0;
};

class ChildRunner : public Runner {
 public:
  int run(const Path &exe, const std::vector<std::string> &args,
          const LineSink &sink) const override;
};
}  // namespace process
}  // namespace nativeBuild
