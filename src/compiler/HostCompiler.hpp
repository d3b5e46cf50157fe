#pragma once

#include <string>
#include <vector>

#include "compiler/UnitCompiler.hpp"
#include "desc/DepsDesc.hpp"
#include "process/process.hpp"

namespace nativeBuild {
// Compiles one unit per run of the host toolchain described by the
// descriptor's `compiler` entry.
class HostCompiler : public UnitCompiler {
 private:
  const HostCompilerDesc desc;
  const Path compilePath;
  const std::string classpath;
  const process::Runner &runner;
  const process::LineSink sink;

 public:
  HostCompiler(const HostCompilerDesc &desc, const Path &compilePath,
               const std::string &classpath, const process::Runner &runner,
               const process::LineSink &sink = process::printLine)
      : desc(desc),
        compilePath(compilePath),
        classpath(classpath),
        runner(runner),
        sink(sink) {}

  std::vector<std::string> commandArgs(const UnitId &unit) const;

  void compile(const UnitId &unit) const override;
};
}  // namespace nativeBuild
