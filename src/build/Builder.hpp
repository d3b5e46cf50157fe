#pragma once

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "alias.hpp"
#include "build/BuildOptions.hpp"
#include "compiler/UnitCompiler.hpp"
#include "desc/DepsDesc.hpp"
#include "env/Environment.hpp"
#include "macro.hpp"
#include "process/process.hpp"
#include "unit/Unit.hpp"

namespace nativeBuild {
DEF_EXCEPTION(BinaryNotFound, (), "could not find GraalVM's native-image");

// What a UnitCompiler gets to know about the build it serves.
struct CompileContext {
  const DepsConfig &config;
  const Path &compilePath;
  const std::string &classpath;
  const process::Runner &runner;
  const process::LineSink &sink;
};

using CompilerFactory =
    std::function<std::unique_ptr<UnitCompiler>(const CompileContext &)>;

std::unique_ptr<UnitCompiler> createHostCompiler(const CompileContext &ctx);

// Runs one build: merge descriptors, discover units, wipe the compile path,
// compile every unit into it, then hand the result to native-image.
class Builder {
 private:
  const Environment &env;
  const process::Runner &runner;
  const DescriptorSource &descriptors;

  CHAIN_VAR(Path, projectDir, fs::current_path(), setProjectDir);
  CHAIN_VAR(process::LineSink, sink, process::printLine, setSink);
  CHAIN_VAR(CompilerFactory, compilerFactory, createHostCompiler,
            setCompilerFactory);

 public:
  Builder(const Environment &env, const process::Runner &runner,
          const DescriptorSource &descriptors)
      : env(env), runner(runner), descriptors(descriptors) {}

  // Returns the exit code of native-image.
  int build(const UnitId &entry, const std::vector<std::string> &extraArgs,
            const BuildOptions &options) const;

  int build(const BuildOptions &options) const {
    return build(UnitId{options.entryUnit}, options.extraArgs, options);
  }
};
}  // namespace nativeBuild
