#include <string>
#include <vector>

#include "build/Builder.hpp"
#include "cli/CommandLine.hpp"
#include "desc/DepsDesc.hpp"
#include "env/Environment.hpp"
#include "process/process.hpp"

using namespace nativeBuild;

int main(int argc, const char **argv) {
  SystemEnvironment env;
  process::ChildRunner runner;
  const std::vector<std::string> args(argv + 1, argv + argc);
  return runCommandLine(args, env, [&](const BuildOptions &options) {
    const auto projectDir = fs::current_path();
    FileDescriptorSource descriptors(
        DescriptorLocations::resolve(env, projectDir));
    return Builder(env, runner, descriptors)
        .setProjectDir(projectDir)
        .build(options);
  });
}
