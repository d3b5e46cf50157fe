#include "build/NativeImage.hpp"

#include <iostream>

namespace nativeBuild {
std::vector<std::string> NativeImage::args(
    const std::vector<std::string> &extraArgs, const std::string &searchPath,
    const std::string &entryPoint) const {
  std::vector<std::string> args(extraArgs);
  if (!searchPath.empty()) {
    args.push_back("-cp");
    args.push_back(searchPath);
  }
  if (!entryPoint.empty()) args.push_back(entryPoint);
  if (!env.isWindows()) args.push_back("--no-server");
  return args;
}

int NativeImage::invoke(const std::vector<std::string> &extraArgs,
                        const std::string &searchPath,
                        const std::string &entryPoint, bool echo,
                        const process::LineSink &sink) const {
  const auto cliArgs = args(extraArgs, searchPath, entryPoint);
  if (echo) std::cout << process::commandLine(bin, cliArgs) << std::endl;
  return runner.run(bin, cliArgs, sink);
}
}  // namespace nativeBuild
