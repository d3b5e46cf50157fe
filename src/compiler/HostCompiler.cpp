#include "compiler/HostCompiler.hpp"

#include "utils.hpp"

namespace nativeBuild {
std::vector<std::string> HostCompiler::commandArgs(const UnitId &unit) const {
  std::vector<std::string> args;
  for (const auto &arg : desc.args) {
    auto expanded = replaceAll(arg, "{unit}", unit);
    expanded =
        replaceAll(expanded, "{compilePath}", compilePath.generic_string());
    expanded = replaceAll(expanded, "{classpath}", classpath);
    args.push_back(std::move(expanded));
  }
  return args;
}

void HostCompiler::compile(const UnitId &unit) const {
  int status;
  try {
    status = runner.run(desc.command, commandArgs(unit), sink);
  } catch (const process::LaunchFailure &e) {
    throw CompileFailure(unit, e.what());
  }
  if (status != 0)
    throw CompileFailure(unit, desc.command + " exited with status " +
                                   std::to_string(status));
}
}  // namespace nativeBuild
