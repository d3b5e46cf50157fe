#include "compiler/UnitCompiler.hpp"

#include "logger/logger.hpp"

namespace nativeBuild {
void compileAll(const std::vector<UnitId> &units,
                const UnitCompiler &compiler) {
  for (const auto &unit : units) {
    logger::info() << "Compiling " << unit << std::endl;
    compiler.compile(unit);
  }
  logger::success() << "Compiled " << static_cast<int>(units.size())
                    << " units" << std::endl;
}
}  // namespace nativeBuild
