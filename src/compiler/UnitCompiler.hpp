#pragma once

#include <string>
#include <vector>

#include "macro.hpp"
#include "unit/Unit.hpp"

namespace nativeBuild {
DEF_EXCEPTION(CompileFailure, (const UnitId &unit, const std::string &cause),
              "failed to compile " + unit + ": " + cause);

class UnitCompiler {
 public:
  virtual ~UnitCompiler() = default;

  // Writes the artifacts of unit into the output directory. Throws
  // CompileFailure.
  virtual void compile(const UnitId &unit) const = 0;
};

// Compiles units in order, stopping at the first failure.
void compileAll(const std::vector<UnitId> &units, const UnitCompiler &compiler);
}  // namespace nativeBuild
