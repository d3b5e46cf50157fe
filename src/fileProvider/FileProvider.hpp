#pragma once

#include <vector>

#include "alias.hpp"

namespace nativeBuild {
class FileProvider {
 public:
  virtual ~FileProvider() = default;

  virtual std::vector<Path> list() const = 0;
};
}  // namespace nativeBuild
