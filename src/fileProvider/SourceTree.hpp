#pragma once

#include <string>
#include <vector>

#include "fileProvider/FileProvider.hpp"

namespace nativeBuild {
// Regular files under root whose extension is one of extensions, sorted by
// path. A missing root lists nothing.
class SourceTree : public FileProvider {
  const Path root;
  const std::vector<std::string> extensions;

 public:
  SourceTree(const Path& root, const std::vector<std::string>& extensions)
      : root(root), extensions(extensions) {}

  std::vector<Path> list() const override;
};
}  // namespace nativeBuild
