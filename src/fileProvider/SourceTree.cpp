#include "fileProvider/SourceTree.hpp"

#include <algorithm>
#include <system_error>

namespace nativeBuild {
std::vector<Path> SourceTree::list() const {
  std::vector<Path> files;
  std::error_code ec;
  if (!fs::is_directory(root, ec)) return files;
  for (fs::recursive_directory_iterator it(root, ec), end; !ec && it != end;
       it.increment(ec)) {
    std::error_code entryEc;
    if (!it->is_regular_file(entryEc)) continue;
    const auto ext = it->path().extension().string();
    if (std::ranges::find(extensions, ext) != extensions.end())
      files.emplace_back(it->path());
  }
  std::ranges::sort(files);
  return files;
}
}  // namespace nativeBuild
