#include "build/ScratchDir.hpp"

#include <system_error>
#include <vector>

namespace nativeBuild {
void prepareScratchDir(const Path &path) {
  std::error_code ec;
  if (fs::is_directory(path, ec)) {
    std::vector<Path> entries;
    for (fs::recursive_directory_iterator it(path, ec), end; it != end;
         it.increment(ec)) {
      if (ec) break;
      entries.push_back(it->path());
    }
    if (ec) throw IOFailure(path, ec.message());
    // Pre-order listing, so walking it backwards visits children first.
    for (auto it = entries.rbegin(); it != entries.rend(); it++) {
      fs::remove(*it, ec);
      if (ec) throw IOFailure(*it, ec.message());
    }
  }
  fs::create_directories(path, ec);
  if (ec) throw IOFailure(path, ec.message());
}
}  // namespace nativeBuild
