#include "env/Locator.hpp"

#include <string>
#include <system_error>

#include "OrderedSet.hpp"
#include "utils.hpp"

namespace nativeBuild {
std::optional<Path> findNativeImage(const Environment &env) {
  OrderedSet<std::string> dirs;
  if (const auto graalHome = env.get("GRAALVM_HOME")) {
    dirs.insert((Path(*graalHome) / "bin").string());
    dirs.insert(*graalHome);
  }
  if (const auto path = env.get("PATH"))
    dirs.insertAll(split(*path, env.pathSeparator()));

  const std::string filename =
      env.isWindows() ? "native-image.cmd" : "native-image";
  for (const auto &dir : dirs) {
    if (dir.empty()) continue;
    const auto file = Path(dir) / filename;
    std::error_code ec;
    if (fs::is_regular_file(file, ec)) return fs::absolute(file, ec);
  }
  return std::nullopt;
}
}  // namespace nativeBuild
