#include <boost/algorithm/string/trim.hpp>
#include <system_error>

#include "OrderedSet.hpp"
#include "fileProvider/SourceTree.hpp"
#include "logger/logger.hpp"
#include "unit/Unit.hpp"
#include "utils.hpp"

namespace nativeBuild {
const std::vector<std::string> sourceExtensions = {".clj", ".cljc"};

std::vector<UnitId> parseUnitList(const std::string &csv) {
  std::vector<UnitId> units;
  for (auto &token : split(csv, ',')) {
    boost::trim(token);
    if (!token.empty()) units.push_back(UnitId{std::move(token)});
  }
  return units;
}

std::vector<UnitId> findUnitsInDir(const Path &root) {
  std::vector<UnitId> units;
  for (const auto &file : SourceTree(root, sourceExtensions).list()) {
    if (auto unit = readNamespace(readAsStr(file)))
      units.push_back(std::move(*unit));
  }
  return units;
}

std::vector<UnitId> discoverUnits(const UnitId &entry,
                                  const std::string &precompile,
                                  const std::vector<Path> &sourceRoots) {
  OrderedSet<UnitId, UnitId::Hash> units;
  units.insertAll(parseUnitList(precompile));
  units.insert(entry);
  for (const auto &root : sourceRoots) units.insertAll(findUnitsInDir(root));
  return units.toVector();
}

std::vector<UnitId> discoverUnits(const UnitId &entry,
                                  const std::string &precompile,
                                  const DepsConfig &config,
                                  const Path &projectDir) {
  std::vector<Path> sourceRoots;
  for (const auto &path : config.paths) {
    const auto root = projectDir / path;
    std::error_code ec;
    if (!fs::is_directory(root, ec))
      logger::warn() << "source path " << root << " does not exist"
                     << std::endl;
    sourceRoots.push_back(root);
  }
  return discoverUnits(entry, precompile, sourceRoots);
}

std::string munge(const std::string &unit) { return replace(unit, '-', '_'); }
}  // namespace nativeBuild
