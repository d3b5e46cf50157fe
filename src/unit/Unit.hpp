#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "alias.hpp"
#include "desc/DepsDesc.hpp"

namespace nativeBuild {
// Fully-qualified namespace name, e.g. `app.core`.
struct UnitId : public std::string {
  using Hash = std::hash<std::string>;
};

// Source extensions scanned under each source root.
extern const std::vector<std::string> sourceExtensions;

// Splits a comma separated list, trimming tokens and dropping empty ones.
std::vector<UnitId> parseUnitList(const std::string &csv);

// Name declared by the first top-level `(ns ...)` form of source, if any.
std::optional<UnitId> readNamespace(std::string_view source);

// Units declared by the source files under root, in path order.
std::vector<UnitId> findUnitsInDir(const Path &root);

// precompile units, then the entry unit, then every unit found under the
// source roots, each unit kept once at its first position.
std::vector<UnitId> discoverUnits(const UnitId &entry,
                                  const std::string &precompile,
                                  const std::vector<Path> &sourceRoots);

std::vector<UnitId> discoverUnits(const UnitId &entry,
                                  const std::string &precompile,
                                  const DepsConfig &config,
                                  const Path &projectDir);

// Class name of a unit's generated entry point: `my-app` -> `my_app`.
std::string munge(const std::string &unit);
}  // namespace nativeBuild
