#include "build/Builder.hpp"

#include "build/NativeImage.hpp"
#include "build/ScratchDir.hpp"
#include "build/SearchPath.hpp"
#include "compiler/HostCompiler.hpp"

namespace nativeBuild {
namespace {
Path normalPath(const Path &path) {
  const auto normal = fs::absolute(path).lexically_normal();
  return normal.has_filename() ? normal : normal.parent_path();
}

bool contains(const Path &dir, const Path &path) {
  const auto rel = normalPath(path).lexically_relative(normalPath(dir));
  return !rel.empty() && *rel.begin() != "..";
}
}  // namespace

std::unique_ptr<UnitCompiler> createHostCompiler(const CompileContext &ctx) {
  return std::make_unique<HostCompiler>(ctx.config.compiler, ctx.compilePath,
                                        ctx.classpath, ctx.runner, ctx.sink);
}

int Builder::build(const UnitId &entry,
                   const std::vector<std::string> &extraArgs,
                   const BuildOptions &options) const {
  if (!options.nativeImagePath) throw BinaryNotFound();

  const auto config = mergeDescriptors(descriptors.read());
  const auto units =
      discoverUnits(entry, options.precompile, config, projectDir);

  const auto compilePath = fs::absolute(
      projectDir / options.compilePath.value_or(Path(config.compilePath)));
  std::vector<Path> sourceRoots;
  for (const auto &path : config.paths)
    sourceRoots.push_back(fs::absolute(projectDir / path));

  // The compile path is wiped, so it must not hold the project or its sources.
  if (contains(compilePath, projectDir))
    throw IOFailure(compilePath, "compile path contains the project");
  for (const auto &root : sourceRoots) {
    if (contains(compilePath, root))
      throw IOFailure(compilePath, "compile path contains source path " +
                                       root.generic_string());
  }
  prepareScratchDir(compilePath);
  const auto classpath = hostClasspath(env, compilePath, sourceRoots);
  const auto compiler =
      compilerFactory({config, compilePath, classpath, runner, sink});
  compileAll(units, *compiler);

  const auto searchPath = buildSearchPath(env, compilePath);
  return NativeImage(*options.nativeImagePath, env, runner)
      .invoke(extraArgs, searchPath, munge(entry), options.echo, sink);
}
}  // namespace nativeBuild
