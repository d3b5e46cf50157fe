#pragma once

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "compiler/UnitCompiler.hpp"
#include "env/Environment.hpp"
#include "process/process.hpp"

namespace nativeBuild {
namespace test {
class MapEnvironment : public Environment {
 private:
  std::unordered_map<std::string, std::string> vars;
  bool windows;

 public:
  MapEnvironment(std::unordered_map<std::string, std::string> vars = {},
                 bool windows = false)
      : vars(std::move(vars)), windows(windows) {}

  std::optional<std::string> get(const std::string &name) const override {
    const auto it = vars.find(name);
    if (it == vars.end()) return std::nullopt;
    return it->second;
  }

  char pathSeparator() const override { return windows ? ';' : ':'; }

  bool isWindows() const override { return windows; }
};

struct Invocation {
  Path exe;
  std::vector<std::string> args;
};

// Records every run and replies with a fixed exit code and output.
class FakeRunner : public process::Runner {
 public:
  mutable std::vector<Invocation> invocations;
  int exitCode = 0;
  std::vector<std::string> output;

  int run(const Path &exe, const std::vector<std::string> &args,
          const process::LineSink &sink) const override {
    invocations.push_back({exe, args});
    for (const auto &line : output) sink(line);
    return exitCode;
  }
};

class RecordingCompiler : public UnitCompiler {
 public:
  std::vector<std::string> &compiled;
  std::optional<std::string> failOn;

  RecordingCompiler(std::vector<std::string> &compiled,
                    std::optional<std::string> failOn = std::nullopt)
      : compiled(compiled), failOn(std::move(failOn)) {}

  void compile(const UnitId &unit) const override {
    if (failOn && unit == *failOn) throw CompileFailure(unit, "boom");
    compiled.push_back(unit);
  }
};

// A fresh directory under the system temp directory, removed afterwards.
class TempDirTest : public ::testing::Test {
 protected:
  Path dir;

  void SetUp() override {
    const auto *info = ::testing::UnitTest::GetInstance()->current_test_info();
    dir = fs::temp_directory_path() / "nb-tests" /
          (std::string(info->test_suite_name()) + "." + info->name());
    fs::remove_all(dir);
    fs::create_directories(dir);
  }

  void TearDown() override {
    std::error_code ec;
    fs::remove_all(dir, ec);
  }

  Path write(const Path &relative, const std::string &content) const {
    const auto file = dir / relative;
    fs::create_directories(file.parent_path());
    std::ofstream os(file);
    os << content;
    return file;
  }
};

inline std::vector<std::string> names(const std::vector<UnitId> &units) {
  return {units.begin(), units.end()};
}
}  // namespace test
}  // namespace nativeBuild
