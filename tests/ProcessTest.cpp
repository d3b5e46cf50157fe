#include "process/process.hpp"
#include "support.hpp"

using namespace nativeBuild;
using namespace nativeBuild::test;

#ifndef _WIN32
TEST(ProcessTest, MergesStderrAndReturnsExitCode) {
  process::ChildRunner runner;
  std::vector<std::string> lines;
  const int status =
      runner.run("/bin/sh", {"-c", "echo out; echo err 1>&2; echo done; exit 3"},
                 [&](const std::string &line) { lines.push_back(line); });
  EXPECT_EQ(status, 3);
  EXPECT_EQ(lines, (std::vector<std::string>{"out", "err", "done"}));
}

TEST(ProcessTest, PassesArgumentsVerbatim) {
  process::ChildRunner runner;
  std::vector<std::string> lines;
  const int status =
      runner.run("/bin/sh", {"-c", "printf '%s\\n' \"$1\" \"$2\"", "sh",
                             "with space", "'quoted'"},
                 [&](const std::string &line) { lines.push_back(line); });
  EXPECT_EQ(status, 0);
  EXPECT_EQ(lines, (std::vector<std::string>{"with space", "'quoted'"}));
}

TEST(ProcessTest, BareNameIsSearchedOnPath) {
  process::ChildRunner runner;
  std::vector<std::string> lines;
  EXPECT_EQ(runner.run("sh", {"-c", "echo found"},
                       [&](const std::string &line) { lines.push_back(line); }),
            0);
  EXPECT_EQ(lines, std::vector<std::string>{"found"});
}

class ProcessStreamTest : public TempDirTest {};

TEST_F(ProcessStreamTest, LinesReachSinkWhileChildRuns) {
  process::ChildRunner runner;
  const auto marker = dir / "exited";
  std::vector<std::string> lines;
  std::vector<bool> childDone;
  const int status = runner.run(
      "/bin/sh",
      {"-c", "echo first; sleep 1; : > \"$1\"; echo last; exit 7", "sh",
       marker.string()},
      [&](const std::string &line) {
        lines.push_back(line);
        childDone.push_back(fs::exists(marker));
      });
  EXPECT_EQ(status, 7);
  EXPECT_EQ(lines, (std::vector<std::string>{"first", "last"}));
  EXPECT_EQ(childDone, (std::vector<bool>{false, true}));
}

TEST(ProcessTest, MissingExecutableIsLaunchFailure) {
  process::ChildRunner runner;
  EXPECT_THROW(runner.run("/nonexistent/native-image", {},
                          [](const std::string &) {}),
               process::LaunchFailure);
  EXPECT_THROW(runner.run("surely-not-a-command-on-path", {},
                          [](const std::string &) {}),
               process::LaunchFailure);
}
#endif
