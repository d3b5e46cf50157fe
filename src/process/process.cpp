#include "process/process.hpp"

#include <boost/process.hpp>
#include <iostream>
#include <unordered_map>

namespace nativeBuild {
namespace process {
namespace bp = boost::process;

std::unordered_map<std::string, Path> exeCache;

Path findExecutable(const std::string &name) {
  if (!exeCache.contains(name))
    exeCache.emplace(name, Path(bp::search_path(name).string()));
  return exeCache.at(name);
}

void printLine(const std::string &line) {
  std::cout << line << '\n';
  std::cout.flush();
}

std::string commandLine(const Path &exe, const std::vector<std::string> &args) {
  std::string line = exe.string();
  for (const auto &arg : args) {
    line += ' ';
    if (arg.find(' ') != std::string::npos)
      line += '\'' + arg + '\'';
    else
      line += arg;
  }
  return line;
}

int ChildRunner::run(const Path &exe, const std::vector<std::string> &args,
                     const LineSink &sink) const {
  const auto resolved =
      exe.has_parent_path() ? exe : findExecutable(exe.string());
  if (resolved.empty()) throw LaunchFailure(exe, "not found on PATH");
  bp::ipstream is;
  std::error_code ec;
  bp::child child(bp::exe = resolved.string(), bp::args = args,
                  (bp::std_out & bp::std_err) > is, ec);
  if (ec) throw LaunchFailure(exe, ec.message());
  std::string line;
  while (child.running(ec) && std::getline(is, line)) sink(line);
  child.wait(ec);
  if (ec) throw ProcessError(ec);
  while (std::getline(is, line)) sink(line);
  return child.exit_code();
}
}  // namespace process
}  // namespace nativeBuild
