#include "logger/logger.hpp"

namespace nativeBuild {
namespace logger {
const std::string reset = "\033[0m";

void Logger::write() {
  os << flushContent();
  os.flush();
}

#define GENERATE_COLOR(NAME, CODE) \
  Logger NAME(std::ostream& os) { return {os, "\033[0;" #CODE}; };

GENERATE_COLOR(defaultColor, 39m);
GENERATE_COLOR(red, 31m);
GENERATE_COLOR(green, 32m);
GENERATE_COLOR(yellow, 33m);
#undef GENERATE_COLOR

Logger info() { return defaultColor(std::cout); }
Logger success() { return green(std::cout); }
Logger warn() { return yellow(std::cerr); }
Logger error() { return red(std::cerr); }
}  // namespace logger
}  // namespace nativeBuild
