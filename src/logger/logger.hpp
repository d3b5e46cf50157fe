#pragma once

#include <iostream>
#include <ostream>
#include <string>

#include "alias.hpp"

namespace nativeBuild {
namespace logger {
extern const std::string reset;

using EndlType = decltype(std::endl<char, std::char_traits<char>>);

struct Logger {
 protected:
  std::ostream& os;
  std::string content;
  bool isFlushed = false;

  std::string flushContent() {
    isFlushed = true;
    return content + reset + '\n';
  }

  void write();

 public:
  Logger(std::ostream& os) : os(os) {}
  Logger(std::ostream& os, const std::string& init) : os(os), content(init) {}
  Logger(Logger&& other)
      : os(other.os),
        content(std::move(other.content)),
        isFlushed(other.isFlushed) {
    other.isFlushed = true;
  }

  template <class T>
  auto& operator<<(const T& msg) {
    content += std::string(msg);
    return *this;
  }

  auto& operator<<(int value) { return operator<<(std::to_string(value)); }

  auto& operator<<(const Path& path) {
    return operator<<(path.generic_string());
  }

  void operator<<(EndlType&) { write(); }

  ~Logger() {
    if (!isFlushed) write();
  }
};

#define GENERATE_COLOR(NAME) Logger NAME(std::ostream& os = std::cout);

GENERATE_COLOR(defaultColor);
GENERATE_COLOR(red);
GENERATE_COLOR(green);
GENERATE_COLOR(yellow);
#undef GENERATE_COLOR

Logger info();
Logger success();
Logger warn();
Logger error();
}  // namespace logger
}  // namespace nativeBuild
