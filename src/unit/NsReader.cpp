#include <algorithm>
#include <cctype>

#include "unit/Unit.hpp"

namespace nativeBuild {
namespace {
// Just enough of a reader to walk top-level forms without evaluating them.
class NsReader {
  std::string_view src;
  std::size_t pos = 0;

  bool eof() const { return pos >= src.size(); }

  char peek(std::size_t offset = 0) const {
    return pos + offset < src.size() ? src[pos + offset] : '\0';
  }

  static bool isDelimiter(char ch) {
    return std::isspace(static_cast<unsigned char>(ch)) || ch == ',' ||
           ch == '(' || ch == ')' || ch == '[' || ch == ']' || ch == '{' ||
           ch == '}' || ch == '"' || ch == ';';
  }

  void skipLine() {
    while (!eof() && peek() != '\n') pos++;
  }

  void skipSpace() {
    while (!eof()) {
      const char ch = peek();
      if (std::isspace(static_cast<unsigned char>(ch)) || ch == ',') {
        pos++;
      } else if (ch == ';' || (ch == '#' && peek(1) == '!')) {
        skipLine();
      } else if (ch == '#' && peek(1) == '_') {
        pos += 2;
        skipForm();
      } else {
        break;
      }
    }
  }

  std::string_view readToken() {
    const auto start = pos;
    while (!eof() && !isDelimiter(peek())) pos++;
    return src.substr(start, pos - start);
  }

  void skipString() {
    pos++;
    while (!eof()) {
      const char ch = src[pos++];
      if (ch == '\\')
        pos = std::min(pos + 1, src.size());
      else if (ch == '"')
        return;
    }
  }

  void skipCollection(char close) {
    pos++;
    while (true) {
      skipSpace();
      if (eof()) return;
      if (peek() == close) {
        pos++;
        return;
      }
      skipForm();
    }
  }

  void skipForm() {
    skipSpace();
    if (eof()) return;
    switch (peek()) {
      case '(':
        return skipCollection(')');
      case '[':
        return skipCollection(']');
      case '{':
        return skipCollection('}');
      case '"':
        return skipString();
      case '\\':
        pos = std::min(pos + 2, src.size());
        readToken();
        return;
      case '\'':
      case '`':
      case '@':
      case '#':
        pos++;
        return skipForm();
      case '~':
        pos += peek(1) == '@' ? 2 : 1;
        return skipForm();
      case '^':
        pos++;
        skipForm();
        return skipForm();
      case ')':
      case ']':
      case '}':
        pos++;
        return;
      default:
        readToken();
    }
  }

 public:
  NsReader(std::string_view src) : src(src) {}

  std::optional<UnitId> read() {
    while (true) {
      skipSpace();
      if (eof()) return std::nullopt;
      if (peek() != '(') {
        skipForm();
        continue;
      }
      const auto start = pos;
      pos++;
      skipSpace();
      if (readToken() == "ns") {
        skipSpace();
        while (peek() == '^') {
          pos++;
          skipForm();
          skipSpace();
        }
        const auto name = readToken();
        if (name.empty()) return std::nullopt;
        return UnitId{std::string(name)};
      }
      pos = start;
      skipForm();
    }
  }
};
}  // namespace

std::optional<UnitId> readNamespace(std::string_view source) {
  return NsReader(source).read();
}
}  // namespace nativeBuild
