#pragma once

#include <algorithm>
#include <boost/algorithm/string.hpp>
#include <boost/describe.hpp>
#include <boost/json.hpp>
#include <fstream>
#include <iterator>
#include <ranges>
#include <string>
#include <type_traits>
#include <vector>

#include "alias.hpp"
#include "macro.hpp"

namespace nativeBuild {
template <std::ranges::range C>
inline C replace(const C& c, auto&& item, auto&& newItem) {
  C cCopy(c);
  std::ranges::replace(cCopy, item, newItem);
  return cCopy;
}

inline std::string replaceAll(const std::string& str,
                              const std::string& toReplace,
                              const std::string& newStr) {
  std::string strCopy(str);
  boost::replace_all(strCopy, toReplace, newStr);
  return strCopy;
}

inline std::vector<std::string> split(const std::string& str, char delim) {
  std::vector<std::string> parts;
  if (str.empty()) return parts;
  boost::split(parts, str, [delim](char ch) { return ch == delim; });
  return parts;
}

inline std::string join(const std::vector<std::string>& parts, char delim) {
  return boost::join(parts, std::string(1, delim));
}

inline std::string readAsStr(const Path& path) {
  std::ifstream is(path);
  return std::string(std::istreambuf_iterator<char>(is), {});
}

inline json::value parseJson(const Path& path) {
  const auto input = readAsStr(path);
  return json::parse(input);
}

// A described struct read member by member: absent or mistyped members keep
// their default value.
template <class T>
struct Merge : public T {};

template <class T>
Merge<T> tag_invoke(const json::value_to_tag<Merge<T>>&,
                    const json::value& jv) {
  Merge<T> t;
  const auto* obj = jv.if_object();
  if (obj == nullptr) return t;
  using namespace boost::describe;
  boost::mp11::mp_for_each<describe_members<T, mod_public>>([&](auto&& m) {
    auto& member = t.*m.pointer;
    using memberType = std::remove_reference_t<decltype(member)>;
    const auto* value = obj->if_contains(m.name);
    if (value) {
      auto cValue = json::try_value_to<memberType>(*value);
      if (cValue) member = std::move(*cValue);
    }
  });
  return t;
}
}  // namespace nativeBuild
