#pragma once

#include <unordered_set>
#include <vector>

namespace nativeBuild {
// Keeps elements in the order they were first inserted.
template <class T, class Hash = std::hash<T>>
class OrderedSet {
 private:
  std::vector<T> order;
  std::unordered_set<T, Hash> seen;

 public:
  bool insert(const T &value) {
    if (!seen.insert(value).second) return false;
    order.push_back(value);
    return true;
  }

  void insertAll(const auto &values) {
    for (const auto &value : values) insert(value);
  }

  bool contains(const T &value) const { return seen.contains(value); }

  std::size_t size() const { return order.size(); }

  bool empty() const { return order.empty(); }

  auto begin() const { return order.begin(); }

  auto end() const { return order.end(); }

  const std::vector<T> &toVector() const { return order; }
};
}  // namespace nativeBuild
