#pragma once

#include <optional>
#include <string>

namespace nativeBuild {
class Environment {
 public:
  virtual ~Environment() = default;

  virtual std::optional<std::string> get(const std::string &name) const = 0;

  virtual char pathSeparator() const = 0;

  virtual bool isWindows() const = 0;
};

class SystemEnvironment : public Environment {
 public:
  std::optional<std::string> get(const std::string &name) const override;

  char pathSeparator() const override;

  bool isWindows() const override;
};
}  // namespace nativeBuild
