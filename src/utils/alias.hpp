#pragma once

#include <filesystem>

namespace fs = std::filesystem;
using Path = fs::path;

namespace boost {
namespace json {}
}  // namespace boost
namespace json = boost::json;
