#pragma once

#include <functional>
#include <string>

namespace report {

enum class Level { Debug = 0, Info = 1, Warning = 2, Error = 3 };

// Callback the core uses for every diagnostic. The core never writes to
// std::cout/std::cerr itself.
using Reporter = std::function<void(Level, const std::string &)>;

// Writes "YYYY-MM-DD HH:MM:SS - LEVEL - message" lines to std::cerr,
// dropping anything below min_level
Reporter console(Level min_level = Level::Info);

// Discards everything
Reporter silent();

const char *level_name(Level level);

// Accepts debug, info, warning (or warn), error; throws
// errors::ConfigurationError otherwise
Level parse_level(const std::string &name);

} // namespace report
