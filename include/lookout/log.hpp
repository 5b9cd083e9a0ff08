#pragma once

#include <string>
#include <string_view>

namespace lookout::log {

enum class Level { Debug, Info, Warn, Error };

void set_level(Level level);
Level level();
Level parse_level(std::string_view name);

std::string timestamp_now();

void write(Level level, std::string_view component, std::string_view message);

inline void debug(std::string_view component, std::string_view message) { write(Level::Debug, component, message); }
inline void info(std::string_view component, std::string_view message) { write(Level::Info, component, message); }
inline void warn(std::string_view component, std::string_view message) { write(Level::Warn, component, message); }
inline void error(std::string_view component, std::string_view message) { write(Level::Error, component, message); }

} // namespace lookout::log
