#pragma once
#include <string>

namespace fsk {
namespace log {

enum class Level { Debug = 0, Info, Warn, Error };

void init(Level level = Level::Info);
// Accepts names ("debug", "warning", ...) and the numeric levels 10-50.
// Unknown names map to Info.
Level level_from_string(const std::string &name);
bool enabled(Level level);
void log(Level level, const std::string &msg);
void debug(const std::string &msg);
void info(const std::string &msg);
void warn(const std::string &msg);
void error(const std::string &msg);

} // namespace log
} // namespace fsk
