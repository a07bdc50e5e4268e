#pragma once
#include <sstream>
#include <string>

namespace etcalc {
namespace log {

enum class Level { Debug = 0, Info, Warning, Error };

void  set_level(Level lvl);
Level level();

// Writes "[tag] message" to stdout (Debug/Info) or stderr (Warning/Error)
void write(Level lvl, const std::string& tag, const std::string& msg);

inline bool enabled(Level lvl) { return lvl >= level(); }

inline void debug  (const std::string& tag, const std::string& msg) { write(Level::Debug,   tag, msg); }
inline void info   (const std::string& tag, const std::string& msg) { write(Level::Info,    tag, msg); }
inline void warning(const std::string& tag, const std::string& msg) { write(Level::Warning, tag, msg); }
inline void error  (const std::string& tag, const std::string& msg) { write(Level::Error,   tag, msg); }

} // namespace log
} // namespace etcalc
