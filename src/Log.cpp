#include "etcalc/Log.hpp"

#include <atomic>
#include <iostream>
#include <mutex>

namespace etcalc {
namespace log {

static std::atomic<Level> g_level{Level::Warning};
static std::mutex         g_mtx;

void set_level(Level lvl) { g_level = lvl; }

Level level() { return g_level; }

void write(Level lvl, const std::string& tag, const std::string& msg)
{
    if (!enabled(lvl)) return;

    static const char* names[] = {"debug", "info", "warning", "error"};
    std::lock_guard lk(g_mtx);
    std::ostream& os = (lvl >= Level::Warning) ? std::cerr : std::cout;
    os << '[' << tag << "] ";
    if (lvl != Level::Info) os << names[static_cast<int>(lvl)] << ": ";
    os << msg << '\n';
}

} // namespace log
} // namespace etcalc
