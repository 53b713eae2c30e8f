/**
 * @file log.cpp
 * @brief Implementation of leveled logging
 */

#include "core/log.h"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <utility>

namespace pongsim {
namespace log {

namespace {

Level g_level = Level::Info;
std::ostream* g_sink = nullptr;

std::ostream& sink() { return g_sink ? *g_sink : std::cerr; }

} // namespace

void set_level(Level level) { g_level = level; }

Level level() { return g_level; }

void set_sink(std::ostream* s) { g_sink = s; }

bool parse_level(const std::string& name, Level& out) {
    std::string n = name;
    std::transform(n.begin(), n.end(), n.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (n == "debug") { out = Level::Debug; return true; }
    if (n == "info") { out = Level::Info; return true; }
    if (n == "warn" || n == "warning") { out = Level::Warn; return true; }
    if (n == "error") { out = Level::Error; return true; }
    if (n == "off" || n == "none") { out = Level::Off; return true; }
    return false;
}

const char* level_name(Level level) {
    switch (level) {
        case Level::Debug: return "debug";
        case Level::Info: return "info";
        case Level::Warn: return "warn";
        case Level::Error: return "error";
        case Level::Off: return "off";
    }
    return "info";
}

Line::Line(Level level)
: lvl(level), enabled(level != Level::Off && level >= g_level) {}

Line::Line(Line&& other) noexcept
: lvl(other.lvl), enabled(other.enabled), buffer(std::move(other.buffer)) {
    other.enabled = false;
}

Line::~Line() {
    if (!enabled) return;
    const char* tag = "[INFO] ";
    switch (lvl) {
        case Level::Debug: tag = "[DEBUG] "; break;
        case Level::Info: tag = "[INFO] "; break;
        case Level::Warn: tag = "[WARN] "; break;
        case Level::Error: tag = "[ERROR] "; break;
        case Level::Off: return;
    }
    std::ostream& os = sink();
    os << tag << buffer.str() << std::endl;
}

} // namespace log
} // namespace pongsim
