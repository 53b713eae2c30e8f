/**
 * @file log.h
 * @brief Leveled logging for the simulation core and front end
 *
 * Lines are tagged with their level ("[INFO] Ball reset") and written to a
 * configurable sink, std::cerr by default. A line object collects the
 * streamed pieces and emits them when it goes out of scope, so a log call
 * reads like a stream statement:
 *
 * @code
 * pongsim::log::info() << "Player " << n << " scored";
 * @endcode
 *
 * Hot-path tracing (per sub-step positions and collisions) goes through
 * PONGSIM_DBG instead, which compiles to nothing unless the build defines
 * PONGSIM_ENABLE_DEBUG_OUTPUT.
 */

#pragma once

#include <ostream>
#include <sstream>
#include <string>

namespace pongsim {
namespace log {

/**
 * @brief Severity threshold, ordered from most to least verbose
 */
enum class Level {
    Debug = 0,
    Info,
    Warn,
    Error,
    Off
};

/**
 * @brief Set the minimum level that reaches the sink
 */
void set_level(Level level);
Level level();

/**
 * @brief Redirect output
 *
 * @param sink Stream to write to, or nullptr to restore std::cerr.
 *             The caller keeps ownership and must keep it alive while set.
 */
void set_sink(std::ostream* sink);

/**
 * @brief Parse a level name ("debug", "info", "warn", "error", "off")
 *
 * @param name Level name, case-insensitive
 * @param out Receives the parsed level on success
 * @return true if the name was recognised
 */
bool parse_level(const std::string& name, Level& out);
const char* level_name(Level level);

/**
 * @brief One log line, emitted on destruction if its level is enabled
 */
class Line {
public:
    explicit Line(Level level);
    ~Line();

    Line(const Line&) = delete;
    Line& operator=(const Line&) = delete;
    Line(Line&& other) noexcept;

    template<typename T>
    Line& operator<<(const T& value) {
        if (enabled) buffer << value;
        return *this;
    }

private:
    Level lvl;
    bool enabled;
    std::ostringstream buffer;
};

inline Line debug() { return Line(Level::Debug); }
inline Line info() { return Line(Level::Info); }
inline Line warn() { return Line(Level::Warn); }
inline Line error() { return Line(Level::Error); }

/**
 * @brief Sink for compiled-out trace output
 */
struct NullStream {
    template<typename T>
    NullStream& operator<<(T const&) { return *this; }
    NullStream& operator<<(std::ostream& (*)(std::ostream&)) { return *this; }
};

} // namespace log
} // namespace pongsim

#ifndef PONGSIM_ENABLE_DEBUG_OUTPUT
#define PONGSIM_DBG ::pongsim::log::NullStream()
#else
#define PONGSIM_DBG ::pongsim::log::debug()
#endif
