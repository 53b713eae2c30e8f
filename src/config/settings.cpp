/**
 * @file settings.cpp
 * @brief Flat JSON load/save for GameConfig
 */

#include "config/settings.h"

#include <cerrno>
#include <climits>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <iterator>
#include <sstream>

#include "core/log.h"

namespace pongsim {

namespace {

// Position just past `"key":` and any blanks, or npos
size_t value_pos(const std::string& raw, const std::string& key) {
    size_t pos = raw.find("\"" + key + "\"");
    if (pos == std::string::npos) return pos;
    pos = raw.find(':', pos + key.size() + 2);
    if (pos == std::string::npos) return pos;
    pos++;
    while (pos < raw.size() && (raw[pos] == ' ' || raw[pos] == '\t' || raw[pos] == '\n' || raw[pos] == '\r')) pos++;
    return pos < raw.size() ? pos : std::string::npos;
}

void extract_int(const std::string& raw, const std::string& key, int& dst) {
    size_t pos = value_pos(raw, key);
    if (pos == std::string::npos) return;
    const char* begin = raw.c_str() + pos;
    char* end = nullptr;
    errno = 0;
    long val = std::strtol(begin, &end, 10);
    if (end == begin) {
        log::warn() << "Settings key " << key << " is not an integer, keeping " << dst;
        return;
    }
    if (errno == ERANGE || val < INT_MIN || val > INT_MAX) {
        log::warn() << "Settings key " << key << " is out of range, keeping " << dst;
        return;
    }
    dst = static_cast<int>(val);
}

void extract_double(const std::string& raw, const std::string& key, double& dst) {
    size_t pos = value_pos(raw, key);
    if (pos == std::string::npos) return;
    const char* begin = raw.c_str() + pos;
    char* end = nullptr;
    double v = std::strtod(begin, &end);
    if (end == begin) {
        log::warn() << "Settings key " << key << " is not a number, keeping " << dst;
        return;
    }
    dst = v;
}

void extract_bool(const std::string& raw, const std::string& key, bool& dst) {
    size_t pos = value_pos(raw, key);
    if (pos == std::string::npos) return;
    if (raw.compare(pos, 4, "true") == 0 || raw[pos] == '1') dst = true;
    else if (raw.compare(pos, 5, "false") == 0 || raw[pos] == '0') dst = false;
    else log::warn() << "Settings key " << key << " is not a boolean, keeping " << (dst ? "true" : "false");
}

bool extract_string(const std::string& raw, const std::string& key, std::string& dst) {
    size_t pos = value_pos(raw, key);
    if (pos == std::string::npos || raw[pos] != '"') return false;
    size_t end = raw.find('"', pos + 1);
    if (end == std::string::npos) return false;
    dst = raw.substr(pos + 1, end - pos - 1);
    return true;
}

} // namespace

GameConfig SettingsManager::load(const std::string& path) {
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs) {
        log::warn() << "Configuration file " << path << " not found. Creating default configuration.";
        GameConfig defaults;
        if (!save(path, defaults)) {
            log::error() << "Failed to write default configuration to " << path;
        }
        return defaults;
    }
    std::string raw((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
    GameConfig c = parse(raw);
    log::info() << "Configuration file " << path << " loaded successfully.";
    return c;
}

GameConfig SettingsManager::parse(const std::string& raw) const {
    GameConfig s; // defaults

    extract_int(raw, "window_width", s.window_width);
    extract_int(raw, "window_height", s.window_height);

    extract_double(raw, "ball_radius", s.ball_radius);
    extract_double(raw, "ball_initial_speed", s.ball_initial_speed);
    extract_double(raw, "ball_max_speed", s.ball_max_speed);

    extract_double(raw, "paddle_x_length", s.paddle_x_length);
    extract_double(raw, "paddle_y_length", s.paddle_y_length);
    extract_double(raw, "paddle_move_step", s.paddle_move_step);

    extract_int(raw, "speed_increase_interval", s.speed_increase_interval);
    extract_double(raw, "speed_multiplier", s.speed_multiplier);
    extract_int(raw, "win_score", s.win_score);
    extract_int(raw, "sub_steps", s.sub_steps);

    extract_bool(raw, "ai_enabled", s.ai_enabled);
    extract_int(raw, "tick_interval_ms", s.tick_interval_ms);
    extract_bool(raw, "show_menu", s.show_menu);

    std::string text;
    if (extract_string(raw, "default_difficulty", text) && !parse_difficulty(text, s.default_difficulty)) {
        log::warn() << "Unknown difficulty \"" << text << "\", using " << difficulty_name(s.default_difficulty);
    }
    if (extract_string(raw, "log_level", text) && !log::parse_level(text, s.log_level)) {
        log::warn() << "Unknown log level \"" << text << "\", using " << log::level_name(s.log_level);
    }
    return s;
}

std::string SettingsManager::to_json(const GameConfig& s) const {
    std::ostringstream ofs;
    ofs << std::setprecision(17);
    ofs << "{\n";
    ofs << "  \"window_width\": " << s.window_width << ",\n";
    ofs << "  \"window_height\": " << s.window_height << ",\n";
    ofs << "  \"ball_radius\": " << s.ball_radius << ",\n";
    ofs << "  \"ball_initial_speed\": " << s.ball_initial_speed << ",\n";
    ofs << "  \"ball_max_speed\": " << s.ball_max_speed << ",\n";
    ofs << "  \"paddle_x_length\": " << s.paddle_x_length << ",\n";
    ofs << "  \"paddle_y_length\": " << s.paddle_y_length << ",\n";
    ofs << "  \"paddle_move_step\": " << s.paddle_move_step << ",\n";
    ofs << "  \"speed_increase_interval\": " << s.speed_increase_interval << ",\n";
    ofs << "  \"speed_multiplier\": " << s.speed_multiplier << ",\n";
    ofs << "  \"win_score\": " << s.win_score << ",\n";
    ofs << "  \"sub_steps\": " << s.sub_steps << ",\n";
    ofs << "  \"ai_enabled\": " << (s.ai_enabled ? "true" : "false") << ",\n";
    ofs << "  \"default_difficulty\": \"" << difficulty_name(s.default_difficulty) << "\",\n";
    ofs << "  \"tick_interval_ms\": " << s.tick_interval_ms << ",\n";
    ofs << "  \"show_menu\": " << (s.show_menu ? "true" : "false") << ",\n";
    ofs << "  \"log_level\": \"" << log::level_name(s.log_level) << "\"\n";
    ofs << "}\n";
    return ofs.str();
}

bool SettingsManager::save(const std::string& path, const GameConfig& s) {
    std::ofstream ofs(path, std::ios::trunc | std::ios::binary);
    if (!ofs) return false;
    ofs << to_json(s);
    ofs.flush();
    if (!ofs) return false;
    log::info() << "Configuration saved to " << path;
    return true;
}

} // namespace pongsim
