/**
 * @file settings.h
 * @brief Settings persistence for the game configuration
 *
 * This file defines the SettingsManager class for saving and loading
 * GameConfig in a flat JSON format.
 */

#pragma once

#include <string>

#include "core/game_config.h"

namespace pongsim {

/**
 * @brief Loads and saves GameConfig as a flat JSON object
 *
 * Uses a small tolerant key extractor rather than a full JSON parser: each
 * known key is looked up by name, unknown keys are ignored and missing keys
 * keep their defaults. Values are not validated here; callers run
 * GameConfig::sanitized() (GameCore does so on construction).
 *
 * @code
 * {
 *   "ball_radius": 0.02,
 *   "win_score": 11,
 *   "ai_enabled": false,
 *   "default_difficulty": "medium"
 * }
 * @endcode
 */
class SettingsManager {
public:
    SettingsManager() = default;

    /**
     * @brief Load settings from a JSON file
     *
     * If the file does not exist a new one is written with the defaults
     * and the defaults are returned. A file that cannot be read yields the
     * defaults as well.
     *
     * @param path Path to the settings file
     * @return Loaded or default configuration
     */
    GameConfig load(const std::string& path);

    /**
     * @brief Parse settings from JSON text
     *
     * @param text File contents
     * @return Configuration with every recognised key applied over the defaults
     */
    GameConfig parse(const std::string& text) const;

    /**
     * @brief Save settings to a JSON file
     *
     * @param path Destination path; the file is created or truncated
     * @param c Configuration to write
     * @return true if the file was written, false on error
     */
    bool save(const std::string& path, const GameConfig& c);

    /**
     * @brief Serialize settings to JSON text
     */
    std::string to_json(const GameConfig& c) const;
};

} // namespace pongsim
