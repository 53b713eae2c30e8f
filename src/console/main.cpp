/**
 * @file console/main.cpp
 * @brief Entry point for the terminal version of PongSim
 */

#include <exception>
#include <fstream>
#include <iostream>
#include <string>

#include "config/settings.h"
#include "console/game.h"
#include "core/game_core.h"
#include "core/log.h"
#include "platform/platform.h"

int main(int argc, char** argv) {
    using namespace pongsim;

    const std::string config_path = argc > 1 ? argv[1] : "pongsim.json";

    // Log lines would tear the drawn frame; send them to a file instead
    std::ofstream log_file("pongsim.log", std::ios::app);
    if (log_file) log::set_sink(&log_file);
    else std::cerr << "[WARN] Could not open pongsim.log, logging to stderr\n";

    try {
        SettingsManager settings;
        GameConfig config = settings.load(config_path);
        log::set_level(config.log_level);

        GameCore core(config);
        auto plat = createPlatform();
        if (!plat) {
            std::cerr << "Failed to create platform abstraction\n";
            log::set_sink(&std::cerr);
            return 1;
        }

        Game g(78, 20, *plat, core);
        int rc = g.run();
        log::set_sink(&std::cerr);
        return rc;
    } catch (const std::exception& e) {
        log::set_sink(&std::cerr);
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
