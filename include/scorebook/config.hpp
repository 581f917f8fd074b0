#pragma once

#include <cstddef>
#include <string>
#include "scorebook/game_engine.hpp"

namespace scorebook {

constexpr int DEFAULT_PORT = 50600;

/**
 * Scorekeeper server settings.
 *
 * Read from the environment (PORT, SCOREBOOK_ARCHIVE_DIR,
 * SCOREBOOK_PLANNED_INNINGS, SCOREBOOK_RECENT_PLAYS), then overridden by
 * --port=, --archive=, --innings= and --recent= arguments. A bare argument is
 * taken as the port.
 */
struct ServerConfig {
    int port = DEFAULT_PORT;
    /// Completed games are written here as JSON. Empty disables archiving.
    std::string archive_dir;
    int default_planned_innings = 1;
    std::size_t recent_plays = 6;

    std::string server_address() const { return "0.0.0.0:" + std::to_string(port); }
    EngineOptions engine_options() const;

    /// Throws SetupError on a malformed or out-of-range value.
    static ServerConfig load(int argc, char** argv);
};

} // namespace scorebook
