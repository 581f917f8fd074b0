#include "scorebook/config.hpp"
#include "scorebook/errors.hpp"

#include <cstdlib>

namespace scorebook {

namespace {

constexpr int kMaxPort = 65535;
constexpr int kMaxPlannedInnings = 99;
constexpr int kMaxRecentPlays = 1000;

int parse_int(const std::string& text, const std::string& name, int low, int high) {
    std::size_t consumed = 0;
    int value = 0;
    try {
        value = std::stoi(text, &consumed);
    } catch (const std::exception&) {
        throw SetupError(name + " must be an integer, got '" + text + "'");
    }
    if (consumed != text.size()) {
        throw SetupError(name + " must be an integer, got '" + text + "'");
    }
    if (value < low || value > high) {
        throw SetupError(name + " must be between " + std::to_string(low) + " and " +
                         std::to_string(high) + ", got " + text);
    }
    return value;
}

bool starts_with(const std::string& arg, const std::string& prefix) {
    return arg.compare(0, prefix.size(), prefix) == 0;
}

} // anonymous namespace

EngineOptions ServerConfig::engine_options() const {
    EngineOptions options;
    options.default_planned_innings = default_planned_innings;
    options.recent_plays = recent_plays;
    return options;
}

ServerConfig ServerConfig::load(int argc, char** argv) {
    ServerConfig config;

    if (const char* env_port = std::getenv("PORT")) {
        config.port = parse_int(env_port, "PORT", 1, kMaxPort);
    }
    if (const char* env_archive = std::getenv("SCOREBOOK_ARCHIVE_DIR")) {
        config.archive_dir = env_archive;
    }
    if (const char* env_innings = std::getenv("SCOREBOOK_PLANNED_INNINGS")) {
        config.default_planned_innings =
            parse_int(env_innings, "SCOREBOOK_PLANNED_INNINGS", 1, kMaxPlannedInnings);
    }
    if (const char* env_recent = std::getenv("SCOREBOOK_RECENT_PLAYS")) {
        config.recent_plays = parse_int(env_recent, "SCOREBOOK_RECENT_PLAYS", 1, kMaxRecentPlays);
    }

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (starts_with(arg, "--port=")) {
            config.port = parse_int(arg.substr(7), "--port", 1, kMaxPort);
        } else if (starts_with(arg, "--archive=")) {
            config.archive_dir = arg.substr(10);
        } else if (starts_with(arg, "--innings=")) {
            config.default_planned_innings = parse_int(arg.substr(10), "--innings", 1, kMaxPlannedInnings);
        } else if (starts_with(arg, "--recent=")) {
            config.recent_plays = parse_int(arg.substr(9), "--recent", 1, kMaxRecentPlays);
        } else if (starts_with(arg, "--")) {
            throw SetupError("Unknown option " + arg);
        } else {
            config.port = parse_int(arg, "port", 1, kMaxPort);
        }
    }
    return config;
}

} // namespace scorebook
