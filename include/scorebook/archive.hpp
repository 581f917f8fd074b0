#pragma once

#include <string>
#include "scorebook/v1/game.pb.h"

namespace scorebook {

/**
 * Writes completed games to a directory as `<game_id>.json`, one file per
 * game, using the protobuf JSON mapping.
 */
class GameArchive {
public:
    explicit GameArchive(std::string directory);

    const std::string& directory() const { return directory_; }

    /// Path the record for `game_id` is stored under.
    std::string path_for(const std::string& game_id) const;

    /// Write (or overwrite) the record; returns the file path. Throws ArchiveError.
    std::string store(const v1::GameRecord& record) const;

    /// Read a stored record back. Throws ArchiveError.
    v1::GameRecord load(const std::string& game_id) const;

private:
    std::string directory_;
};

/// JSON form of a game record. Throws ArchiveError.
std::string record_to_json(const v1::GameRecord& record);

/// Parse a game record from its JSON form. Throws ArchiveError.
v1::GameRecord record_from_json(const std::string& json);

} // namespace scorebook
