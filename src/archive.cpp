#include "scorebook/archive.hpp"
#include "scorebook/errors.hpp"
#include "scorebook/logging.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <google/protobuf/util/json_util.h>

namespace scorebook {

namespace {

constexpr const char* kDomain = "archive";

} // anonymous namespace

std::string record_to_json(const v1::GameRecord& record) {
    google::protobuf::util::JsonPrintOptions options;
    options.add_whitespace = true;
    options.preserve_proto_field_names = true;

    std::string json;
    auto status = google::protobuf::util::MessageToJsonString(record, &json, options);
    if (!status.ok()) {
        throw ArchiveError("Cannot encode game " + record.game().id() + ": " + status.ToString());
    }
    return json;
}

v1::GameRecord record_from_json(const std::string& json) {
    v1::GameRecord record;
    auto status = google::protobuf::util::JsonStringToMessage(json, &record);
    if (!status.ok()) {
        throw ArchiveError("Cannot decode game record: " + status.ToString());
    }
    return record;
}

GameArchive::GameArchive(std::string directory) : directory_(std::move(directory)) {
    if (directory_.empty()) {
        throw SetupError("Archive directory must not be empty");
    }
}

std::string GameArchive::path_for(const std::string& game_id) const {
    return (std::filesystem::path(directory_) / (game_id + ".json")).string();
}

std::string GameArchive::store(const v1::GameRecord& record) const {
    const auto& game_id = record.game().id();
    if (game_id.empty()) {
        throw ArchiveError("Cannot archive a game record without a game id");
    }

    std::error_code ec;
    std::filesystem::create_directories(directory_, ec);
    if (ec) {
        throw ArchiveError("Cannot create archive directory " + directory_ + ": " + ec.message());
    }

    auto path = path_for(game_id);
    std::ofstream out(path, std::ios::trunc);
    if (!out) {
        throw ArchiveError("Cannot open " + path + " for writing");
    }
    out << record_to_json(record);
    out.close();
    if (!out) {
        throw ArchiveError("Failed writing " + path);
    }

    log_info(kDomain, "game_archived", {{"game_id", game_id}, {"path", path}});
    return path;
}

v1::GameRecord GameArchive::load(const std::string& game_id) const {
    auto path = path_for(game_id);
    std::ifstream in(path);
    if (!in) {
        throw ArchiveError("No archived game at " + path);
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    return record_from_json(buffer.str());
}

} // namespace scorebook
