#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <grpcpp/grpcpp.h>

#include "scorebook/scorebook.hpp"
#include "scorebook/v1/scorekeeper.grpc.pb.h"

namespace {

constexpr const char* SERVER_DOMAIN = "scorekeeper";

/// gRPC front-end holding the one game in progress.
class ScorekeeperService final : public scorebook::v1::Scorekeeper::Service {
public:
    explicit ScorekeeperService(scorebook::ServerConfig config)
        : config_(std::move(config)) {
        if (!config_.archive_dir.empty()) {
            archive_.emplace(config_.archive_dir);
        }
    }

    grpc::Status StartGame(
        grpc::ServerContext* context,
        const scorebook::v1::GameSetup* request,
        scorebook::v1::LivePlayState* response) override {

        return guarded("StartGame", [&] {
            std::lock_guard<std::mutex> lock(mutex_);
            if (engine_ && !engine_->is_complete()) {
                throw scorebook::InvalidActionError::precondition_failed(
                    "Game " + engine_->game_id() + " is still in progress");
            }
            engine_.emplace(scorebook::GameEngine::start(*request, config_.engine_options()));
            *response = engine_->state().to_proto();
        });
    }

    grpc::Status Apply(
        grpc::ServerContext* context,
        const scorebook::v1::ScoringAction* request,
        scorebook::v1::GameEvent* response) override {

        return guarded("Apply", [&] {
            std::lock_guard<std::mutex> lock(mutex_);
            *response = live_engine().apply(*request);
        });
    }

    grpc::Status UndoLast(
        grpc::ServerContext* context,
        const scorebook::v1::UndoRequest* request,
        scorebook::v1::UndoResponse* response) override {

        return guarded("UndoLast", [&] {
            std::lock_guard<std::mutex> lock(mutex_);
            auto& engine = live_engine();
            response->set_undone(engine.undo_last());
            *response->mutable_state() = engine.state().to_proto();
        });
    }

    grpc::Status GetState(
        grpc::ServerContext* context,
        const scorebook::v1::GetStateRequest* request,
        scorebook::v1::LivePlayState* response) override {

        return guarded("GetState", [&] {
            std::lock_guard<std::mutex> lock(mutex_);
            *response = live_engine().state().to_proto();
        });
    }

    grpc::Status RecentPlays(
        grpc::ServerContext* context,
        const scorebook::v1::RecentPlaysRequest* request,
        scorebook::v1::RecentPlaysResponse* response) override {

        return guarded("RecentPlays", [&] {
            if (request->limit() < 0) {
                throw scorebook::InvalidActionError::invalid_argument("limit must not be negative");
            }
            std::lock_guard<std::mutex> lock(mutex_);
            auto& engine = live_engine();
            auto events = request->limit() == 0
                ? engine.recent_plays()
                : engine.recent_plays(static_cast<std::size_t>(request->limit()));
            for (auto& event : events) {
                *response->add_events() = std::move(event);
            }
        });
    }

    grpc::Status CompleteGame(
        grpc::ServerContext* context,
        const scorebook::v1::CompleteGameRequest* request,
        scorebook::v1::GameRecord* response) override {

        return guarded("CompleteGame", [&] {
            std::lock_guard<std::mutex> lock(mutex_);
            *response = live_engine().complete_game();
            engine_.reset();
            // Handoff happens after the engine is done with the game. The caller
            // still receives the record when the archive write fails.
            if (archive_) {
                try {
                    archive_->store(*response);
                } catch (const scorebook::ArchiveError& e) {
                    scorebook::log_error(SERVER_DOMAIN, "archive_failed",
                                         {{"game_id", response->game().id()}, {"error", e.what()}});
                }
            }
        });
    }

    grpc::Status Aggregate(
        grpc::ServerContext* context,
        const scorebook::v1::AggregateRequest* request,
        scorebook::v1::AggregateResponse* response) override {

        return guarded("Aggregate", [&] {
            auto input = collect(*request);
            auto result = scorebook::aggregate(input.events, input.games, input.players,
                                               request->scope(), request->sort_key());
            for (auto& row : result.rows) {
                *response->add_rows() = std::move(row);
            }
            response->set_skipped_events(result.skipped_events);
        });
    }

    grpc::Status AggregateTeams(
        grpc::ServerContext* context,
        const scorebook::v1::AggregateRequest* request,
        scorebook::v1::TeamAggregateResponse* response) override {

        return guarded("AggregateTeams", [&] {
            auto input = collect(*request);
            auto result = scorebook::aggregate_teams(input.events, input.games, input.players,
                                                     request->scope());
            for (auto& row : result.rows) {
                *response->add_rows() = std::move(row);
            }
            response->set_skipped_events(result.skipped_events);
        });
    }

private:
    struct AggregateInput {
        std::vector<scorebook::v1::GameEvent> events;
        std::vector<scorebook::v1::GameInfo> games;
        std::vector<scorebook::v1::PlayerIdentity> players;
    };

    AggregateInput collect(const scorebook::v1::AggregateRequest& request) {
        AggregateInput input;
        input.events.assign(request.events().begin(), request.events().end());
        input.games.assign(request.games().begin(), request.games().end());
        input.players.assign(request.players().begin(), request.players().end());

        if (request.include_live_game()) {
            std::lock_guard<std::mutex> lock(mutex_);
            const auto& engine = live_engine();
            const auto& live_events = engine.log().events();
            input.events.insert(input.events.end(), live_events.begin(), live_events.end());
            input.games.push_back(engine.game_info());
            auto roster = engine.state().roster();
            input.players.insert(input.players.end(), roster.begin(), roster.end());
        }
        return input;
    }

    scorebook::GameEngine& live_engine() {
        if (!engine_) {
            throw scorebook::InvalidActionError::precondition_failed("No game in progress");
        }
        return *engine_;
    }

    template <typename Fn>
    grpc::Status guarded(const std::string& rpc, Fn&& fn) {
        try {
            fn();
            scorebook::log_info(SERVER_DOMAIN, "rpc_handled", {{"rpc", rpc}});
            return grpc::Status::OK;
        } catch (const scorebook::ScorebookError& e) {
            scorebook::log_warn(SERVER_DOMAIN, "rpc_rejected",
                                {{"rpc", rpc},
                                 {"code", static_cast<int>(e.status_code())},
                                 {"error", e.what()}});
            return e.to_grpc_status();
        } catch (const std::exception& e) {
            scorebook::log_error(SERVER_DOMAIN, "rpc_failed", {{"rpc", rpc}, {"error", e.what()}});
            return grpc::Status(grpc::StatusCode::INTERNAL, e.what());
        }
    }

    scorebook::ServerConfig config_;
    std::optional<scorebook::GameArchive> archive_;
    std::mutex mutex_;
    std::optional<scorebook::GameEngine> engine_;
};

} // anonymous namespace

int main(int argc, char** argv) {
    scorebook::ServerConfig config;
    try {
        config = scorebook::ServerConfig::load(argc, argv);
    } catch (const scorebook::SetupError& e) {
        scorebook::log_error(SERVER_DOMAIN, "invalid_configuration", {{"error", e.what()}});
        return 1;
    }

    std::string server_address = config.server_address();
    ScorekeeperService service(config);

    grpc::ServerBuilder builder;
    builder.AddListeningPort(server_address, grpc::InsecureServerCredentials());
    builder.RegisterService(&service);

    std::unique_ptr<grpc::Server> server(builder.BuildAndStart());
    if (!server) {
        scorebook::log_error(SERVER_DOMAIN, "server_start_failed", {{"address", server_address}});
        return 1;
    }
    scorebook::log_info(SERVER_DOMAIN, "scorekeeper_server_started",
                        {{"address", server_address},
                         {"archive_dir", config.archive_dir},
                         {"default_planned_innings", config.default_planned_innings}});

    server->Wait();
    return 0;
}
