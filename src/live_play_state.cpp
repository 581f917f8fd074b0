#include "scorebook/live_play_state.hpp"
#include "scorebook/errors.hpp"

#include <set>
#include <google/protobuf/util/message_differencer.h>

namespace scorebook {

namespace {

const Lineup& lineup_for(const LivePlayState& state, const std::string& team_id) {
    auto it = state.lineups.find(team_id);
    if (it == state.lineups.end()) {
        throw UnresolvedReferenceError("No lineup for team " + team_id);
    }
    return it->second;
}

} // anonymous namespace

bool LineupSlot::operator==(const LineupSlot& other) const {
    return player_id == other.player_id && batting_order == other.batting_order &&
           google::protobuf::util::MessageDifferencer::Equals(identity, other.identity);
}

const LineupSlot& Lineup::current_batter() const {
    if (slots.empty()) {
        throw SetupError("Lineup for team " + team_id + " is empty");
    }
    return slots[current_index % size()];
}

bool Lineup::contains(const std::string& player_id) const {
    for (const auto& slot : slots) {
        if (slot.player_id == player_id) return true;
    }
    return false;
}

bool Lineup::operator==(const Lineup& other) const {
    return team_id == other.team_id && slots == other.slots && current_index == other.current_index;
}

v1::Lineup Lineup::to_proto() const {
    v1::Lineup proto;
    proto.set_team_id(team_id);
    proto.set_current_index(current_index);
    for (const auto& slot : slots) {
        auto* out = proto.add_slots();
        out->set_player_id(slot.player_id);
        *out->mutable_identity() = slot.identity;
        out->set_batting_order(slot.batting_order);
    }
    return proto;
}

void TeamTotals::credit_runs(int inning, int runs_scored) {
    runs += runs_scored;
    inning_runs[inning] += runs_scored;
}

bool TeamTotals::operator==(const TeamTotals& other) const {
    return runs == other.runs && hits == other.hits && errors == other.errors &&
           inning_runs == other.inning_runs;
}

v1::TeamTotals TeamTotals::to_proto() const {
    v1::TeamTotals proto;
    proto.set_runs(runs);
    proto.set_hits(hits);
    proto.set_errors(errors);
    for (const auto& [inning, inning_total] : inning_runs) {
        (*proto.mutable_inning_runs())[inning] = inning_total;
    }
    return proto;
}

const Lineup& LivePlayState::offense_lineup() const {
    return lineup_for(*this, offense_team_id);
}

const Lineup& LivePlayState::defense_lineup() const {
    return lineup_for(*this, defense_team_id);
}

int LivePlayState::total_runs() const {
    int total = 0;
    for (const auto& [team_id, totals] : scoreboard) {
        total += totals.runs;
    }
    return total;
}

std::vector<v1::PlayerIdentity> LivePlayState::roster() const {
    std::vector<v1::PlayerIdentity> players;
    for (const auto& team_id : team_order) {
        auto it = lineups.find(team_id);
        if (it == lineups.end()) continue;
        for (const auto& slot : it->second.slots) {
            players.push_back(slot.identity);
        }
    }
    return players;
}

bool LivePlayState::operator==(const LivePlayState& other) const {
    return game_id == other.game_id && mode == other.mode && league_id == other.league_id &&
           team_labels == other.team_labels && team_order == other.team_order &&
           inning == other.inning && half == other.half && outs == other.outs &&
           strikes == other.strikes && offense_team_id == other.offense_team_id &&
           defense_team_id == other.defense_team_id && bases == other.bases &&
           scoreboard == other.scoreboard && lineups == other.lineups &&
           planned_innings == other.planned_innings && is_complete == other.is_complete;
}

v1::LivePlayState LivePlayState::to_proto() const {
    v1::LivePlayState proto;
    proto.set_game_id(game_id);
    proto.set_mode(mode);
    proto.set_league_id(league_id);
    for (const auto& [team_id, label] : team_labels) {
        (*proto.mutable_team_labels())[team_id] = label;
    }
    for (const auto& team_id : team_order) {
        proto.add_team_order(team_id);
    }
    proto.set_inning(inning);
    proto.set_half(half);
    proto.set_outs(outs);
    proto.set_strikes(strikes);
    proto.set_offense_team_id(offense_team_id);
    proto.set_defense_team_id(defense_team_id);
    *proto.mutable_bases() = bases.to_proto();
    for (const auto& [team_id, totals] : scoreboard) {
        (*proto.mutable_scoreboard())[team_id] = totals.to_proto();
    }
    for (const auto& [team_id, lineup] : lineups) {
        (*proto.mutable_lineups())[team_id] = lineup.to_proto();
    }
    proto.set_planned_innings(planned_innings);
    proto.set_is_complete(is_complete);
    return proto;
}

LivePlayState LivePlayState::initial(const v1::GameSetup& setup, const std::string& game_id,
                                     int default_planned_innings) {
    if (game_id.empty()) {
        throw SetupError("game_id must not be empty");
    }
    if (setup.teams_size() != 2) {
        throw SetupError("A game needs exactly two teams, got " + std::to_string(setup.teams_size()));
    }
    if (setup.planned_innings() < 0) {
        throw SetupError("planned_innings must not be negative");
    }

    LivePlayState state;
    state.game_id = game_id;
    state.mode = setup.mode() == v1::GAME_MODE_UNSPECIFIED ? v1::GAME_MODE_FRIENDLY : setup.mode();
    state.league_id = setup.league_id();
    state.planned_innings = setup.planned_innings() > 0 ? setup.planned_innings() : default_planned_innings;

    std::set<std::string> seen_players;
    for (const auto& team : setup.teams()) {
        if (team.team_id().empty()) {
            throw SetupError("team_id must not be empty");
        }
        if (state.lineups.count(team.team_id()) > 0) {
            throw SetupError("Duplicate team " + team.team_id());
        }
        if (team.players_size() == 0) {
            throw SetupError("Team " + team.team_id() + " has no players");
        }

        Lineup lineup;
        lineup.team_id = team.team_id();
        for (int i = 0; i < team.players_size(); ++i) {
            const auto& player = team.players(i);
            if (player.id().empty()) {
                throw SetupError("Player id must not be empty on team " + team.team_id());
            }
            if (!seen_players.insert(player.id()).second) {
                throw SetupError("Player " + player.id() + " appears more than once");
            }

            LineupSlot slot;
            slot.player_id = player.id();
            slot.identity = player;
            slot.identity.set_team_id(team.team_id());
            slot.batting_order = i + 1;
            lineup.slots.push_back(std::move(slot));
        }

        state.team_order.push_back(team.team_id());
        state.team_labels[team.team_id()] = team.label().empty() ? team.team_id() : team.label();
        state.scoreboard[team.team_id()] = TeamTotals{};
        state.lineups[team.team_id()] = std::move(lineup);
    }

    state.offense_team_id = state.team_order[0];
    state.defense_team_id = state.team_order[1];
    return state;
}

} // namespace scorebook
