#include "scorebook/stats.hpp"
#include "scorebook/helpers.hpp"
#include "scorebook/logging.hpp"

#include <algorithm>
#include <cctype>
#include <functional>
#include <optional>
#include <set>

namespace scorebook {

namespace {

constexpr const char* kDomain = "stats";
constexpr int kTopPerformers = 3;

std::string lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

double rate(int numerator, int denominator) {
    return denominator == 0 ? 0.0 : static_cast<double>(numerator) / denominator;
}

/// Resolves a scope against the supplied games.
class ScopeFilter {
public:
    ScopeFilter(const v1::StatScope& scope, const std::vector<v1::GameInfo>& games)
        : scope_(scope) {
        if (scope_.kind() == v1::SCOPE_KIND_UNSPECIFIED) {
            scope_.set_kind(v1::SCOPE_KIND_OVERALL);
        }
        for (const auto& game : games) {
            games_[game.id()] = &game;
        }
        if (scope_.kind() == v1::SCOPE_KIND_YEAR && scope_.year() == 0) {
            scope_.set_year(most_recent_year(games));
        }
    }

    const v1::StatScope& scope() const { return scope_; }

    const v1::GameInfo* find_game(const std::string& game_id) const {
        auto it = games_.find(game_id);
        return it == games_.end() ? nullptr : it->second;
    }

    bool includes(const v1::GameInfo& game) const {
        switch (scope_.kind()) {
            case v1::SCOPE_KIND_GAME:
                return game.id() == scope_.game_id();
            case v1::SCOPE_KIND_YEAR:
                return helpers::utc_year(game.start_time()) == scope_.year();
            case v1::SCOPE_KIND_LEAGUE:
                return game.mode() == v1::GAME_MODE_LEAGUE &&
                       (scope_.league_id().empty() || game.league_id() == scope_.league_id());
            default:
                return true;
        }
    }

    /// Games in scope, in the order they were supplied.
    std::vector<const v1::GameInfo*> scoped_games(const std::vector<v1::GameInfo>& games) const {
        std::vector<const v1::GameInfo*> result;
        for (const auto& game : games) {
            if (includes(game)) result.push_back(&game);
        }
        return result;
    }

private:
    static int most_recent_year(const std::vector<v1::GameInfo>& games) {
        if (games.empty()) {
            return helpers::utc_year(helpers::now());
        }
        int year = helpers::utc_year(games.front().start_time());
        for (const auto& game : games) {
            year = std::max(year, helpers::utc_year(game.start_time()));
        }
        return year;
    }

    v1::StatScope scope_;
    std::map<std::string, const v1::GameInfo*> games_;
};

/// Folds scoring events into counting stats keyed by whatever `key_for` returns.
class StatsProjector {
public:
    using KeyFn = std::function<std::optional<std::string>(const std::string& player_id)>;

    explicit StatsProjector(KeyFn key_for) : key_for_(std::move(key_for)) {}

    void handle_event(const v1::GameEvent& event) {
        auto* batter = touch(event.batter_id(), event.game_id());

        switch (event.event_type()) {
            case v1::EVENT_KIND_SINGLE:
            case v1::EVENT_KIND_DOUBLE:
            case v1::EVENT_KIND_TRIPLE:
            case v1::EVENT_KIND_HOMERUN:
                if (batter) credit_hit(*batter, event);
                break;
            case v1::EVENT_KIND_STRIKEOUT:
                if (batter) {
                    batter->set_at_bats(batter->at_bats() + 1);
                    batter->set_strikeouts(batter->strikeouts() + 1);
                }
                break;
            case v1::EVENT_KIND_CAUGHT_OUT:
                if (batter) batter->set_at_bats(batter->at_bats() + 1);
                if (auto* defender = touch(event.defender_id(), event.game_id())) {
                    defender->set_catches(defender->catches() + 1);
                }
                break;
            case v1::EVENT_KIND_ERROR:
                if (auto* defender = touch(event.defender_id(), event.game_id())) {
                    defender->set_errors(defender->errors() + 1);
                }
                break;
            case v1::EVENT_KIND_STEAL_SUCCESS:
            case v1::EVENT_KIND_STEAL_FAIL:
                credit_steal(event);
                break;
            case v1::EVENT_KIND_STRIKE:
            case v1::EVENT_KIND_UNSPECIFIED:
                // No counting stats.
                break;
        }
    }

    /// Totals per key with games played and rates filled in.
    std::map<std::string, v1::PlayerStats> finish() const {
        auto result = totals_;
        for (auto& [key, stats] : result) {
            auto it = games_.find(key);
            stats.set_games_played(it == games_.end() ? 0 : static_cast<int>(it->second.size()));
            stats.set_batting_average(rate(stats.hits(), stats.at_bats()));
            stats.set_slugging(rate(stats.total_bases(), stats.at_bats()));
        }
        return result;
    }

private:
    v1::PlayerStats* touch(const std::string& player_id, const std::string& game_id) {
        if (player_id.empty()) return nullptr;
        auto key = key_for_(player_id);
        if (!key) return nullptr;
        games_[*key].insert(game_id);
        return &totals_[*key];
    }

    static void credit_hit(v1::PlayerStats& stats, const v1::GameEvent& event) {
        stats.set_at_bats(stats.at_bats() + 1);
        stats.set_hits(stats.hits() + 1);
        stats.set_total_bases(stats.total_bases() + helpers::bases_for(event.event_type()));
        stats.set_rbi(stats.rbi() + event.rbi());
        switch (event.event_type()) {
            case v1::EVENT_KIND_SINGLE: stats.set_singles(stats.singles() + 1); return;
            case v1::EVENT_KIND_DOUBLE: stats.set_doubles(stats.doubles() + 1); return;
            case v1::EVENT_KIND_TRIPLE: stats.set_triples(stats.triples() + 1); return;
            case v1::EVENT_KIND_HOMERUN: stats.set_homeruns(stats.homeruns() + 1); return;
            case v1::EVENT_KIND_UNSPECIFIED:
            case v1::EVENT_KIND_STRIKE:
            case v1::EVENT_KIND_ERROR:
            case v1::EVENT_KIND_STRIKEOUT:
            case v1::EVENT_KIND_CAUGHT_OUT:
            case v1::EVENT_KIND_STEAL_SUCCESS:
            case v1::EVENT_KIND_STEAL_FAIL:
                return;
        }
    }

    void credit_steal(const v1::GameEvent& event) {
        bool success = event.event_type() == v1::EVENT_KIND_STEAL_SUCCESS;
        if (auto* runner = touch(event.runner_id(), event.game_id())) {
            runner->set_steals_attempted(runner->steals_attempted() + 1);
            if (success) {
                runner->set_steals_won(runner->steals_won() + 1);
                runner->set_bases_stolen(runner->bases_stolen() + 1);
                runner->set_rbi(runner->rbi() + event.rbi());
            } else {
                runner->set_steals_lost(runner->steals_lost() + 1);
            }
        }
        if (!event.has_defender_id()) return;
        if (auto* defender = touch(event.defender_id(), event.game_id())) {
            defender->set_bases_defended(defender->bases_defended() + 1);
            if (!success) {
                defender->set_bases_defended_successful(defender->bases_defended_successful() + 1);
            }
        }
    }

    KeyFn key_for_;
    std::map<std::string, v1::PlayerStats> totals_;
    std::map<std::string, std::set<std::string>> games_;
};

/// Player directory keyed by per-game id. Warns once per unknown id.
class PlayerDirectory {
public:
    explicit PlayerDirectory(const std::vector<v1::PlayerIdentity>& players) {
        for (const auto& player : players) {
            players_[player.id()] = &player;
        }
    }

    const v1::PlayerIdentity* find(const std::string& player_id) {
        auto it = players_.find(player_id);
        if (it != players_.end()) return it->second;
        if (warned_.insert(player_id).second) {
            log_warn(kDomain, "unresolved_player", {{"player_id", player_id}});
        }
        return nullptr;
    }

private:
    std::map<std::string, const v1::PlayerIdentity*> players_;
    std::set<std::string> warned_;
};

/// Feed every in-scope event to `fn`; returns the number skipped for an unknown game.
template <typename Fn>
int for_each_scoped_event(const std::vector<v1::GameEvent>& events, const ScopeFilter& filter,
                          Fn&& fn) {
    int skipped = 0;
    std::set<std::string> missing_games;
    for (const auto& event : events) {
        const auto* game = filter.find_game(event.game_id());
        if (!game) {
            ++skipped;
            missing_games.insert(event.game_id());
            continue;
        }
        if (filter.includes(*game)) fn(event);
    }
    if (skipped > 0) {
        log_warn(kDomain, "events_skipped",
                 {{"count", skipped}, {"unknown_games", std::vector<std::string>(
                                                            missing_games.begin(), missing_games.end())}});
    }
    return skipped;
}

std::string merge_key(const v1::PlayerIdentity& player) {
    if (!player.identity_key().empty()) return player.identity_key();
    if (!player.display_name().empty()) return lower(player.display_name());
    return player.id();
}

void copy_counting_stats(const v1::PlayerStats& from, v1::TeamStats& to) {
    to.set_at_bats(from.at_bats());
    to.set_hits(from.hits());
    to.set_singles(from.singles());
    to.set_doubles(from.doubles());
    to.set_triples(from.triples());
    to.set_homeruns(from.homeruns());
    to.set_strikeouts(from.strikeouts());
    to.set_batting_average(from.batting_average());
    to.set_slugging(from.slugging());
    to.set_catches(from.catches());
    to.set_errors(from.errors());
    to.set_steals_attempted(from.steals_attempted());
    to.set_steals_won(from.steals_won());
    to.set_steals_lost(from.steals_lost());
    to.set_bases_defended(from.bases_defended());
    to.set_bases_defended_successful(from.bases_defended_successful());
    to.set_bases_stolen(from.bases_stolen());
}

} // anonymous namespace

v1::StatScope overall_scope() {
    v1::StatScope scope;
    scope.set_kind(v1::SCOPE_KIND_OVERALL);
    return scope;
}

v1::StatScope game_scope(const std::string& game_id) {
    v1::StatScope scope;
    scope.set_kind(v1::SCOPE_KIND_GAME);
    scope.set_game_id(game_id);
    return scope;
}

double stat_value(const v1::PlayerStats& stats, v1::StatKey key) {
    switch (key) {
        case v1::STAT_KEY_GAMES_PLAYED: return stats.games_played();
        case v1::STAT_KEY_AT_BATS: return stats.at_bats();
        case v1::STAT_KEY_HITS: return stats.hits();
        case v1::STAT_KEY_SINGLES: return stats.singles();
        case v1::STAT_KEY_DOUBLES: return stats.doubles();
        case v1::STAT_KEY_TRIPLES: return stats.triples();
        case v1::STAT_KEY_HOMERUNS: return stats.homeruns();
        case v1::STAT_KEY_STRIKEOUTS: return stats.strikeouts();
        case v1::STAT_KEY_BATTING_AVERAGE: return stats.batting_average();
        case v1::STAT_KEY_CATCHES: return stats.catches();
        case v1::STAT_KEY_ERRORS: return stats.errors();
        case v1::STAT_KEY_STEALS_ATTEMPTED: return stats.steals_attempted();
        case v1::STAT_KEY_STEALS_WON: return stats.steals_won();
        case v1::STAT_KEY_STEALS_LOST: return stats.steals_lost();
        case v1::STAT_KEY_BASES_DEFENDED: return stats.bases_defended();
        case v1::STAT_KEY_BASES_DEFENDED_SUCCESSFUL: return stats.bases_defended_successful();
        case v1::STAT_KEY_BASES_STOLEN: return stats.bases_stolen();
        case v1::STAT_KEY_RBI: return stats.rbi();
        case v1::STAT_KEY_TOTAL_BASES: return stats.total_bases();
        case v1::STAT_KEY_SLUGGING:
        default:
            return stats.slugging();
    }
}

AggregateResult aggregate(const std::vector<v1::GameEvent>& events,
                          const std::vector<v1::GameInfo>& games,
                          const std::vector<v1::PlayerIdentity>& players,
                          const v1::StatScope& scope,
                          v1::StatKey sort_key) {
    ScopeFilter filter(scope, games);
    PlayerDirectory directory(players);
    bool single_game = filter.scope().kind() == v1::SCOPE_KIND_GAME;

    // First identity seen for each row key supplies the row's labels.
    std::map<std::string, const v1::PlayerIdentity*> row_identity;
    StatsProjector projector([&](const std::string& player_id) -> std::optional<std::string> {
        const auto* player = directory.find(player_id);
        if (!player) return std::nullopt;
        if (player->is_guest() && !single_game) return std::nullopt;
        std::string key = player->is_guest() ? player->id() : merge_key(*player);
        row_identity.emplace(key, player);
        return key;
    });

    AggregateResult result;
    result.skipped_events = for_each_scoped_event(
        events, filter, [&](const v1::GameEvent& event) { projector.handle_event(event); });

    for (auto& [key, stats] : projector.finish()) {
        const auto* identity = row_identity.at(key);
        v1::PlayerStatsRow row;
        row.set_player_key(key);
        row.set_display_name(identity->display_name());
        row.set_identity_key(identity->is_guest() ? "" : key);
        row.set_team_id(identity->team_id());
        row.set_is_guest(identity->is_guest());
        *row.mutable_stats() = std::move(stats);
        result.rows.push_back(std::move(row));
    }

    std::stable_sort(result.rows.begin(), result.rows.end(),
                     [sort_key](const v1::PlayerStatsRow& a, const v1::PlayerStatsRow& b) {
                         return stat_value(a.stats(), sort_key) > stat_value(b.stats(), sort_key);
                     });
    return result;
}

TeamAggregateResult aggregate_teams(const std::vector<v1::GameEvent>& events,
                                    const std::vector<v1::GameInfo>& games,
                                    const std::vector<v1::PlayerIdentity>& players,
                                    const v1::StatScope& scope) {
    ScopeFilter filter(scope, games);
    PlayerDirectory directory(players);

    StatsProjector projector([&](const std::string& player_id) -> std::optional<std::string> {
        const auto* player = directory.find(player_id);
        if (!player || player->team_id().empty()) return std::nullopt;
        return player->team_id();
    });

    TeamAggregateResult result;
    result.skipped_events = for_each_scoped_event(
        events, filter, [&](const v1::GameEvent& event) { projector.handle_event(event); });
    auto totals = projector.finish();

    struct Record {
        std::string label;
        int games = 0;
        int runs = 0;
        int wins = 0;
        int losses = 0;
    };
    std::map<std::string, Record> records;
    std::vector<std::string> team_ids;

    for (const auto* game : filter.scoped_games(games)) {
        for (const auto& team_id : game->team_order()) {
            auto [it, inserted] = records.emplace(team_id, Record{});
            if (inserted) team_ids.push_back(team_id);
            auto& record = it->second;
            auto label = game->team_labels().find(team_id);
            if (record.label.empty() && label != game->team_labels().end()) {
                record.label = label->second;
            }
            ++record.games;

            if (game->final_score().empty()) continue;
            auto own = game->final_score().find(team_id);
            int runs = own == game->final_score().end() ? 0 : own->second;
            record.runs += runs;

            std::optional<int> best_opponent;
            for (const auto& [other_id, other_runs] : game->final_score()) {
                if (other_id == team_id) continue;
                best_opponent = std::max(best_opponent.value_or(other_runs), other_runs);
            }
            if (!best_opponent) continue;
            if (runs > *best_opponent) ++record.wins;
            if (runs < *best_opponent) ++record.losses;
        }
    }
    for (const auto& [team_id, stats] : totals) {
        if (records.emplace(team_id, Record{}).second) team_ids.push_back(team_id);
    }

    for (const auto& team_id : team_ids) {
        const auto& record = records.at(team_id);
        v1::TeamStatsRow row;
        row.set_team_id(team_id);
        row.set_label(record.label.empty() ? team_id : record.label);
        *row.mutable_scope() = filter.scope();

        auto* stats = row.mutable_stats();
        auto found = totals.find(team_id);
        if (found != totals.end()) copy_counting_stats(found->second, *stats);
        stats->set_games_played(record.games);
        stats->set_average_score(rate(record.runs, record.games));
        stats->set_wins(record.wins);
        stats->set_losses(record.losses);
        result.rows.push_back(std::move(row));
    }

    std::stable_sort(result.rows.begin(), result.rows.end(),
                     [](const v1::TeamStatsRow& a, const v1::TeamStatsRow& b) {
                         return a.stats().slugging() > b.stats().slugging();
                     });
    return result;
}

v1::GameSummary summarize(const v1::GameInfo& game, const LivePlayState& state,
                          const std::vector<v1::GameEvent>& events) {
    v1::GameSummary summary;
    summary.set_game_id(game.id());
    for (const auto& [team_id, totals] : state.scoreboard) {
        (*summary.mutable_final_score())[team_id] = totals.runs;
    }

    int last_inning = 0;
    for (const auto& event : events) {
        last_inning = std::max(last_inning, event.inning());
    }
    auto inning_runs = [&](std::size_t order, int inning) {
        if (order >= state.team_order.size()) return 0;
        auto totals = state.scoreboard.find(state.team_order[order]);
        if (totals == state.scoreboard.end()) return 0;
        auto runs = totals->second.inning_runs.find(inning);
        return runs == totals->second.inning_runs.end() ? 0 : runs->second;
    };
    for (int inning = 1; inning <= last_inning; ++inning) {
        auto* row = summary.add_inning_breakdown();
        row->set_inning(inning);
        row->set_top(inning_runs(0, inning));
        row->set_bottom(inning_runs(1, inning));
    }

    auto leaders = aggregate(events, {game}, state.roster(), game_scope(game.id()), v1::STAT_KEY_SLUGGING);
    for (const auto& row : leaders.rows) {
        if (summary.top_performer_ids_size() >= kTopPerformers) break;
        if (row.stats().at_bats() == 0) continue;
        summary.add_top_performer_ids(row.player_key());
    }
    return summary;
}

} // namespace scorebook
