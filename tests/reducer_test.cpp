#include <gtest/gtest.h>
#include "scorebook/errors.hpp"
#include "scorebook/helpers.hpp"
#include "scorebook/reducer.hpp"
#include "test_support.hpp"

using namespace scorebook;

class ReducerTest : public ::testing::Test {
protected:
    LivePlayState state_ = LivePlayState::initial(fixtures::red_vs_blue(), "g1");

    /// Apply a sequence of actions, keeping only the final state.
    LivePlayState play(LivePlayState state, const std::vector<v1::ScoringAction>& actions) {
        for (const auto& action : actions) {
            state = reduce(state, action).state;
        }
        return state;
    }
};

// =============================================================================
// Hit Tests
// =============================================================================

TEST_F(ReducerTest, Hit_Single_ShouldRecordEventAndAdvanceBatter) {
    auto result = reduce(state_, fixtures::hit(v1::HIT_KIND_SINGLE));

    EXPECT_EQ(result.event.event_type(), v1::EVENT_KIND_SINGLE);
    EXPECT_EQ(result.event.batter_id(), "r1");
    EXPECT_EQ(result.event.base_state_after().first(), "r1");
    EXPECT_EQ(result.state.current_batter().player_id, "r2");
    EXPECT_EQ(result.state.scoreboard.at("red").hits, 1);
    EXPECT_EQ(result.state.scoreboard.at("red").runs, 0);
}

TEST_F(ReducerTest, Hit_Homerun_ShouldCreditRunsToInning) {
    auto state = play(state_, {fixtures::hit(v1::HIT_KIND_SINGLE)});

    auto result = reduce(state, fixtures::hit(v1::HIT_KIND_HOMERUN));

    EXPECT_EQ(result.event.runs_scored(), 2);
    EXPECT_EQ(result.event.rbi(), 2);
    EXPECT_EQ(result.state.scoreboard.at("red").runs, 2);
    EXPECT_EQ(result.state.scoreboard.at("red").inning_runs.at(1), 2);
    EXPECT_TRUE(result.state.bases.empty());
}

TEST_F(ReducerTest, Hit_ShouldResetStrikeCount) {
    auto state = play(state_, {fixtures::strike(), fixtures::strike()});

    auto result = reduce(state, fixtures::hit(v1::HIT_KIND_DOUBLE));

    EXPECT_EQ(result.state.strikes, 0);
}

TEST_F(ReducerTest, Hit_WithoutKind_ShouldThrowInvalidArgument) {
    v1::ScoringAction action;
    action.mutable_hit();

    try {
        reduce(state_, action);
        FAIL() << "expected InvalidActionError";
    } catch (const InvalidActionError& e) {
        EXPECT_EQ(e.status_code(), grpc::StatusCode::INVALID_ARGUMENT);
    }
}

// =============================================================================
// Strike Tests
// =============================================================================

TEST_F(ReducerTest, Strike_BelowThree_ShouldLogStrikeAndCount) {
    auto result = reduce(state_, fixtures::strike());

    EXPECT_EQ(result.event.event_type(), v1::EVENT_KIND_STRIKE);
    EXPECT_EQ(result.state.strikes, 1);
    EXPECT_EQ(result.state.outs, 0);
    EXPECT_EQ(result.state.current_batter().player_id, "r1");
}

TEST_F(ReducerTest, Strike_Third_ShouldRecordStrikeoutAndOut) {
    auto state = play(state_, {fixtures::strike(), fixtures::strike()});

    auto result = reduce(state, fixtures::strike());

    EXPECT_EQ(result.event.event_type(), v1::EVENT_KIND_STRIKEOUT);
    EXPECT_EQ(result.event.batter_id(), "r1");
    EXPECT_EQ(result.state.outs, 1);
    EXPECT_EQ(result.state.strikes, 0);
    EXPECT_EQ(result.state.current_batter().player_id, "r2");
}

// =============================================================================
// Error Tests
// =============================================================================

TEST_F(ReducerTest, Error_ShouldChargeDefenseAndCountAsStrike) {
    auto result = reduce(state_, fixtures::error("b2"));

    EXPECT_EQ(result.event.event_type(), v1::EVENT_KIND_ERROR);
    EXPECT_EQ(result.event.defender_id(), "b2");
    EXPECT_EQ(result.state.scoreboard.at("blue").errors, 1);
    EXPECT_EQ(result.state.strikes, 1);
}

TEST_F(ReducerTest, Error_OnTwoStrikes_ShouldRetireBatter) {
    auto state = play(state_, {fixtures::strike(), fixtures::strike()});

    auto result = reduce(state, fixtures::error("b1"));

    EXPECT_EQ(result.state.outs, 1);
    EXPECT_EQ(result.state.strikes, 0);
    EXPECT_EQ(result.state.current_batter().player_id, "r2");
}

TEST_F(ReducerTest, Error_ByOffensivePlayer_ShouldBeRejected) {
    EXPECT_THROW(reduce(state_, fixtures::error("r2")), InvalidActionError);
}

TEST_F(ReducerTest, Error_WithoutDefender_ShouldBeRejected) {
    EXPECT_THROW(reduce(state_, fixtures::error("")), InvalidActionError);
}

// =============================================================================
// Caught Out Tests
// =============================================================================

TEST_F(ReducerTest, CaughtOut_ShouldRecordOutAndCreditDefender) {
    auto state = play(state_, {fixtures::strike()});

    auto result = reduce(state, fixtures::caught_out("b3"));

    EXPECT_EQ(result.event.event_type(), v1::EVENT_KIND_CAUGHT_OUT);
    EXPECT_EQ(result.event.defender_id(), "b3");
    EXPECT_EQ(result.state.outs, 1);
    EXPECT_EQ(result.state.strikes, 0);
    EXPECT_EQ(result.state.current_batter().player_id, "r2");
}

TEST_F(ReducerTest, CaughtOut_ThirdOut_ShouldRotateSides) {
    auto state = play(state_, {fixtures::caught_out("b1"), fixtures::caught_out("b2")});

    auto result = reduce(state, fixtures::caught_out("b3"));

    EXPECT_EQ(result.state.half, v1::HALF_BOTTOM);
    EXPECT_EQ(result.state.offense_team_id, "blue");
    EXPECT_EQ(result.state.outs, 0);
    // The event is stamped with the half it happened in.
    EXPECT_EQ(result.event.half(), v1::HALF_TOP);
}

// =============================================================================
// Steal Tests
// =============================================================================

TEST_F(ReducerTest, Steal_WithEmptyBases_ShouldBeRejected) {
    EXPECT_THROW(reduce(state_, fixtures::steal("r1", true)), InvalidActionError);
}

TEST_F(ReducerTest, Steal_RunnerNotOnBase_ShouldBeRejected) {
    auto state = play(state_, {fixtures::hit(v1::HIT_KIND_SINGLE)});

    EXPECT_THROW(reduce(state, fixtures::steal("r3", true)), InvalidActionError);
}

TEST_F(ReducerTest, Steal_WithDefenderFromBattingTeam_ShouldBeRejected) {
    auto state = play(state_, {fixtures::hit(v1::HIT_KIND_SINGLE)});

    EXPECT_THROW(reduce(state, fixtures::steal("r1", true, "r2")), InvalidActionError);
}

TEST_F(ReducerTest, Steal_SuccessFromThird_ShouldScoreWithRbi) {
    auto state = play(state_, {fixtures::hit(v1::HIT_KIND_TRIPLE)});

    auto result = reduce(state, fixtures::steal("r1", true, "b2"));

    EXPECT_EQ(result.event.event_type(), v1::EVENT_KIND_STEAL_SUCCESS);
    EXPECT_EQ(result.event.runner_id(), "r1");
    EXPECT_EQ(result.event.defender_id(), "b2");
    EXPECT_EQ(result.event.runs_scored(), 1);
    EXPECT_EQ(result.event.rbi(), 1);
    EXPECT_EQ(result.state.scoreboard.at("red").runs, 1);
    EXPECT_TRUE(result.state.bases.empty());
}

TEST_F(ReducerTest, Steal_Failure_ShouldRecordOutWithoutAdvancingBatter) {
    auto state = play(state_, {fixtures::hit(v1::HIT_KIND_SINGLE)});

    auto result = reduce(state, fixtures::steal("r1", false));

    EXPECT_EQ(result.event.event_type(), v1::EVENT_KIND_STEAL_FAIL);
    EXPECT_FALSE(result.event.has_defender_id());
    EXPECT_EQ(result.event.rbi(), 0);
    EXPECT_EQ(result.state.outs, 1);
    EXPECT_TRUE(result.state.bases.empty());
    EXPECT_EQ(result.state.current_batter().player_id, "r2");
}

// =============================================================================
// Dispatch Tests
// =============================================================================

TEST_F(ReducerTest, Reduce_EmptyAction_ShouldThrowInvalidArgument) {
    v1::ScoringAction action;

    EXPECT_THROW(reduce(state_, action), InvalidActionError);
}

TEST_F(ReducerTest, Reduce_OnCompletedGame_ShouldBeRejected) {
    state_.is_complete = true;

    EXPECT_THROW(reduce(state_, fixtures::strike()), InvalidActionError);
}

TEST_F(ReducerTest, Reduce_RejectedAction_ShouldLeaveInputStateUnchanged) {
    auto before = state_;

    EXPECT_THROW(reduce(state_, fixtures::steal("r1", true)), InvalidActionError);
    EXPECT_EQ(state_, before);
}

TEST_F(ReducerTest, Reduce_HitWithoutKind_ShouldThrowInvalidArgument) {
    try {
        reduce(state_, fixtures::hit(v1::HIT_KIND_UNSPECIFIED));
        FAIL() << "expected InvalidActionError";
    } catch (const InvalidActionError& e) {
        EXPECT_EQ(e.status_code(), grpc::StatusCode::INVALID_ARGUMENT);
    }
}

TEST_F(ReducerTest, ActionFromEvent_UnspecifiedOrUnknownKind_ShouldThrowReplayError) {
    v1::GameEvent event;
    event.set_game_id("g1");

    EXPECT_THROW(action_from_event(event), ReplayError);

    event.set_event_type(static_cast<v1::EventKind>(42));
    EXPECT_THROW(action_from_event(event), ReplayError);
}

TEST_F(ReducerTest, ActionFromEvent_ShouldRecoverOriginalAction) {
    auto state = play(state_, {fixtures::hit(v1::HIT_KIND_SINGLE)});
    auto result = reduce(state, fixtures::steal("r1", true, "b1"));

    auto action = action_from_event(result.event);

    ASSERT_TRUE(action.has_steal());
    EXPECT_EQ(action.steal().runner_id(), "r1");
    EXPECT_EQ(action.steal().defender_id(), "b1");
    EXPECT_TRUE(action.steal().success());
}

// =============================================================================
// Replay Tests
// =============================================================================

TEST_F(ReducerTest, Replay_ShouldReproduceIncrementalState) {
    std::vector<v1::ScoringAction> actions = {
        fixtures::hit(v1::HIT_KIND_DOUBLE), fixtures::strike(), fixtures::error("b1"),
        fixtures::steal("r1", true, "b3"), fixtures::hit(v1::HIT_KIND_SINGLE),
        fixtures::caught_out("b2"), fixtures::strike(), fixtures::strike(), fixtures::strike()};

    LivePlayState state = state_;
    std::vector<v1::GameEvent> events;
    for (const auto& action : actions) {
        auto result = reduce(state, action);
        events.push_back(result.event);
        state = result.state;
    }

    EXPECT_EQ(replay(state_, events), state);
}

TEST_F(ReducerTest, Replay_WithTamperedEvent_ShouldThrowReplayError) {
    auto result = reduce(state_, fixtures::hit(v1::HIT_KIND_SINGLE));
    result.event.set_runs_scored(3);

    EXPECT_THROW(replay(state_, {result.event}), ReplayError);
}

TEST_F(ReducerTest, Replay_WithEventFromOtherGame_ShouldThrowReplayError) {
    auto result = reduce(state_, fixtures::strike());
    result.event.set_game_id("other");

    EXPECT_THROW(replay(state_, {result.event}), ReplayError);
}

TEST_F(ReducerTest, Replay_WithImpossibleEvent_ShouldThrowReplayError) {
    auto event = fixtures::event("g1", v1::EVENT_KIND_STEAL_SUCCESS, "r1", "", "r1");

    EXPECT_THROW(replay(state_, {event}), ReplayError);
}
