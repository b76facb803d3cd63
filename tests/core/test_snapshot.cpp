/// @file tests/core/test_snapshot.cpp
/// @brief Unit tests for RawSnapshot → MatchSnapshot coercion.

#include <gtest/gtest.h>
#include "inplay/types.hpp"

#include <limits>

using namespace inplay;

static constexpr double NaN = std::numeric_limits<double>::quiet_NaN();
static constexpr double INF = std::numeric_limits<double>::infinity();

TEST(Coerce, AbsentFieldsReadAsZero) {
    const auto s = coerce(RawSnapshot{});
    EXPECT_EQ(s.fixture_id, 0);
    EXPECT_DOUBLE_EQ(s.minute, 0.0);
    EXPECT_EQ(s.home_score, 0);
    EXPECT_DOUBLE_EQ(s.home.shots, 0.0);
    EXPECT_FALSE(s.has_xg);
}

TEST(Coerce, NonFiniteAndNegativeBecomeZero) {
    RawSnapshot raw;
    raw.minute = NaN;
    raw.home.xg = -0.4;
    raw.away.fouls = INF;
    raw.home.corners = -3.0;
    const auto s = coerce(raw);
    EXPECT_DOUBLE_EQ(s.minute, 0.0);
    EXPECT_DOUBLE_EQ(s.home.xg, 0.0);
    EXPECT_DOUBLE_EQ(s.away.fouls, 0.0);
    EXPECT_DOUBLE_EQ(s.home.corners, 0.0);
}

TEST(Coerce, ScoresTruncatedAndPossessionCapped) {
    RawSnapshot raw;
    raw.home_score = 2.7;
    raw.away_score = 1e9;
    raw.home.possession = 140.0;
    const auto s = coerce(raw);
    EXPECT_EQ(s.home_score, 2);
    EXPECT_EQ(s.away_score, 99);
    EXPECT_DOUBLE_EQ(s.home.possession, 100.0);
}

TEST(Coerce, XgPresenceNeedsAFiniteValue) {
    RawSnapshot raw;
    raw.home.xg = NaN;
    EXPECT_FALSE(coerce(raw).has_xg);
    raw.away.xg = 0.0;
    EXPECT_TRUE(coerce(raw).has_xg);
}

TEST(Coerce, NonFiniteEventsDropped) {
    RawSnapshot raw;
    raw.recent_events = {
        {.minute = 10.0, .side = Side::Home, .kind = EventKind::Shot},
        {.minute = NaN,  .side = Side::Away, .kind = EventKind::Corner},
    };
    raw.substitutions = {
        {.minute = INF, .side = Side::Home, .offensive = true},
        {.minute = 60.0, .side = Side::Away, .offensive = false},
    };
    const auto s = coerce(raw);
    ASSERT_EQ(s.recent_events.size(), 1u);
    EXPECT_EQ(s.recent_events[0].side, Side::Home);
    ASSERT_EQ(s.substitutions.size(), 1u);
    EXPECT_FALSE(s.substitutions[0].offensive);
}

TEST(MatchSnapshot, Aggregates) {
    MatchSnapshot s;
    s.home_score = 2;
    s.away_score = 1;
    s.home.yellow_cards = 2.0;
    s.away.red_cards = 1.0;
    s.home.corners = 4.0;
    s.away.corners = 3.0;
    EXPECT_EQ(s.total_goals(), 3);
    EXPECT_DOUBLE_EQ(s.total_cards(), 4.0);
    EXPECT_DOUBLE_EQ(s.total_corners(), 7.0);
    EXPECT_EQ(s.score(Side::Away), 1);
    EXPECT_EQ(opponent(Side::Home), Side::Away);
}
