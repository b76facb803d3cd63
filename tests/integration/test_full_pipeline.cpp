/// @file tests/integration/test_full_pipeline.cpp
/// @brief End-to-end integration tests for the full evaluation pipeline.
///
/// These tests exercise the complete path:
///   CSV → SnapshotLoader → GoalRateEstimator + PhaseStateMachine +
///   MomentumTracker → DixonColesCorrector → MarketCalculator →
///   BestBetSelector → Evaluation

#include "inplay/engine.hpp"
#include "inplay/normalizer.hpp"
#include "inplay/snapshot_loader.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <cmath>
#include <set>
#include <string>
#include <vector>

using namespace inplay;
using namespace inplay::core;

// ─── Synthetic data helpers ───────────────────────────────────────────────────

namespace {

MatchSnapshot live_snapshot(double minute, int hs, int as) {
    MatchSnapshot s;
    s.fixture_id = 42;
    s.minute     = minute;
    s.home_score = hs;
    s.away_score = as;
    s.has_xg     = true;
    s.home = TeamStats{.xg = 0.025 * minute, .shots = 9, .shots_on_target = 4,
                       .corners = 5, .yellow_cards = 1, .fouls = 8,
                       .possession = 58, .dangerous_attacks = 40};
    s.away = TeamStats{.xg = 0.012 * minute, .shots = 5, .shots_on_target = 1,
                       .corners = 2, .yellow_cards = 2, .fouls = 11,
                       .possession = 42, .dangerous_attacks = 25};
    s.recent_events = {
        {.minute = minute - 3.0, .side = Side::Home, .kind = EventKind::Shot},
        {.minute = minute - 1.0, .side = Side::Away, .kind = EventKind::DangerousAttack},
    };
    return s;
}

std::set<MarketKind> kinds_of(const std::vector<MarketResult>& rs) {
    std::set<MarketKind> out;
    for (const auto& r : rs) out.insert(r.kind);
    return out;
}

}  // anonymous namespace

// ─── Full evaluation ─────────────────────────────────────────────────────────

TEST(Pipeline, AllEightMarketsPriced) {
    const Engine engine;
    const auto eval = engine.evaluate(live_snapshot(55.0, 1, 0));
    EXPECT_TRUE(eval.failed_markets.empty());
    EXPECT_EQ(kinds_of(eval.results).size(), 8u);
    EXPECT_EQ(eval.fixture_id, 42);
    EXPECT_EQ(eval.phase, phase::PhaseState::PostHtReset);
    EXPECT_TRUE(eval.projection.reliable);
    EXPECT_FALSE(eval.correct_scores.empty());
}

TEST(Pipeline, EveryProbabilityInRange) {
    const Engine engine;
    for (double minute : {0.0, 10.0, 30.0, 60.0, 85.0, 95.0}) {
        const auto eval = engine.evaluate(live_snapshot(minute, 1, 1));
        for (const auto& r : eval.results) {
            EXPECT_TRUE(std::isfinite(r.probability));
            EXPECT_GE(r.probability, 0.0);
            EXPECT_LE(r.probability, 100.0);
        }
    }
}

TEST(Pipeline, MutuallyExclusiveSetsSumToHundred) {
    const Engine engine;
    const auto eval = engine.evaluate(live_snapshot(70.0, 0, 1));
    for (MarketKind kind : {MarketKind::MatchResult, MarketKind::NextGoal}) {
        std::vector<double> ps;
        for (const auto& r : eval.results) {
            if (r.kind == kind) ps.push_back(r.probability);
        }
        ASSERT_EQ(ps.size(), 3u);
        EXPECT_TRUE(ProbabilityNormalizer::is_normalized(ps));
    }
}

TEST(Pipeline, BttsCompleteAtTwoOneIsNotRecommended) {
    const Engine engine;
    const auto eval = engine.evaluate(live_snapshot(50.0, 2, 1));

    const auto btts = std::find_if(eval.results.begin(), eval.results.end(),
        [](const MarketResult& r) { return r.kind == MarketKind::BothTeamsToScore; });
    ASSERT_NE(btts, eval.results.end());
    EXPECT_EQ(btts->state, MarketState::Complete);

    for (const auto& pick : eval.recommendation.ranked) {
        EXPECT_NE(pick.result.kind, MarketKind::BothTeamsToScore);
        EXPECT_FALSE(pick.result.is_complete());
    }
    EXPECT_GE(eval.recommendation.excluded_complete, 1u);
}

TEST(Pipeline, EarlyGameGuard) {
    const Engine engine;
    auto s = live_snapshot(10.0, 0, 0);
    s.home.xg = 2.5;  // one freak chance
    const auto eval = engine.evaluate(s);
    EXPECT_FALSE(eval.projection.reliable);
    EXPECT_LE(eval.projection.remaining(Side::Home), 0.8);
    EXPECT_LE(eval.projection.remaining(Side::Away), 0.6);
}

TEST(Pipeline, Idempotent) {
    const Engine engine;
    const auto s = live_snapshot(63.0, 1, 1);
    const auto a = engine.evaluate(s);
    const auto b = engine.evaluate(s);
    ASSERT_EQ(a.results.size(), b.results.size());
    for (std::size_t i = 0; i < a.results.size(); ++i) {
        EXPECT_EQ(a.results[i].kind, b.results[i].kind);
        EXPECT_EQ(a.results[i].selection, b.results[i].selection);
        EXPECT_DOUBLE_EQ(a.results[i].probability, b.results[i].probability);
    }
    ASSERT_EQ(a.recommendation.ranked.size(), b.recommendation.ranked.size());
    ASSERT_TRUE(a.recommendation.best && b.recommendation.best);
    EXPECT_EQ(a.recommendation.best->result.market_name(),
              b.recommendation.best->result.market_name());
}

TEST(Pipeline, FailedMarketIsIsolated) {
    EngineConfig cfg;
    cfg.max_goals = 0;  // no score matrix can be built
    const Engine engine(cfg);
    const auto eval = engine.evaluate(live_snapshot(40.0, 1, 0));
    ASSERT_EQ(eval.failed_markets.size(), 1u);
    EXPECT_EQ(eval.failed_markets[0], MarketKind::BothTeamsToScore);
    EXPECT_EQ(kinds_of(eval.results).size(), 7u);
    EXPECT_TRUE(eval.correct_scores.empty());
    EXPECT_FALSE(eval.final_result.has_value());
    EXPECT_TRUE(eval.matrix_total_goals.empty());
    EXPECT_TRUE(eval.recommendation.best.has_value());
}

TEST(Pipeline, ScoreMatrixReadings) {
    const Engine engine;
    const auto eval = engine.evaluate(live_snapshot(60.0, 1, 0));
    ASSERT_TRUE(eval.final_result.has_value());
    const auto& fr = *eval.final_result;
    EXPECT_NEAR(fr.home_win + fr.draw + fr.away_win, 1.0, 1e-9);
    // One goal up with the better xG rate.
    EXPECT_GT(fr.home_win, fr.draw);
    EXPECT_GT(fr.draw, fr.away_win);

    ASSERT_EQ(eval.matrix_total_goals.size(), engine.config().lines.total_goals.size());
    EXPECT_DOUBLE_EQ(eval.matrix_total_goals.front().line, 0.5);
    EXPECT_DOUBLE_EQ(eval.matrix_total_goals.front().over, 100.0);
    for (std::size_t i = 1; i < eval.matrix_total_goals.size(); ++i) {
        EXPECT_LE(eval.matrix_total_goals[i].over, eval.matrix_total_goals[i - 1].over);
        EXPECT_GE(eval.matrix_total_goals[i].over, 0.0);
    }
}

TEST(Pipeline, UncorrectedMatrixAgreesWithTotalGoalsMarket) {
    EngineConfig cfg;
    cfg.use_dixon_coles = false;
    const Engine engine(cfg);
    const auto eval = engine.evaluate(live_snapshot(60.0, 1, 0));

    int compared = 0;
    for (const auto& r : eval.results) {
        if (r.kind != MarketKind::TotalGoals || r.is_complete()) continue;
        const auto it = std::find_if(eval.matrix_total_goals.begin(),
                                     eval.matrix_total_goals.end(),
                                     [&](const MatrixLine& ml) { return ml.line == *r.line; });
        ASSERT_NE(it, eval.matrix_total_goals.end());
        const double over = r.selection == Selection::Over ? r.probability
                                                           : 100.0 - r.probability;
        EXPECT_NEAR(it->over, over, 1e-6);
        ++compared;
    }
    EXPECT_GT(compared, 0);
}

TEST(Pipeline, LateOffensiveSubstitutionAddsToPhaseBias) {
    const Engine engine;
    const auto plain = live_snapshot(78.0, 1, 0);
    auto subbed = plain;
    subbed.substitutions = {{.minute = 74.0, .side = Side::Home, .offensive = true}};

    const auto a = engine.evaluate(plain);
    const auto b = engine.evaluate(subbed);
    EXPECT_EQ(b.phase, phase::PhaseState::Desperate);

    const auto btts_yes = [](const Evaluation& e) {
        for (const auto& r : e.results) {
            if (r.kind == MarketKind::BothTeamsToScore) {
                return r.selection == Selection::Yes ? r.probability : 100.0 - r.probability;
            }
        }
        return -1.0;
    };
    const double yes_plain  = btts_yes(a);
    const double yes_subbed = btts_yes(b);
    ASSERT_GE(yes_plain, 0.0);

    // DESPERATE +12 and a substitution after minute 70 +8, on the matrix mass.
    const model::DixonColesCorrector dc(engine.config().dixon_coles_rho,
                                        engine.config().max_goals);
    const auto m = dc.score_matrix(b.projection.remaining(Side::Home),
                                   b.projection.remaining(Side::Away));
    ASSERT_TRUE(m.has_value());
    const double mass = model::DixonColesCorrector::btts_mass(*m, 1, 0) * 100.0;
    EXPECT_NEAR(yes_plain, mass + 12.0, 1e-9);
    EXPECT_NEAR(yes_subbed, mass + 12.0 + 8.0, 1e-9);
    EXPECT_NEAR(yes_subbed - yes_plain, 8.0, 1e-9);
}

TEST(Pipeline, IndependentPoissonOption) {
    EngineConfig cfg;
    cfg.use_dixon_coles = false;
    const Engine engine(cfg);
    const auto eval = engine.evaluate(live_snapshot(40.0, 0, 0));
    EXPECT_TRUE(eval.failed_markets.empty());
}

TEST(Pipeline, EvaluateAllKeepsOrder) {
    const Engine engine;
    std::vector<MatchSnapshot> batch;
    for (int i = 0; i < 5; ++i) {
        auto s = live_snapshot(20.0 + 10.0 * i, i % 2, 0);
        s.fixture_id = 100 + i;
        batch.push_back(s);
    }
    const auto evals = engine.evaluate_all(batch);
    ASSERT_EQ(evals.size(), batch.size());
    for (std::size_t i = 0; i < evals.size(); ++i) {
        EXPECT_EQ(evals[i].fixture_id, batch[i].fixture_id);
        EXPECT_DOUBLE_EQ(evals[i].minute, batch[i].minute);
    }
}

TEST(Pipeline, NewerSnapshotSupersedes) {
    const Engine engine;
    const auto first  = engine.evaluate(live_snapshot(30.0, 0, 0));
    const auto second = engine.evaluate(live_snapshot(80.0, 1, 0));
    const auto again  = engine.evaluate(live_snapshot(30.0, 0, 0));
    // Nothing from the later snapshot leaks into a re-evaluation.
    ASSERT_EQ(first.results.size(), again.results.size());
    for (std::size_t i = 0; i < first.results.size(); ++i) {
        EXPECT_DOUBLE_EQ(first.results[i].probability, again.results[i].probability);
    }
    EXPECT_NE(second.phase, first.phase);
}

TEST(Pipeline, CsvToRecommendation) {
    const std::string csv =
        "fixture_id,minute,home_score,away_score,home_xg,away_xg,home_corners,away_corners,events\n"
        "7,72,1,1,1.60,0.90,6,3,68:H:shot;70:H:attack;71:A:corner\n";
    const auto snaps = SnapshotLoader::parse_csv_string(csv);
    ASSERT_EQ(snaps.size(), 1u);

    const Engine engine;
    const auto eval = engine.evaluate(snaps[0]);
    EXPECT_EQ(eval.fixture_id, 7);
    EXPECT_EQ(eval.momentum.home.total(), 2);
    EXPECT_EQ(eval.momentum.away.total(), 1);
    ASSERT_TRUE(eval.recommendation.best.has_value());
    EXPECT_LE(eval.recommendation.top.size(), engine.config().top_n);
}
