/// @file tests/model/test_dixon_coles.cpp
/// @brief Unit tests for DixonColesCorrector.
///
/// Test categories:
///   - τ in the four low-score cells, 1 elsewhere, never negative
///   - Score matrix is a distribution (sums to 1, non-negative)
///   - ρ = 0 reproduces independent Poisson
///   - BTTS from the joint mass differs from the naive product for ρ ≠ 0
///     and converges to it as ρ → 0
///   - Offsets for goals already scored
///   - Result masses, remaining-goal tail, correct scores

#include <gtest/gtest.h>
#include "inplay/dixon_coles.hpp"

#include <cmath>
#include <limits>

using namespace inplay::model;

static constexpr double EPS = 1e-9;

// ─── tau ─────────────────────────────────────────────────────────────────────

TEST(DixonColes, TauLowScoreCells) {
    const double hr = 1.2, ar = 0.9, rho = -0.05;
    EXPECT_NEAR(DixonColesCorrector::tau(0, 0, hr, ar, rho), 1.0 + hr * ar * 0.05, EPS);
    EXPECT_NEAR(DixonColesCorrector::tau(1, 0, hr, ar, rho), 1.0 - hr * 0.05, EPS);
    EXPECT_NEAR(DixonColesCorrector::tau(0, 1, hr, ar, rho), 1.0 - ar * 0.05, EPS);
    EXPECT_NEAR(DixonColesCorrector::tau(1, 1, hr, ar, rho), 1.05, EPS);
}

TEST(DixonColes, TauIsOneOutsideLowScores) {
    EXPECT_DOUBLE_EQ(DixonColesCorrector::tau(2, 0, 1.0, 1.0, -0.2), 1.0);
    EXPECT_DOUBLE_EQ(DixonColesCorrector::tau(0, 2, 1.0, 1.0, -0.2), 1.0);
    EXPECT_DOUBLE_EQ(DixonColesCorrector::tau(3, 3, 1.0, 1.0, -0.2), 1.0);
}

TEST(DixonColes, TauNeverNegative) {
    EXPECT_DOUBLE_EQ(DixonColesCorrector::tau(0, 0, 10.0, 10.0, 0.5), 0.0);
}

// ─── score_matrix ────────────────────────────────────────────────────────────

TEST(DixonColes, MatrixIsDistribution) {
    DixonColesCorrector dc;
    auto m = dc.score_matrix(1.3, 0.8);
    ASSERT_TRUE(m.has_value());
    EXPECT_EQ(m->rows(), 11);
    EXPECT_EQ(m->cols(), 11);
    EXPECT_NEAR(m->sum(), 1.0, 1e-12);
    EXPECT_GE(m->minCoeff(), 0.0);
}

TEST(DixonColes, ZeroRhoIsIndependent) {
    DixonColesCorrector dc(0.0);
    auto corrected   = dc.score_matrix(1.1, 0.7, true);
    auto independent = dc.score_matrix(1.1, 0.7, false);
    ASSERT_TRUE(corrected && independent);
    EXPECT_TRUE(corrected->isApprox(*independent, 1e-14));
}

TEST(DixonColes, NegativeRhoLiftsDrawCells) {
    DixonColesCorrector dc(-0.1);
    auto c = dc.score_matrix(1.2, 0.9, true);
    auto i = dc.score_matrix(1.2, 0.9, false);
    ASSERT_TRUE(c && i);
    EXPECT_GT((*c)(0, 0), (*i)(0, 0));
    EXPECT_GT((*c)(1, 1), (*i)(1, 1));
    EXPECT_LT((*c)(1, 0), (*i)(1, 0));
}

TEST(DixonColes, InvalidInputRejected) {
    DixonColesCorrector dc;
    EXPECT_FALSE(dc.score_matrix(-0.1, 1.0).has_value());
    EXPECT_FALSE(dc.score_matrix(std::numeric_limits<double>::quiet_NaN(), 1.0).has_value());
    EXPECT_FALSE(DixonColesCorrector(-0.05, 0).score_matrix(1.0, 1.0).has_value());
}

TEST(DixonColes, ZeroRatesPutAllMassOnCurrentScore) {
    DixonColesCorrector dc;
    auto m = dc.score_matrix(0.0, 0.0);
    ASSERT_TRUE(m.has_value());
    EXPECT_NEAR((*m)(0, 0), 1.0, 1e-12);
}

// ─── BTTS ────────────────────────────────────────────────────────────────────

TEST(DixonColes, BttsDiffersFromIndependentWhenRhoNonZero) {
    DixonColesCorrector dc(-0.05);
    auto m = dc.score_matrix(1.2, 0.9);
    ASSERT_TRUE(m.has_value());
    const double joint = DixonColesCorrector::btts_mass(*m);
    const double naive = DixonColesCorrector::independent_btts(1.2, 0.9);
    EXPECT_GT(std::abs(joint - naive), 1e-3);
}

TEST(DixonColes, BttsConvergesToIndependentAsRhoVanishes) {
    const double naive = DixonColesCorrector::independent_btts(1.2, 0.9);
    double prev_gap = std::numeric_limits<double>::infinity();
    for (double rho : {-0.2, -0.05, -0.01, -0.001, -1e-6}) {
        DixonColesCorrector dc(rho);
        auto m = dc.score_matrix(1.2, 0.9);
        ASSERT_TRUE(m.has_value());
        const double gap = std::abs(DixonColesCorrector::btts_mass(*m) - naive);
        EXPECT_LT(gap, prev_gap);
        prev_gap = gap;
    }
    EXPECT_LT(prev_gap, 1e-6);
}

TEST(DixonColes, BttsOffsetsForGoalsAlreadyScored) {
    DixonColesCorrector dc;
    auto m = dc.score_matrix(1.0, 1.0);
    ASSERT_TRUE(m.has_value());
    // Home has scored: only the away side still needs one.
    const double away_scores = 1.0 - m->col(0).sum();
    EXPECT_NEAR(DixonColesCorrector::btts_mass(*m, 1, 0), away_scores, 1e-12);
    EXPECT_NEAR(DixonColesCorrector::btts_mass(*m, 1, 1), 1.0, 1e-12);
}

// ─── Derived queries ─────────────────────────────────────────────────────────

TEST(DixonColes, ResultMassSumsToOne) {
    DixonColesCorrector dc;
    auto m = dc.score_matrix(1.4, 1.0);
    ASSERT_TRUE(m.has_value());
    const auto r = DixonColesCorrector::result_mass(*m, 0, 0);
    EXPECT_NEAR(r.home_win + r.draw + r.away_win, 1.0, 1e-12);
    EXPECT_GT(r.home_win, r.away_win);
}

TEST(DixonColes, ResultMassRespectsLead) {
    DixonColesCorrector dc;
    auto m = dc.score_matrix(0.3, 0.3);
    ASSERT_TRUE(m.has_value());
    const auto r = DixonColesCorrector::result_mass(*m, 2, 0);
    EXPECT_GT(r.home_win, 0.95);
}

TEST(DixonColes, RemainingAtMost) {
    DixonColesCorrector dc;
    auto m = dc.score_matrix(1.0, 0.5);
    ASSERT_TRUE(m.has_value());
    EXPECT_NEAR(DixonColesCorrector::remaining_at_most(*m, 0), (*m)(0, 0), 1e-15);
    EXPECT_DOUBLE_EQ(DixonColesCorrector::remaining_at_most(*m, -1), 0.0);
    EXPECT_NEAR(DixonColesCorrector::remaining_at_most(*m, 20), 1.0, 1e-12);
}

TEST(DixonColes, CorrectScoresDescendingAndOffset) {
    DixonColesCorrector dc;
    auto m = dc.score_matrix(0.3, 0.2);
    ASSERT_TRUE(m.has_value());
    const auto scores = DixonColesCorrector::correct_scores(*m, 1, 2, 4);
    ASSERT_EQ(scores.size(), 4u);
    EXPECT_EQ(scores[0].home_goals, 1);
    EXPECT_EQ(scores[0].away_goals, 2);
    for (std::size_t i = 1; i < scores.size(); ++i) {
        EXPECT_GE(scores[i - 1].probability, scores[i].probability);
    }
}
