/// @file src/core/engine.cpp
/// @brief Core Integration Engine — one snapshot in, ranked markets out.

#include "inplay/engine.hpp"
#include "inplay/dixon_coles.hpp"
#include "inplay/markets.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <array>
#include <cmath>
#include <cstddef>
#include <utility>

namespace inplay::core {

namespace {

using MarketFn = std::optional<std::vector<MarketResult>> (*)(const markets::MarketContext&) noexcept;

struct MarketStep {
    MarketKind kind;
    MarketFn   fn;
};

constexpr std::array<MarketStep, 8> MARKET_STEPS{{
    {MarketKind::TotalGoals,       &markets::MarketCalculator::total_goals},
    {MarketKind::BothTeamsToScore, &markets::MarketCalculator::both_teams_to_score},
    {MarketKind::CleanSheet,       &markets::MarketCalculator::clean_sheet},
    {MarketKind::TeamTotalGoals,   &markets::MarketCalculator::team_total_goals},
    {MarketKind::NextGoal,         &markets::MarketCalculator::next_goal},
    {MarketKind::MatchResult,      &markets::MarketCalculator::match_result},
    {MarketKind::Cards,            &markets::MarketCalculator::cards},
    {MarketKind::Corners,          &markets::MarketCalculator::corners},
}};

constexpr std::size_t CORRECT_SCORE_COUNT = 3;

/// Over probability of each total-goals line from the matrix of the goals
/// still to come.
std::vector<MatrixLine> matrix_over_lines(const model::ScoreMatrix& m,
                                          int current_goals,
                                          const std::vector<double>& lines) {
    // More remaining goals than the matrix holds are out of reach anyway.
    const double max_needed = static_cast<double>(m.rows() + m.cols());

    std::vector<MatrixLine> out;
    out.reserve(lines.size());
    for (double line : lines) {
        const double gap = line - static_cast<double>(current_goals);
        if (!std::isfinite(gap)) {
            continue;
        }
        if (gap < 0.0) {
            out.push_back(MatrixLine{.line = line, .over = 100.0});
            continue;
        }
        const double needed = std::min(std::ceil(gap + constants::LINE_EPSILON), max_needed);
        const double under =
            model::DixonColesCorrector::remaining_at_most(m, static_cast<int>(needed) - 1);
        out.push_back(MatrixLine{.line = line, .over = (1.0 - under) * 100.0});
    }
    return out;
}

}  // anonymous namespace

// ─── Engine constructor ───────────────────────────────────────────────────────

Engine::Engine(EngineConfig config)
    : config_(std::move(config))
{}

// ─── Engine::evaluate ─────────────────────────────────────────────────────────

Evaluation Engine::evaluate(const MatchSnapshot& snapshot) const noexcept {
    Evaluation eval;
    eval.fixture_id = snapshot.fixture_id;
    eval.minute     = snapshot.minute;

    // ── Step 1: Rates, phase, momentum ───────────────────────────────────────
    eval.projection = rate::GoalRateEstimator::project(snapshot, config_);
    eval.phase      = phase::PhaseStateMachine::phase(snapshot.minute, config_.phases);
    eval.momentum   = momentum::MomentumTracker::window(snapshot,
                                                       config_.momentum_window_minutes);

    const double bias =
        phase::PhaseStateMachine::btts_bias(snapshot, config_.phases) +
        momentum::MomentumTracker::substitution_bias(snapshot.substitutions,
                                                     snapshot.minute);

    // ── Step 2: Joint distribution of the goals still to come ────────────────
    const model::DixonColesCorrector corrector(config_.dixon_coles_rho,
                                               config_.max_goals);
    markets::MarketContext ctx{
        .snapshot     = snapshot,
        .config       = config_,
        .projection   = eval.projection,
        .phase        = eval.phase,
        .btts_bias    = bias,
        .momentum     = eval.momentum,
        .score_matrix = corrector.score_matrix(eval.projection.remaining(Side::Home),
                                               eval.projection.remaining(Side::Away),
                                               config_.use_dixon_coles),
    };

    if (ctx.score_matrix) {
        eval.correct_scores = model::DixonColesCorrector::correct_scores(
            *ctx.score_matrix, snapshot.home_score, snapshot.away_score,
            CORRECT_SCORE_COUNT);
        eval.final_result = model::DixonColesCorrector::result_mass(
            *ctx.score_matrix, snapshot.home_score, snapshot.away_score);
        eval.matrix_total_goals = matrix_over_lines(
            *ctx.score_matrix, snapshot.total_goals(), config_.lines.total_goals);
    }

    // ── Step 3: Markets, each in isolation ───────────────────────────────────
    for (const auto& step : MARKET_STEPS) {
        auto priced = step.fn(ctx);
        if (!priced) {
            eval.failed_markets.push_back(step.kind);
            if (config_.verbose) {
                fmt::print(stderr, "[inplay] fixture {} minute {:.0f}: {} dropped\n",
                           snapshot.fixture_id, snapshot.minute, to_string(step.kind));
            }
            continue;
        }
        for (auto& r : *priced) {
            eval.results.push_back(std::move(r));
        }
    }

    // ── Step 4: Rank ─────────────────────────────────────────────────────────
    eval.recommendation = select::BestBetSelector::select(eval.results, selector_config());
    return eval;
}

// ─── Engine::evaluate_all ─────────────────────────────────────────────────────

std::vector<Evaluation>
Engine::evaluate_all(std::span<const MatchSnapshot> snapshots) const noexcept {
    std::vector<Evaluation> out;
    out.reserve(snapshots.size());
    for (const auto& s : snapshots) {
        out.push_back(evaluate(s));
    }
    return out;
}

// ─── Engine::selector_config ──────────────────────────────────────────────────

select::SelectorConfig Engine::selector_config() const noexcept {
    return select::SelectorConfig{
        .top_n                 = config_.top_n,
        .min_probability       = config_.min_probability,
        .value_min_probability = config_.value_min_probability,
        .value_min_edge        = config_.value_min_edge,
    };
}

}  // namespace inplay::core
