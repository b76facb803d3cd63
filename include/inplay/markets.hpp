#pragma once

/// @file include/inplay/markets.hpp
/// @brief MarketCalculator — one pricing function per betting market.
///
/// # Module: Market Calculator
///
/// ## Responsibility
/// Combine the goal-rate projection, the Dixon-Coles score matrix, the phase
/// bias and the momentum window into priced MarketResults for:
///
///   Total Goals O/U · BTTS · Clean Sheet · Team Total Goals O/U ·
///   Next Goal · Match Result (1X2) · Cards O/U · Corners O/U
///
/// Each market function is independent: it reads only the MarketContext and
/// returns `nullopt` if its own computation is undefined. The engine drops a
/// failed market and keeps the rest.
///
/// ## Count Markets
/// For a line L with `current` already counted and λ expected to come:
///
///     goals_needed = ceil(L − current + ε)
///     P(Under)     = PoissonCDF(goals_needed − 1; λ)
///     P(Over)      = 100 − 100·P(Under)
///
/// A line already exceeded (current > L) is resolved: Over, 100, Complete.
///
/// ## Emitted Selections
/// Over/Under and BTTS report the more likely side of each pair; 1X2 and
/// Next Goal report all three outcomes; Clean Sheet reports both teams.

#include "inplay/config.hpp"
#include "inplay/dixon_coles.hpp"
#include "inplay/goal_rate.hpp"
#include "inplay/market.hpp"
#include "inplay/momentum.hpp"
#include "inplay/phase.hpp"
#include "inplay/types.hpp"

#include <optional>
#include <vector>

namespace inplay::markets {

// ─── Building blocks ──────────────────────────────────────────────────────────

/// A priced Over/Under pair for one line. Percentages sum to 100.
struct OverUnder {
    double line;
    double over;
    double under;
    int    needed;    ///< More events required for Over to land
    bool   resolved;  ///< current > line: Over already landed
};

/// Next-goal outcome split. Percentages sum to exactly 100.
struct NextGoalSplit {
    double home;
    double away;
    double none;
};

/// Normalized 1X2 split. Percentages sum to 100.
struct ResultSplit {
    double home;
    double draw;
    double away;
};

/// Price one Over/Under line with a Poisson tail.
///
/// # Arguments
/// * `current`            — events already counted (goals, cards, corners)
/// * `line`               — the market line, e.g. 2.5
/// * `remaining_expected` — λ of the events still to come
///
/// # Returns
/// `nullopt` if any argument is non-finite or λ < 0.
[[nodiscard]] std::optional<OverUnder>
price_over_under(double current, double line, double remaining_expected) noexcept;

/// Split P(another goal) between the sides.
///
///   P(goal) = 1 − e^{−(λ_h + λ_a)},  P(side | goal) = λ_side / (λ_h + λ_a)
///   none    = 100 − home − away
///
/// Rates are expected remaining goals. With λ_h + λ_a = 0 the split is
/// {0, 0, 100}.
[[nodiscard]] std::optional<NextGoalSplit>
split_next_goal(double home_expected, double away_expected) noexcept;

/// Clamp each raw 1X2 score into [floor, ceiling], then normalize to 100.
[[nodiscard]] std::optional<ResultSplit>
normalize_result(double raw_home, double raw_draw, double raw_away,
                 double floor   = constants::MATCH_RESULT_FLOOR,
                 double ceiling = constants::PROBABILITY_CEILING) noexcept;

/// Raw (pre-normalization) 1X2 scores for a snapshot.
///
/// Seeded from the goal differential, then shifted additively by the
/// expected-goals difference, the possession difference, the dangerous
/// attack share, and a time boost that grows quadratically with elapsed
/// minutes for the leading side.
[[nodiscard]] ResultSplit
raw_result_scores(const MatchSnapshot& snapshot,
                  const rate::GoalRateProjection& projection) noexcept;

/// Fouls per card: the match's own ratio once `card_sample_minute` has
/// passed and a card has been shown, otherwise the league default.
[[nodiscard]] double
fouls_per_card(const MatchSnapshot& snapshot, const LeagueProfile& league) noexcept;

/// Expected cards still to come (fouls remaining / fouls per card), scaled
/// up in DECISION_TIME and DESPERATE.
[[nodiscard]] double
expected_cards_remaining(const MatchSnapshot& snapshot,
                         phase::PhaseState phase,
                         const LeagueProfile& league) noexcept;

/// Expected corners still to come. League average before
/// `corner_sample_minute`, observed rate afterwards.
[[nodiscard]] double
expected_corners_remaining(const MatchSnapshot& snapshot,
                           const LeagueProfile& league) noexcept;

// ─── MarketContext ────────────────────────────────────────────────────────────

/// Everything a market function may read. Built once per evaluation.
struct MarketContext {
    const MatchSnapshot&     snapshot;
    const EngineConfig&      config;
    rate::GoalRateProjection projection;  ///< Un-adjusted projection
    phase::PhaseState        phase;
    double                   btts_bias;   ///< Phase + substitution bias, pp
    momentum::MomentumWindow momentum;

    /// Distribution of remaining goals. Absent if it could not be built;
    /// markets that need it then fail.
    std::optional<model::ScoreMatrix> score_matrix;
};

// ─── MarketCalculator ─────────────────────────────────────────────────────────

class MarketCalculator {
public:
    MarketCalculator() = delete;

    [[nodiscard]] static std::optional<std::vector<MarketResult>>
    total_goals(const MarketContext& ctx) noexcept;

    [[nodiscard]] static std::optional<std::vector<MarketResult>>
    both_teams_to_score(const MarketContext& ctx) noexcept;

    [[nodiscard]] static std::optional<std::vector<MarketResult>>
    clean_sheet(const MarketContext& ctx) noexcept;

    [[nodiscard]] static std::optional<std::vector<MarketResult>>
    team_total_goals(const MarketContext& ctx) noexcept;

    [[nodiscard]] static std::optional<std::vector<MarketResult>>
    next_goal(const MarketContext& ctx) noexcept;

    [[nodiscard]] static std::optional<std::vector<MarketResult>>
    match_result(const MarketContext& ctx) noexcept;

    [[nodiscard]] static std::optional<std::vector<MarketResult>>
    cards(const MarketContext& ctx) noexcept;

    [[nodiscard]] static std::optional<std::vector<MarketResult>>
    corners(const MarketContext& ctx) noexcept;
};

}  // namespace inplay::markets
