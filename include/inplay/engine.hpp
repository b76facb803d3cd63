#pragma once

/// @file include/inplay/engine.hpp
/// @brief Engine — the real-time multi-market probability pipeline.
///
/// # Module: Integration Engine
///
/// ## Responsibility
/// Orchestrate one evaluation of one live snapshot:
///   MatchSnapshot → GoalRateEstimator + PhaseStateMachine + MomentumTracker
///                 → DixonColesCorrector (score matrix)
///                 → MarketCalculator (8 markets, each isolated)
///                 → BestBetSelector
///
/// ## Usage
/// ```cpp
/// Engine engine;
/// auto snapshots = SnapshotLoader::load_csv("live.csv");
/// if (snapshots) {
///     for (const auto& s : *snapshots) {
///         auto eval = engine.evaluate(s);
///         if (eval.recommendation.best)
///             fmt::print("{}\n", eval.recommendation.best->result.to_string());
///     }
/// }
/// ```
///
/// ## Guarantees
/// - `evaluate` is const and keeps no state between calls: the same snapshot
///   always yields the same Evaluation, and evaluations of different
///   fixtures may run concurrently on one Engine
/// - A newer snapshot supersedes an older one; nothing is merged
/// - A market that fails is dropped and counted; it never aborts the others
/// - No I/O, threads or timers; the polling cadence belongs to the caller

#include "inplay/best_bet.hpp"
#include "inplay/config.hpp"
#include "inplay/dixon_coles.hpp"
#include "inplay/goal_rate.hpp"
#include "inplay/market.hpp"
#include "inplay/momentum.hpp"
#include "inplay/phase.hpp"
#include "inplay/types.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace inplay::core {

// ─── Evaluation ───────────────────────────────────────────────────────────────

/// One total-goals line read off the score matrix.
struct MatrixLine {
    double line;
    double over;  ///< Percent; 100 once the line is passed
};

/// Full output of one evaluation.
struct Evaluation {
    std::int64_t             fixture_id = 0;
    double                   minute     = 0.0;
    rate::GoalRateProjection projection{};
    phase::PhaseState        phase = phase::PhaseState::Opening;
    momentum::MomentumWindow momentum{};

    std::vector<MarketResult>  results;         ///< All markets, Complete included
    std::vector<MarketKind>    failed_markets;  ///< Markets dropped this call

    /// Score-matrix readings. Empty if the matrix was unavailable.
    std::vector<model::ScoreProbability> correct_scores;  ///< Most likely final scores
    std::optional<model::ResultMass>     final_result;    ///< 1X2 mass of the final score
    std::vector<MatrixLine>              matrix_total_goals;
    select::Recommendation     recommendation;
};

// ─── Engine ───────────────────────────────────────────────────────────────────

class Engine {
public:
    explicit Engine(EngineConfig config = EngineConfig{});

    /// Evaluate one snapshot.
    [[nodiscard]] Evaluation evaluate(const MatchSnapshot& snapshot) const noexcept;

    /// Evaluate independent snapshots, one Evaluation each, in input order.
    [[nodiscard]] std::vector<Evaluation>
    evaluate_all(std::span<const MatchSnapshot> snapshots) const noexcept;

    [[nodiscard]] const EngineConfig& config() const noexcept { return config_; }

private:
    /// Selector filters taken from the engine config.
    [[nodiscard]] select::SelectorConfig selector_config() const noexcept;

    EngineConfig config_;
};

}  // namespace inplay::core
