#pragma once

/// @file include/inplay/goal_rate.hpp
/// @brief GoalRateEstimator — per-minute scoring rate projection.
///
/// # Module: Goal Rate Estimator
///
/// ## Responsibility
/// Turn a snapshot's cumulative xG and match clock into a per-minute scoring
/// rate per side, and from it the expected goals still to come.
///
/// ## The Early-Game Guard
/// Extrapolating xG/minute from a handful of minutes is unstable: one big
/// chance at minute 10 (xG 0.8) would project 0.08/min × 80 = 6.4 goals.
/// Up to and including the reliability threshold the observed rate is
/// ignored and a conservative league prior is used instead:
///
///     rate_side = early_xg_side / 90,   reliable = false
///
/// After the threshold:
///
///     rate_side = xg_side / minute,     reliable = true
///
/// ## xG Proxy
/// When the feed has no xG at all the cumulative value is approximated as
/// 0.08·shots + 0.25·shots_on_target per side.
///
/// ## Red Cards
/// When one side has more red cards than the other, both rates are scaled:
///
///     short-handed side:  ×0.40, then ×0.90 (home) or ×0.95 (away)
///     opponent:           ×1.45, then ×1.05 if the opponent is away
///
/// Equal red-card counts leave the rates unchanged.
///
/// ## Guarantees
/// - Stateless, `noexcept`, never divides by zero
/// - Rates are finite and non-negative for any coerced snapshot

#include "inplay/config.hpp"
#include "inplay/types.hpp"

#include <optional>

namespace inplay::rate {

// ─── GoalRateProjection ───────────────────────────────────────────────────────

struct GoalRateProjection {
    double home_rate_per_min = 0.0;
    double away_rate_per_min = 0.0;
    double time_remaining    = 0.0;  ///< max(90 − minute, 0)
    bool   reliable          = false;
    std::optional<Side> short_handed{};  ///< Side with more red cards, if any

    [[nodiscard]] double rate(Side s) const noexcept {
        return s == Side::Home ? home_rate_per_min : away_rate_per_min;
    }

    /// Expected goals still to come for one side: rate × time_remaining.
    [[nodiscard]] double remaining(Side s) const noexcept {
        return rate(s) * time_remaining;
    }

    [[nodiscard]] double total_remaining() const noexcept {
        return (home_rate_per_min + away_rate_per_min) * time_remaining;
    }
};

// ─── GoalRateEstimator ────────────────────────────────────────────────────────

class GoalRateEstimator {
public:
    GoalRateEstimator() = delete;

    /// Project per-minute scoring rates for both sides.
    [[nodiscard]] static GoalRateProjection
    project(const MatchSnapshot& snapshot, const EngineConfig& config) noexcept;

    /// Cumulative xG for one side, or the shot proxy when `has_xg` is false.
    [[nodiscard]] static double
    cumulative_xg(const MatchSnapshot& snapshot, Side side) noexcept;

    /// 0.08·shots + 0.25·shots_on_target.
    [[nodiscard]] static double xg_proxy(const TeamStats& stats) noexcept;

    /// Side with strictly more red cards, or nullopt if level.
    [[nodiscard]] static std::optional<Side>
    short_handed_side(const MatchSnapshot& snapshot) noexcept;

    /// Scale both rates of `p` for a red-card imbalance.
    static void apply_red_card(GoalRateProjection& p, Side short_handed,
                               const RedCardEffects& effects) noexcept;

    /// max(90 − minute, 0).
    [[nodiscard]] static double time_remaining(double minute) noexcept;
};

}  // namespace inplay::rate
