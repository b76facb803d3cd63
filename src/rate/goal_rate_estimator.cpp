/// @file src/rate/goal_rate_estimator.cpp
/// @brief GoalRateEstimator — observed xG rate with an early-game prior.

#include "inplay/goal_rate.hpp"
#include "inplay/constants.hpp"

#include <algorithm>
#include <cmath>

namespace inplay::rate {

// ─── time_remaining ───────────────────────────────────────────────────────────

double GoalRateEstimator::time_remaining(double minute) noexcept {
    if (!std::isfinite(minute)) {
        return 0.0;
    }
    return std::max(constants::MATCH_MINUTES - minute, 0.0);
}

// ─── xg_proxy ─────────────────────────────────────────────────────────────────

double GoalRateEstimator::xg_proxy(const TeamStats& stats) noexcept {
    return constants::PROXY_XG_PER_SHOT * stats.shots +
           constants::PROXY_XG_PER_SHOT_ON_TARGET * stats.shots_on_target;
}

// ─── cumulative_xg ────────────────────────────────────────────────────────────

double GoalRateEstimator::cumulative_xg(const MatchSnapshot& snapshot,
                                        Side side) noexcept {
    const TeamStats& stats = snapshot.stats(side);
    return snapshot.has_xg ? stats.xg : xg_proxy(stats);
}

// ─── short_handed_side ────────────────────────────────────────────────────────

std::optional<Side>
GoalRateEstimator::short_handed_side(const MatchSnapshot& snapshot) noexcept {
    if (snapshot.home.red_cards > snapshot.away.red_cards) return Side::Home;
    if (snapshot.away.red_cards > snapshot.home.red_cards) return Side::Away;
    return std::nullopt;
}

// ─── apply_red_card ───────────────────────────────────────────────────────────

void GoalRateEstimator::apply_red_card(GoalRateProjection& p,
                                       Side short_handed,
                                       const RedCardEffects& effects) noexcept {
    const auto factor = [](double f) { return std::isfinite(f) ? std::max(f, 0.0) : 1.0; };

    double down = factor(effects.short_handed_factor);
    double up   = factor(effects.opponent_factor);
    if (short_handed == Side::Home) {
        down *= factor(effects.home_red_extra_factor);
        up   *= factor(effects.away_opponent_extra_factor);
        p.home_rate_per_min *= down;
        p.away_rate_per_min *= up;
    } else {
        down *= factor(effects.away_red_extra_factor);
        p.away_rate_per_min *= down;
        p.home_rate_per_min *= up;
    }
    p.short_handed = short_handed;
}

// ─── project ──────────────────────────────────────────────────────────────────

GoalRateProjection
GoalRateEstimator::project(const MatchSnapshot& snapshot,
                           const EngineConfig& config) noexcept {
    GoalRateProjection p;
    p.time_remaining = time_remaining(snapshot.minute);

    // The threshold is also what keeps minute 0 from reaching the division.
    const double threshold = std::max(config.reliability_threshold_minutes, 0.0);
    if (snapshot.minute > threshold && snapshot.minute > 0.0) {
        p.home_rate_per_min = cumulative_xg(snapshot, Side::Home) / snapshot.minute;
        p.away_rate_per_min = cumulative_xg(snapshot, Side::Away) / snapshot.minute;
        p.reliable = true;
    } else {
        p.home_rate_per_min = std::max(config.league.early_home_xg, 0.0) /
                              constants::MATCH_MINUTES;
        p.away_rate_per_min = std::max(config.league.early_away_xg, 0.0) /
                              constants::MATCH_MINUTES;
        p.reliable = false;
    }

    if (const auto side = short_handed_side(snapshot)) {
        apply_red_card(p, *side, config.red_card);
    }

    if (!std::isfinite(p.home_rate_per_min)) p.home_rate_per_min = 0.0;
    if (!std::isfinite(p.away_rate_per_min)) p.away_rate_per_min = 0.0;

    return p;
}

}  // namespace inplay::rate
