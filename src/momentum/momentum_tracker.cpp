/// @file src/momentum/momentum_tracker.cpp
/// @brief MomentumTracker — trailing-window tally, re-derived on every call.

#include "inplay/momentum.hpp"

#include <algorithm>
#include <cmath>

namespace inplay::momentum {

// ─── MomentumWindow::ratio ────────────────────────────────────────────────────

double MomentumWindow::ratio(Side s) const noexcept {
    const int mine   = tally(s).total();
    const int theirs = tally(opponent(s)).total();
    if (mine + theirs == 0) {
        return 0.5;
    }
    return static_cast<double>(mine) / static_cast<double>(mine + theirs);
}

// ─── MomentumTracker::window ─────────────────────────────────────────────────

MomentumWindow MomentumTracker::window(std::span<const MatchEvent> events,
                                       double current_minute,
                                       double window_minutes) noexcept {
    MomentumWindow w;
    if (!std::isfinite(current_minute)) {
        return w;
    }
    const double span = std::isfinite(window_minutes) ? std::max(window_minutes, 0.0)
                                                      : constants::MOMENTUM_WINDOW_MINUTES;
    w.to_minute   = current_minute;
    w.from_minute = current_minute - span;

    for (const auto& e : events) {
        if (!std::isfinite(e.minute) ||
            e.minute < w.from_minute || e.minute > w.to_minute) {
            continue;
        }
        SideTally& t = (e.side == Side::Home) ? w.home : w.away;
        switch (e.kind) {
            case EventKind::Shot:            ++t.shots;             break;
            case EventKind::DangerousAttack: ++t.dangerous_attacks; break;
            case EventKind::Corner:          ++t.corners;           break;
        }
    }
    return w;
}

MomentumWindow MomentumTracker::window(const MatchSnapshot& snapshot,
                                       double window_minutes) noexcept {
    return window(snapshot.recent_events, snapshot.minute, window_minutes);
}

// ─── MomentumTracker::attack_multiplier ──────────────────────────────────────

double MomentumTracker::attack_multiplier(double momentum_ratio) noexcept {
    if (!std::isfinite(momentum_ratio)) {
        momentum_ratio = 0.5;
    }
    const double raw = constants::MOMENTUM_MULTIPLIER_BASE +
                       (momentum_ratio - 0.5) * constants::MOMENTUM_MULTIPLIER_SLOPE;
    return std::clamp(raw,
                      constants::MOMENTUM_MULTIPLIER_MIN,
                      constants::MOMENTUM_MULTIPLIER_MAX);
}

// ─── MomentumTracker::substitution_bias ──────────────────────────────────────

double MomentumTracker::substitution_bias(std::span<const SubstitutionEvent> subs,
                                          double current_minute) noexcept {
    constexpr double LATE_MINUTE          = 70.0;
    constexpr double LATE_OFFENSIVE_BIAS  = 8.0;
    constexpr double OFFENSIVE_BIAS       = 5.0;
    constexpr double DEFENSIVE_BIAS       = -5.0;

    double bias = 0.0;
    for (const auto& s : subs) {
        // A substitution "from the future" is a feed glitch.
        if (!std::isfinite(s.minute) || s.minute > current_minute) {
            continue;
        }
        if (!s.offensive) {
            bias += DEFENSIVE_BIAS;
        } else if (s.minute > LATE_MINUTE) {
            bias += LATE_OFFENSIVE_BIAS;
        } else {
            bias += OFFENSIVE_BIAS;
        }
    }
    return bias;
}

}  // namespace inplay::momentum
