#pragma once

/// @file include/inplay/momentum.hpp
/// @brief MomentumTracker — trailing-window attack tally and rate multiplier.
///
/// # Module: Momentum Tracker
///
/// ## Responsibility
/// Re-derive, on every call, a per-side tally of shots, dangerous attacks
/// and corners over the trailing window (default 5 minutes) from the
/// snapshot's recent-event history, and turn it into a multiplicative
/// attack factor for each side's goal rate.
///
/// ## Formula
///   ratio_home = home_events / (home_events + away_events)   (0.5 if none)
///   multiplier = clamp(0.6 + (ratio − 0.5) · 0.8, 0.2, 1.0)
///   rate      *= multiplier
///
/// The ratio is dimensionless and the rate is goals/minute, so the two are
/// only ever combined by multiplication.
///
/// ## Guarantees
/// - Pure function of (snapshot, current_minute): there is no history kept
///   between calls
/// - Events older than `current_minute − window` or later than
///   `current_minute` never contribute
/// - multiplier ∈ [0.2, 1.0] for every ratio, including non-finite input

#include "inplay/types.hpp"
#include "inplay/constants.hpp"

#include <span>

namespace inplay::momentum {

// ─── SideTally ────────────────────────────────────────────────────────────────

struct SideTally {
    int shots             = 0;
    int dangerous_attacks = 0;
    int corners           = 0;

    [[nodiscard]] int total() const noexcept {
        return shots + dangerous_attacks + corners;
    }
};

// ─── MomentumWindow ───────────────────────────────────────────────────────────

struct MomentumWindow {
    double    from_minute = 0.0;  ///< Inclusive lower bound of the window
    double    to_minute   = 0.0;  ///< Inclusive upper bound (current minute)
    SideTally home{};
    SideTally away{};

    [[nodiscard]] const SideTally& tally(Side s) const noexcept {
        return s == Side::Home ? home : away;
    }

    [[nodiscard]] bool has_events() const noexcept {
        return home.total() + away.total() > 0;
    }

    /// Share of windowed events belonging to `s`; 0.5 for an empty window.
    [[nodiscard]] double ratio(Side s) const noexcept;
};

// ─── MomentumTracker ──────────────────────────────────────────────────────────

class MomentumTracker {
public:
    MomentumTracker() = delete;

    /// Tally the events in [current_minute − window_minutes, current_minute].
    [[nodiscard]] static MomentumWindow
    window(std::span<const MatchEvent> events,
           double current_minute,
           double window_minutes = constants::MOMENTUM_WINDOW_MINUTES) noexcept;

    /// Convenience overload reading the snapshot's own history and minute.
    [[nodiscard]] static MomentumWindow
    window(const MatchSnapshot& snapshot,
           double window_minutes = constants::MOMENTUM_WINDOW_MINUTES) noexcept;

    /// clamp(0.6 + (ratio − 0.5) · 0.8, 0.2, 1.0). Non-finite → neutral 0.6.
    [[nodiscard]] static double attack_multiplier(double momentum_ratio) noexcept;

    /// Summed BTTS bias (percentage points) of the substitutions made so
    /// far: offensive after minute 70 → +8, offensive → +5, defensive → −5.
    [[nodiscard]] static double
    substitution_bias(std::span<const SubstitutionEvent> subs,
                      double current_minute) noexcept;
};

}  // namespace inplay::momentum
