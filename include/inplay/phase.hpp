#pragma once

/// @file include/inplay/phase.hpp
/// @brief PhaseStateMachine — match clock → named phase + BTTS bias.
///
/// # Module: Phase State Machine
///
/// ## Phases (half-open minute intervals, default table)
///   OPENING        [0, 15)    −5
///   PROBING        [15, 30)    0
///   PRE_HT_PUSH    [30, 45)   +8
///   POST_HT_RESET  [45, 60)   +3
///   DECISION_TIME  [60, 75)   +5
///   DESPERATE      [75, 90]  +12
///
/// Minutes past 90 (stoppage time) stay DESPERATE; negative minutes are
/// OPENING.
///
/// ## Guarantees
/// - Pure function of the minute (and the configured table); no hidden
///   state, so re-evaluating any minute always yields the same phase
/// - Exhaustive `switch` over PhaseState everywhere; no string matching

#include "inplay/config.hpp"
#include "inplay/types.hpp"

#include <cstdint>

namespace inplay::phase {

enum class PhaseState : std::uint8_t {
    Opening,
    Probing,
    PreHtPush,
    PostHtReset,
    DecisionTime,
    Desperate,
};

/// "OPENING", "PROBING", "PRE_HT_PUSH", "POST_HT_RESET", "DECISION_TIME",
/// "DESPERATE".
[[nodiscard]] const char* to_string(PhaseState p) noexcept;

/// Extra BTTS bias in DESPERATE when the match is still 0-0.
static constexpr double DESPERATE_GOALLESS_BONUS = 8.0;

class PhaseStateMachine {
public:
    PhaseStateMachine() = delete;

    /// Phase for `minute` under the given boundary table.
    ///
    /// The table is read as ascending start minutes; a phase lasts until the
    /// next start. Non-finite minutes map to OPENING.
    [[nodiscard]] static PhaseState
    phase(double minute,
          const PhaseTable& table = default_phase_table()) noexcept;

    /// Configured signed bias of a phase, in percentage points.
    [[nodiscard]] static double
    bias(PhaseState p,
         const PhaseTable& table = default_phase_table()) noexcept;

    /// Bias for BTTS-style markets at the snapshot's minute, including the
    /// DESPERATE 0-0 bonus.
    [[nodiscard]] static double
    btts_bias(const MatchSnapshot& snapshot,
              const PhaseTable& table = default_phase_table()) noexcept;
};

}  // namespace inplay::phase
