/// @file src/phase/phase_state_machine.cpp
/// @brief PhaseStateMachine — minute → phase lookup over the boundary table.

#include "inplay/phase.hpp"

#include <cmath>
#include <cstddef>

namespace inplay::phase {

namespace {

constexpr PhaseState PHASE_ORDER[PHASE_COUNT] = {
    PhaseState::Opening,
    PhaseState::Probing,
    PhaseState::PreHtPush,
    PhaseState::PostHtReset,
    PhaseState::DecisionTime,
    PhaseState::Desperate,
};

std::size_t index_of(PhaseState p) noexcept {
    switch (p) {
        case PhaseState::Opening:      return 0;
        case PhaseState::Probing:      return 1;
        case PhaseState::PreHtPush:    return 2;
        case PhaseState::PostHtReset:  return 3;
        case PhaseState::DecisionTime: return 4;
        case PhaseState::Desperate:    return 5;
    }
    return 0;
}

}  // anonymous namespace

// ─── to_string ────────────────────────────────────────────────────────────────

const char* to_string(PhaseState p) noexcept {
    switch (p) {
        case PhaseState::Opening:      return "OPENING";
        case PhaseState::Probing:      return "PROBING";
        case PhaseState::PreHtPush:    return "PRE_HT_PUSH";
        case PhaseState::PostHtReset:  return "POST_HT_RESET";
        case PhaseState::DecisionTime: return "DECISION_TIME";
        case PhaseState::Desperate:    return "DESPERATE";
    }
    return "UNKNOWN";
}

// ─── phase ────────────────────────────────────────────────────────────────────

PhaseState PhaseStateMachine::phase(double minute, const PhaseTable& table) noexcept {
    if (!std::isfinite(minute)) {
        return PhaseState::Opening;
    }
    // Last phase whose start is ≤ minute. Everything before the first start
    // is OPENING; everything past the last start (stoppage time included)
    // is DESPERATE.
    std::size_t idx = 0;
    for (std::size_t i = 1; i < PHASE_COUNT; ++i) {
        if (minute >= table[i].start_minute) {
            idx = i;
        }
    }
    return PHASE_ORDER[idx];
}

// ─── bias ─────────────────────────────────────────────────────────────────────

double PhaseStateMachine::bias(PhaseState p, const PhaseTable& table) noexcept {
    return table[index_of(p)].btts_bias;
}

double PhaseStateMachine::btts_bias(const MatchSnapshot& snapshot,
                                    const PhaseTable& table) noexcept {
    const PhaseState p = phase(snapshot.minute, table);
    double b = bias(p, table);
    if (p == PhaseState::Desperate && snapshot.total_goals() == 0) {
        b += DESPERATE_GOALLESS_BONUS;
    }
    return b;
}

}  // namespace inplay::phase
