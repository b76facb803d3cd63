#pragma once

/// @file include/inplay/config.hpp
/// @brief EngineConfig — every calibratable parameter of the engine.
///
/// The early-game xG defaults and the phase biases have no published
/// derivation; they live here rather than in code so they can be refit
/// against settled outcomes without a rebuild of the market logic.

#include "inplay/constants.hpp"

#include <array>
#include <cstddef>
#include <vector>

namespace inplay {

// ─── PhaseSpec ────────────────────────────────────────────────────────────────

/// Start minute of a match phase and the signed bias (percentage points)
/// it applies to BTTS-style markets. A phase lasts until the next start.
struct PhaseSpec {
    double start_minute;
    double btts_bias;
};

/// Number of match phases (OPENING … DESPERATE).
static constexpr std::size_t PHASE_COUNT = 6;

using PhaseTable = std::array<PhaseSpec, PHASE_COUNT>;

/// Default boundaries: [0,15) [15,30) [30,45) [45,60) [60,75) [75,90].
[[nodiscard]] constexpr PhaseTable default_phase_table() noexcept {
    return PhaseTable{{
        {0.0,  -5.0},
        {15.0,  0.0},
        {30.0,  8.0},
        {45.0,  3.0},
        {60.0,  5.0},
        {75.0, 12.0},
    }};
}

// ─── LeagueProfile ────────────────────────────────────────────────────────────

/// Per-league priors. Each one is replaced by an observed value once the
/// match itself has produced enough sample.
struct LeagueProfile {
    double early_home_xg        = constants::EARLY_HOME_XG;
    double early_away_xg        = constants::EARLY_AWAY_XG;
    double fouls_per_card       = constants::FOULS_PER_CARD;
    double card_sample_minute   = constants::CARD_SAMPLE_MINUTE;
    double cards_per_match      = constants::CARDS_PER_MATCH;
    double corners_per_match    = constants::CORNERS_PER_MATCH;
    double corner_sample_minute = constants::CORNER_SAMPLE_MINUTE;
};

// ─── RedCardEffects ───────────────────────────────────────────────────────────

/// Goal-rate multipliers for a side playing a man down and its opponent.
struct RedCardEffects {
    double short_handed_factor        = constants::RED_CARD_SHORT_HANDED_FACTOR;
    double opponent_factor            = constants::RED_CARD_OPPONENT_FACTOR;
    double home_red_extra_factor      = constants::HOME_RED_EXTRA_FACTOR;
    double away_red_extra_factor      = constants::AWAY_RED_EXTRA_FACTOR;
    double away_opponent_extra_factor = constants::AWAY_OPPONENT_EXTRA_FACTOR;
};

// ─── MarketLines ──────────────────────────────────────────────────────────────

/// Over/Under lines evaluated for each count market.
struct MarketLines {
    std::vector<double> total_goals{0.5, 1.5, 2.5, 3.5, 4.5, 5.5, 6.5};
    std::vector<double> team_goals{0.5, 1.5, 2.5};
    std::vector<double> cards{2.5, 3.5, 4.5, 5.5, 6.5};
    std::vector<double> corners{7.5, 8.5, 9.5, 10.5, 11.5, 12.5, 13.5};
};

// ─── EngineConfig ─────────────────────────────────────────────────────────────

/// Configuration for one Engine instance.
struct EngineConfig {
    double reliability_threshold_minutes = constants::RELIABILITY_THRESHOLD_MINUTES;

    /// Dixon-Coles ρ. With `use_dixon_coles = false` the joint distribution
    /// is plain independent Poisson.
    double dixon_coles_rho = constants::DIXON_COLES_RHO;
    bool   use_dixon_coles = true;
    int    max_goals       = constants::SCORE_MATRIX_MAX_GOALS;

    PhaseTable phases = default_phase_table();

    double momentum_window_minutes = constants::MOMENTUM_WINDOW_MINUTES;

    LeagueProfile  league{};
    RedCardEffects red_card{};
    MarketLines    lines{};

    double match_result_floor  = constants::MATCH_RESULT_FLOOR;
    double probability_ceiling = constants::PROBABILITY_CEILING;

    /// Recommendation filters (BestBetSelector).
    std::size_t top_n                 = constants::DEFAULT_TOP_N;
    double      min_probability       = 0.0;
    double      value_min_probability = constants::VALUE_MIN_PROBABILITY;
    double      value_min_edge        = constants::VALUE_MIN_EDGE;

    /// If true, failed markets are reported on stderr.
    bool verbose = false;
};

}  // namespace inplay
