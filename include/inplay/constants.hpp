#pragma once

#include <cstddef>

/// @file include/inplay/constants.hpp
/// @brief Model constants and numerical tolerances for the in-play engine.
///
/// Everything here is a *default*. Tunable values are copied into
/// EngineConfig (see config.hpp) so callers can calibrate them per league
/// without touching this file.

namespace inplay::constants {

// ─── Match Clock ──────────────────────────────────────────────────────────────

/// Regulation length of a football match in minutes.
static constexpr double MATCH_MINUTES = 90.0;

/// Minute after which the observed xG rate is trusted for extrapolation.
static constexpr double RELIABILITY_THRESHOLD_MINUTES = 20.0;

/// Trailing window (minutes) of the momentum tally.
static constexpr double MOMENTUM_WINDOW_MINUTES = 5.0;

// ─── Goal Model ───────────────────────────────────────────────────────────────

/// Conservative league-default expected goals over 90 minutes, used before
/// the reliability threshold.
static constexpr double EARLY_HOME_XG = 0.8;
static constexpr double EARLY_AWAY_XG = 0.6;

/// xG proxy weights when no xG feed exists: 0.08·shots + 0.25·shots_on_target.
static constexpr double PROXY_XG_PER_SHOT           = 0.08;
static constexpr double PROXY_XG_PER_SHOT_ON_TARGET = 0.25;

/// Dixon-Coles low-score correlation parameter ρ.
static constexpr double DIXON_COLES_RHO = -0.05;

/// Highest remaining-goal count per side held in the score matrix.
static constexpr int SCORE_MATRIX_MAX_GOALS = 10;

// ─── Red Cards ────────────────────────────────────────────────────────────────

/// Rate multipliers once one side has more red cards than the other.
static constexpr double RED_CARD_SHORT_HANDED_FACTOR = 0.40;
static constexpr double RED_CARD_OPPONENT_FACTOR     = 1.45;

/// Extra multipliers by venue: a home dismissal hurts more, and the away
/// side gains a little more from it.
static constexpr double HOME_RED_EXTRA_FACTOR      = 0.90;
static constexpr double AWAY_RED_EXTRA_FACTOR      = 0.95;
static constexpr double AWAY_OPPONENT_EXTRA_FACTOR = 1.05;

// ─── Momentum ─────────────────────────────────────────────────────────────────

/// attack_multiplier = clamp(BASE + (ratio − 0.5)·SLOPE, MIN, MAX)
static constexpr double MOMENTUM_MULTIPLIER_BASE  = 0.6;
static constexpr double MOMENTUM_MULTIPLIER_SLOPE = 0.8;
static constexpr double MOMENTUM_MULTIPLIER_MIN   = 0.2;
static constexpr double MOMENTUM_MULTIPLIER_MAX   = 1.0;

/// Rate boost for the side that is behind (Next Goal market).
static constexpr double TRAILING_SIDE_BOOST = 1.10;

// ─── Secondary Markets ────────────────────────────────────────────────────────

static constexpr double FOULS_PER_CARD       = 4.5;
static constexpr double CARD_SAMPLE_MINUTE   = 20.0;
static constexpr double CARDS_PER_MATCH      = 4.0;
static constexpr double CORNERS_PER_MATCH    = 10.0;
static constexpr double CORNER_SAMPLE_MINUTE = 10.0;

/// Card-rate multipliers for the two late phases.
static constexpr double DECISION_TIME_CARD_FACTOR = 1.15;
static constexpr double DESPERATE_CARD_FACTOR     = 1.30;

// ─── Probability Bounds ───────────────────────────────────────────────────────

/// Floor applied to each raw 1X2 score before normalization.
static constexpr double MATCH_RESULT_FLOOR = 5.0;

static constexpr double PROBABILITY_CEILING = 100.0;

/// Tolerance of the sum-to-100 post-condition.
static constexpr double SUM_TOLERANCE = 1e-6;

/// Ranking quantizes probabilities to steps of this size; equal steps tie.
static constexpr double RANK_TIE_EPSILON = 1e-9;

/// ε added before ceil() when converting a line to a goal count.
static constexpr double LINE_EPSILON = 1e-9;

// ─── Recommendations ──────────────────────────────────────────────────────────

static constexpr std::size_t DEFAULT_TOP_N = 5;
static constexpr double VALUE_MIN_PROBABILITY = 55.0;
static constexpr double VALUE_MIN_EDGE        = 2.0;

}  // namespace inplay::constants
