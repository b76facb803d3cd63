#pragma once

/// @file include/inplay/market.hpp
/// @brief Market identity, selections and the MarketResult record.
///
/// Market identity, selection, state and confidence are closed enums so that
/// every consumer switches exhaustively over them. There is exactly one way
/// to say "this outcome has already happened": MarketState::Complete.

#include "inplay/types.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace inplay {

// ─── Enumerations ─────────────────────────────────────────────────────────────

/// The eight markets priced by the engine.
enum class MarketKind : std::uint8_t {
    TotalGoals,
    BothTeamsToScore,
    CleanSheet,
    TeamTotalGoals,
    NextGoal,
    MatchResult,
    Cards,
    Corners,
};

enum class Selection : std::uint8_t {
    Over,
    Under,
    Yes,
    No,
    Home,
    Draw,
    Away,
    NoGoal,
};

/// Active = forward-looking price. Complete = the selection has already
/// happened (reported at 100 and never recommended).
enum class MarketState : std::uint8_t {
    Active,
    Complete,
};

enum class ConfidenceTier : std::uint8_t {
    Low,
    Medium,
    High,
    VeryHigh,
};

[[nodiscard]] const char* to_string(MarketKind k) noexcept;
[[nodiscard]] const char* to_string(Selection s) noexcept;
[[nodiscard]] const char* to_string(MarketState s) noexcept;
[[nodiscard]] const char* to_string(ConfidenceTier t) noexcept;

/// How narrow a market is. Higher = more specific. Used to break ranking
/// ties: single-team markets outrank match-wide ones, aggregate counts
/// (goals, cards, corners) rank lowest.
[[nodiscard]] int specificity(MarketKind k) noexcept;

// ─── MarketResult ─────────────────────────────────────────────────────────────

/// One priced selection of one market for one snapshot.
struct MarketResult {
    MarketKind            kind;
    Selection             selection;
    double                probability;  ///< Percent in [0, 100]
    ConfidenceTier        confidence = ConfidenceTier::Low;
    MarketState           state      = MarketState::Active;
    std::optional<double> line{};       ///< Over/Under line, if any
    std::optional<Side>   team{};       ///< Team-scoped markets only
    std::string           rationale{};

    [[nodiscard]] bool is_complete() const noexcept {
        return state == MarketState::Complete;
    }

    /// e.g. "Total Goals 2.5", "Home Team Goals 1.5", "Away Clean Sheet".
    [[nodiscard]] std::string market_name() const;

    /// e.g. "Over 2.5", "Yes", "Draw".
    [[nodiscard]] std::string selection_name() const;

    /// One formatted line for console output.
    [[nodiscard]] std::string to_string() const;
};

}  // namespace inplay
