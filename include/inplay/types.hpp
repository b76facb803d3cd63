#pragma once

/// @file include/inplay/types.hpp
/// @brief Shared value types for the in-play probability engine.
///
/// All modules include this file. It defines the live-match snapshot handed
/// over by the data collaborator and the event records the momentum window
/// is derived from.
///
/// A MatchSnapshot is immutable once built and is superseded wholesale by
/// the next poll. Nothing in the engine keeps a reference to it after
/// `Engine::evaluate` returns.

#include <cstdint>
#include <optional>
#include <vector>

namespace inplay {

// ─── Side / Events ────────────────────────────────────────────────────────────

/// Which team an event or statistic belongs to.
enum class Side : std::uint8_t {
    Home,
    Away,
};

/// Convert Side to "Home" / "Away".
[[nodiscard]] const char* to_string(Side s) noexcept;

/// The opposing side.
[[nodiscard]] constexpr Side opponent(Side s) noexcept {
    return s == Side::Home ? Side::Away : Side::Home;
}

/// Attacking event kinds that feed the momentum window.
enum class EventKind : std::uint8_t {
    Shot,
    DangerousAttack,
    Corner,
};

[[nodiscard]] const char* to_string(EventKind k) noexcept;

/// A single timestamped attacking event from the recent-event history.
struct MatchEvent {
    double    minute;  ///< Match minute the event happened at
    Side      side;
    EventKind kind;
};

/// A substitution; `offensive` marks an attacker-for-defender change.
struct SubstitutionEvent {
    double minute;
    Side   side;
    bool   offensive;
};

// ─── TeamStats ────────────────────────────────────────────────────────────────

/// Cumulative per-side statistics. All values are non-negative and finite
/// after coercion.
struct TeamStats {
    double xg                = 0.0;  ///< Cumulative expected goals
    double shots             = 0.0;
    double shots_on_target   = 0.0;
    double corners           = 0.0;
    double yellow_cards      = 0.0;
    double red_cards         = 0.0;
    double fouls             = 0.0;
    double possession        = 0.0;  ///< Percent of ball possession [0, 100]
    double dangerous_attacks = 0.0;

    /// Betting card count: a red card counts double.
    [[nodiscard]] double cards() const noexcept {
        return yellow_cards + 2.0 * red_cards;
    }
};

// ─── MatchSnapshot ────────────────────────────────────────────────────────────

/// One poll of a live fixture. Every numeric field is already coerced: an
/// absent value from the feed reads as zero here.
struct MatchSnapshot {
    std::int64_t fixture_id = 0;
    double       minute     = 0.0;
    int          home_score = 0;
    int          away_score = 0;
    TeamStats    home{};
    TeamStats    away{};

    /// False when the feed carried no xG for either side; the goal-rate
    /// estimator then falls back to a shot-based proxy.
    bool has_xg = false;

    std::vector<MatchEvent>        recent_events{};
    std::vector<SubstitutionEvent> substitutions{};

    [[nodiscard]] const TeamStats& stats(Side s) const noexcept {
        return s == Side::Home ? home : away;
    }

    [[nodiscard]] int score(Side s) const noexcept {
        return s == Side::Home ? home_score : away_score;
    }

    [[nodiscard]] int total_goals() const noexcept {
        return home_score + away_score;
    }

    [[nodiscard]] double total_cards() const noexcept {
        return home.cards() + away.cards();
    }

    [[nodiscard]] double total_corners() const noexcept {
        return home.corners + away.corners;
    }

    [[nodiscard]] double total_fouls() const noexcept {
        return home.fouls + away.fouls;
    }
};

// ─── Raw (uncoerced) input ────────────────────────────────────────────────────

/// Per-side statistics exactly as the feed delivered them. Any field may be
/// missing.
struct RawTeamStats {
    std::optional<double> xg;
    std::optional<double> shots;
    std::optional<double> shots_on_target;
    std::optional<double> corners;
    std::optional<double> yellow_cards;
    std::optional<double> red_cards;
    std::optional<double> fouls;
    std::optional<double> possession;
    std::optional<double> dangerous_attacks;
};

/// A snapshot before coercion.
struct RawSnapshot {
    std::optional<std::int64_t> fixture_id;
    std::optional<double>       minute;
    std::optional<double>       home_score;
    std::optional<double>       away_score;
    RawTeamStats                home{};
    RawTeamStats                away{};
    std::vector<MatchEvent>        recent_events{};
    std::vector<SubstitutionEvent> substitutions{};
};

/// Coerce a raw feed record into a MatchSnapshot.
///
/// Absent, NaN, infinite and negative values all become 0; scores are
/// truncated to whole goals; possession is limited to [0, 100]. Events with
/// a non-finite minute are dropped. Never fails.
[[nodiscard]] MatchSnapshot coerce(const RawSnapshot& raw) noexcept;

}  // namespace inplay
