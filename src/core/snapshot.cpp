/// @file src/core/snapshot.cpp
/// @brief RawSnapshot → MatchSnapshot coercion.

#include "inplay/types.hpp"

#include <algorithm>
#include <cmath>

namespace inplay {

namespace {

/// Absent, non-finite and negative values all read as zero.
double count_or_zero(const std::optional<double>& v) noexcept {
    if (!v || !std::isfinite(*v) || *v < 0.0) {
        return 0.0;
    }
    return *v;
}

TeamStats coerce_stats(const RawTeamStats& raw) noexcept {
    return TeamStats{
        .xg                = count_or_zero(raw.xg),
        .shots             = count_or_zero(raw.shots),
        .shots_on_target   = count_or_zero(raw.shots_on_target),
        .corners           = count_or_zero(raw.corners),
        .yellow_cards      = count_or_zero(raw.yellow_cards),
        .red_cards         = count_or_zero(raw.red_cards),
        .fouls             = count_or_zero(raw.fouls),
        .possession        = std::min(count_or_zero(raw.possession), 100.0),
        .dangerous_attacks = count_or_zero(raw.dangerous_attacks),
    };
}

int goals_or_zero(const std::optional<double>& v) noexcept {
    // Scores above this are feed corruption, not football.
    constexpr double MAX_GOALS = 99.0;
    return static_cast<int>(std::min(std::floor(count_or_zero(v)), MAX_GOALS));
}

}  // anonymous namespace

// ─── to_string ────────────────────────────────────────────────────────────────

const char* to_string(Side s) noexcept {
    switch (s) {
        case Side::Home: return "Home";
        case Side::Away: return "Away";
    }
    return "Unknown";
}

const char* to_string(EventKind k) noexcept {
    switch (k) {
        case EventKind::Shot:            return "shot";
        case EventKind::DangerousAttack: return "attack";
        case EventKind::Corner:          return "corner";
    }
    return "unknown";
}

// ─── coerce ───────────────────────────────────────────────────────────────────

MatchSnapshot coerce(const RawSnapshot& raw) noexcept {
    MatchSnapshot snap;
    snap.fixture_id = raw.fixture_id.value_or(0);
    snap.minute     = count_or_zero(raw.minute);
    snap.home_score = goals_or_zero(raw.home_score);
    snap.away_score = goals_or_zero(raw.away_score);
    snap.home       = coerce_stats(raw.home);
    snap.away       = coerce_stats(raw.away);

    // xG is "present" only if the feed actually sent a finite value.
    const auto has = [](const std::optional<double>& v) {
        return v.has_value() && std::isfinite(*v);
    };
    snap.has_xg = has(raw.home.xg) || has(raw.away.xg);

    snap.recent_events.reserve(raw.recent_events.size());
    for (const auto& e : raw.recent_events) {
        if (std::isfinite(e.minute)) {
            snap.recent_events.push_back(e);
        }
    }

    snap.substitutions.reserve(raw.substitutions.size());
    for (const auto& s : raw.substitutions) {
        if (std::isfinite(s.minute)) {
            snap.substitutions.push_back(s);
        }
    }

    return snap;
}

}  // namespace inplay
