/// @file src/markets/market_result.cpp
/// @brief Enum names, specificity and MarketResult formatting.

#include "inplay/market.hpp"

#include <fmt/format.h>

namespace inplay {

// ─── to_string ────────────────────────────────────────────────────────────────

const char* to_string(MarketKind k) noexcept {
    switch (k) {
        case MarketKind::TotalGoals:       return "Total Goals";
        case MarketKind::BothTeamsToScore: return "BTTS";
        case MarketKind::CleanSheet:       return "Clean Sheet";
        case MarketKind::TeamTotalGoals:   return "Team Goals";
        case MarketKind::NextGoal:         return "Next Goal";
        case MarketKind::MatchResult:      return "Match Result";
        case MarketKind::Cards:            return "Cards";
        case MarketKind::Corners:          return "Corners";
    }
    return "?";
}

const char* to_string(Selection s) noexcept {
    switch (s) {
        case Selection::Over:   return "Over";
        case Selection::Under:  return "Under";
        case Selection::Yes:    return "Yes";
        case Selection::No:     return "No";
        case Selection::Home:   return "Home";
        case Selection::Draw:   return "Draw";
        case Selection::Away:   return "Away";
        case Selection::NoGoal: return "No Goal";
    }
    return "?";
}

const char* to_string(MarketState s) noexcept {
    switch (s) {
        case MarketState::Active:   return "ACTIVE";
        case MarketState::Complete: return "COMPLETE";
    }
    return "?";
}

const char* to_string(ConfidenceTier t) noexcept {
    switch (t) {
        case ConfidenceTier::Low:      return "LOW";
        case ConfidenceTier::Medium:   return "MEDIUM";
        case ConfidenceTier::High:     return "HIGH";
        case ConfidenceTier::VeryHigh: return "VERY_HIGH";
    }
    return "?";
}

// ─── specificity ──────────────────────────────────────────────────────────────

int specificity(MarketKind k) noexcept {
    switch (k) {
        case MarketKind::TeamTotalGoals:   return 6;
        case MarketKind::CleanSheet:       return 5;
        case MarketKind::NextGoal:         return 4;
        case MarketKind::MatchResult:      return 3;
        case MarketKind::BothTeamsToScore: return 2;
        case MarketKind::TotalGoals:
        case MarketKind::Cards:
        case MarketKind::Corners:          return 1;
    }
    return 0;
}

// ─── MarketResult ─────────────────────────────────────────────────────────────

std::string MarketResult::market_name() const {
    std::string name;
    if (team) {
        name = fmt::format("{} {}", inplay::to_string(*team), inplay::to_string(kind));
    } else {
        name = inplay::to_string(kind);
    }
    if (line) {
        name += fmt::format(" {:.1f}", *line);
    }
    return name;
}

std::string MarketResult::selection_name() const {
    if (line) {
        return fmt::format("{} {:.1f}", inplay::to_string(selection), *line);
    }
    return inplay::to_string(selection);
}

std::string MarketResult::to_string() const {
    return fmt::format("{:<24} {:<12} {:>6.1f}%  {:<9} {:<8} {}",
                       market_name(), selection_name(), probability,
                       inplay::to_string(confidence), inplay::to_string(state),
                       rationale);
}

}  // namespace inplay
