/// @file src/markets/market_detail.cpp
/// @brief Confidence scoring and Over/Under result assembly.

#include "market_detail.hpp"

#include <fmt/format.h>

#include <cmath>
#include <utility>

namespace inplay::markets::detail {

ConfidenceTier confidence(double minute, bool signal_present, bool reliable,
                          double probability) noexcept {
    int score = 0;
    if (minute >= 30.0) score += 20;
    if (minute >= 60.0) score += 15;
    if (signal_present) score += 25;
    if (reliable)       score += 10;

    const double clarity = std::abs(probability - 50.0);
    if (clarity >= 35.0) {
        score += 30;
    } else if (clarity >= 20.0) {
        score += 15;
    }

    if (score >= 80) return ConfidenceTier::VeryHigh;
    if (score >= 60) return ConfidenceTier::High;
    if (score >= 40) return ConfidenceTier::Medium;
    return ConfidenceTier::Low;
}

MarketResult over_under_result(MarketKind kind, const OverUnder& ou,
                               ConfidenceTier tier, std::optional<Side> team,
                               std::string rationale) {
    if (ou.resolved) {
        return MarketResult{
            .kind        = kind,
            .selection   = Selection::Over,
            .probability = 100.0,
            .confidence  = ConfidenceTier::VeryHigh,
            .state       = MarketState::Complete,
            .line        = ou.line,
            .team        = team,
            .rationale   = std::move(rationale),
        };
    }
    const bool over = ou.over > 50.0;
    return MarketResult{
        .kind        = kind,
        .selection   = over ? Selection::Over : Selection::Under,
        .probability = over ? ou.over : ou.under,
        .confidence  = tier,
        .state       = MarketState::Active,
        .line        = ou.line,
        .team        = team,
        .rationale   = std::move(rationale),
    };
}

double card_phase_factor(phase::PhaseState p) noexcept {
    switch (p) {
        case phase::PhaseState::Opening:
        case phase::PhaseState::Probing:
        case phase::PhaseState::PreHtPush:
        case phase::PhaseState::PostHtReset:
            return 1.0;
        case phase::PhaseState::DecisionTime:
            return constants::DECISION_TIME_CARD_FACTOR;
        case phase::PhaseState::Desperate:
            return constants::DESPERATE_CARD_FACTOR;
    }
    return 1.0;
}

std::optional<std::vector<MarketResult>>
price_lines(MarketKind kind,
            const std::vector<double>& lines,
            double current,
            double remaining_expected,
            double minute,
            bool signal_present,
            bool reliable,
            std::optional<Side> team,
            const char* unit) {
    std::vector<MarketResult> out;
    out.reserve(lines.size());

    for (double line : lines) {
        auto ou = price_over_under(current, line, remaining_expected);
        if (!ou) {
            return std::nullopt;
        }
        std::string why = ou->resolved
            ? fmt::format("Already hit: {} {}", current, unit)
            : fmt::format("Current: {}, expected {:.2f} more {}, need {}",
                          current, remaining_expected, unit, ou->needed);
        const double favoured = ou->over > 50.0 ? ou->over : ou->under;
        out.push_back(over_under_result(
            kind, *ou, confidence(minute, signal_present, reliable, favoured),
            team, std::move(why)));
    }
    return out;
}

}  // namespace inplay::markets::detail
