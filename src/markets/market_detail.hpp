#pragma once

/// @file src/markets/market_detail.hpp
/// @brief Internal helpers shared by the market calculators.

#include "inplay/market.hpp"
#include "inplay/markets.hpp"

#include <optional>
#include <string>
#include <vector>

namespace inplay::markets::detail {

/// Points-based confidence tier.
///
///   minute ≥ 30: +20    minute ≥ 60: +15    live signal present: +25
///   reliable projection: +10    clear direction (|p − 50| ≥ 35): +30,
///   (|p − 50| ≥ 20): +15
///
/// Tiers: ≥ 80 VeryHigh, ≥ 60 High, ≥ 40 Medium, else Low.
[[nodiscard]] ConfidenceTier
confidence(double minute, bool signal_present, bool reliable,
           double probability) noexcept;

/// Turn a priced line into the favoured-side MarketResult (or the resolved
/// Over if the line has already been passed).
[[nodiscard]] MarketResult
over_under_result(MarketKind kind, const OverUnder& ou,
                  ConfidenceTier tier, std::optional<Side> team,
                  std::string rationale);

/// Card multiplier of a phase: ×1.15 DECISION_TIME, ×1.30 DESPERATE.
[[nodiscard]] double card_phase_factor(phase::PhaseState p) noexcept;

/// Price every line of a count market in one pass.
///
/// # Returns
/// `nullopt` if any single line fails to price.
[[nodiscard]] std::optional<std::vector<MarketResult>>
price_lines(MarketKind kind,
            const std::vector<double>& lines,
            double current,
            double remaining_expected,
            double minute,
            bool signal_present,
            bool reliable,
            std::optional<Side> team,
            const char* unit);

}  // namespace inplay::markets::detail
