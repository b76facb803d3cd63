/// @file src/markets/total_goals.cpp
/// @brief Total Goals Over/Under and the shared Poisson line pricer.

#include "inplay/markets.hpp"
#include "inplay/poisson.hpp"
#include "market_detail.hpp"

#include <cmath>

namespace inplay::markets {

// ─── price_over_under ─────────────────────────────────────────────────────────

std::optional<OverUnder>
price_over_under(double current, double line, double remaining_expected) noexcept {
    if (!std::isfinite(current) || !std::isfinite(line) ||
        !std::isfinite(remaining_expected) || remaining_expected < 0.0) {
        return std::nullopt;
    }

    // Terminal: the line is already passed, nothing left to price.
    if (current > line) {
        return OverUnder{
            .line = line, .over = 100.0, .under = 0.0, .needed = 0, .resolved = true,
        };
    }

    // Lines past any plausible count would overflow the int conversion.
    constexpr double MAX_GAP = 1e6;
    const double gap = line - current;
    if (gap > MAX_GAP) {
        return std::nullopt;
    }

    const int needed = static_cast<int>(std::ceil(gap + constants::LINE_EPSILON));
    auto under = poisson::cdf(needed - 1, remaining_expected);
    if (!under) {
        return std::nullopt;
    }

    const double under_pct = *under * 100.0;
    return OverUnder{
        .line     = line,
        .over     = 100.0 - under_pct,
        .under    = under_pct,
        .needed   = needed,
        .resolved = false,
    };
}

// ─── MarketCalculator::total_goals ───────────────────────────────────────────

std::optional<std::vector<MarketResult>>
MarketCalculator::total_goals(const MarketContext& ctx) noexcept {
    return detail::price_lines(MarketKind::TotalGoals,
                               ctx.config.lines.total_goals,
                               static_cast<double>(ctx.snapshot.total_goals()),
                               ctx.projection.total_remaining(),
                               ctx.snapshot.minute,
                               ctx.snapshot.has_xg,
                               ctx.projection.reliable,
                               std::nullopt,
                               "goals");
}

}  // namespace inplay::markets
