/// @file src/markets/team_totals.cpp
/// @brief Team Total Goals Over/Under — per-side analogue of Total Goals.

#include "inplay/markets.hpp"
#include "market_detail.hpp"

namespace inplay::markets {

std::optional<std::vector<MarketResult>>
MarketCalculator::team_total_goals(const MarketContext& ctx) noexcept {
    std::vector<MarketResult> out;

    for (Side side : {Side::Home, Side::Away}) {
        auto priced = detail::price_lines(MarketKind::TeamTotalGoals,
                                          ctx.config.lines.team_goals,
                                          static_cast<double>(ctx.snapshot.score(side)),
                                          ctx.projection.remaining(side),
                                          ctx.snapshot.minute,
                                          ctx.snapshot.has_xg,
                                          ctx.projection.reliable,
                                          side,
                                          "goals");
        if (!priced) {
            return std::nullopt;
        }
        out.insert(out.end(), priced->begin(), priced->end());
    }
    return out;
}

}  // namespace inplay::markets
