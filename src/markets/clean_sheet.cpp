/// @file src/markets/clean_sheet.cpp
/// @brief Clean Sheet — P(side keeps a clean sheet) = e^{−λ_opponent}.

#include "inplay/markets.hpp"
#include "market_detail.hpp"

#include <fmt/format.h>

#include <cmath>

namespace inplay::markets {

std::optional<std::vector<MarketResult>>
MarketCalculator::clean_sheet(const MarketContext& ctx) noexcept {
    const MatchSnapshot& s = ctx.snapshot;
    std::vector<MarketResult> out;
    out.reserve(2);

    for (Side side : {Side::Home, Side::Away}) {
        const Side opp = opponent(side);

        if (s.score(opp) > 0) {
            // The clean sheet is already gone: "No" has happened.
            out.push_back(MarketResult{
                .kind        = MarketKind::CleanSheet,
                .selection   = Selection::No,
                .probability = 100.0,
                .confidence  = ConfidenceTier::VeryHigh,
                .state       = MarketState::Complete,
                .team        = side,
                .rationale   = fmt::format("{} already scored {}",
                                           to_string(opp), s.score(opp)),
            });
            continue;
        }

        const double lambda = ctx.projection.remaining(opp);
        const double keep = std::exp(-lambda) * 100.0;
        if (!std::isfinite(keep)) {
            return std::nullopt;
        }
        const bool yes = keep >= 50.0;
        const double p = yes ? keep : 100.0 - keep;

        out.push_back(MarketResult{
            .kind        = MarketKind::CleanSheet,
            .selection   = yes ? Selection::Yes : Selection::No,
            .probability = p,
            .confidence  = detail::confidence(s.minute, s.has_xg,
                                              ctx.projection.reliable, p),
            .state       = MarketState::Active,
            .team        = side,
            .rationale   = fmt::format("{} xG to come {:.2f}, {:.0f}min left",
                                       to_string(opp), lambda,
                                       ctx.projection.time_remaining),
        });
    }
    return out;
}

}  // namespace inplay::markets
