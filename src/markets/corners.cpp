/// @file src/markets/corners.cpp
/// @brief Corners Over/Under.

#include "inplay/markets.hpp"
#include "market_detail.hpp"

#include <algorithm>

namespace inplay::markets {

double expected_corners_remaining(const MatchSnapshot& snapshot,
                                  const LeagueProfile& league) noexcept {
    const double remaining = rate::GoalRateEstimator::time_remaining(snapshot.minute);

    // A near-zero count in the first minutes says nothing about the rate.
    if (snapshot.minute < league.corner_sample_minute || snapshot.minute <= 0.0) {
        return std::max(league.corners_per_match, 0.0) * remaining /
               constants::MATCH_MINUTES;
    }
    return snapshot.total_corners() / snapshot.minute * remaining;
}

std::optional<std::vector<MarketResult>>
MarketCalculator::corners(const MarketContext& ctx) noexcept {
    const MatchSnapshot& s = ctx.snapshot;
    const LeagueProfile& league = ctx.config.league;
    const bool sampled = s.minute >= league.corner_sample_minute && s.minute > 0.0;
    return detail::price_lines(MarketKind::Corners,
                               ctx.config.lines.corners,
                               s.total_corners(),
                               expected_corners_remaining(s, league),
                               s.minute,
                               s.total_corners() > 0.0,
                               sampled,
                               std::nullopt,
                               "corners");
}

}  // namespace inplay::markets
