/// @file src/markets/next_goal.cpp
/// @brief Next Goal (Home / Away / None).
///
///   P(goal)        = 1 − e^{−(λ_h + λ_a)}
///   P(home | goal) = λ_h / (λ_h + λ_a)
///   home_next      = P(goal) · P(home | goal)
///   none           = 100 − home_next − away_next
///
/// The rates fed in are adjusted first: the trailing side gets ×1.10, and
/// when the momentum window holds events each side's rate is multiplied by
/// its attack multiplier.

#include "inplay/markets.hpp"
#include "market_detail.hpp"

#include <fmt/format.h>

#include <cmath>

namespace inplay::markets {

// ─── split_next_goal ──────────────────────────────────────────────────────────

std::optional<NextGoalSplit>
split_next_goal(double home_expected, double away_expected) noexcept {
    if (!std::isfinite(home_expected) || !std::isfinite(away_expected) ||
        home_expected < 0.0 || away_expected < 0.0) {
        return std::nullopt;
    }

    const double total = home_expected + away_expected;
    if (total <= 0.0) {
        return NextGoalSplit{.home = 0.0, .away = 0.0, .none = 100.0};
    }

    const double p_goal = -std::expm1(-total);
    const double home = 100.0 * p_goal * (home_expected / total);
    const double away = 100.0 * p_goal * (away_expected / total);
    return NextGoalSplit{
        .home = home,
        .away = away,
        .none = 100.0 - home - away,
    };
}

// ─── MarketCalculator::next_goal ─────────────────────────────────────────────

std::optional<std::vector<MarketResult>>
MarketCalculator::next_goal(const MarketContext& ctx) noexcept {
    const MatchSnapshot& s = ctx.snapshot;

    double lh = ctx.projection.remaining(Side::Home);
    double la = ctx.projection.remaining(Side::Away);

    if (s.home_score < s.away_score) {
        lh *= constants::TRAILING_SIDE_BOOST;
    } else if (s.away_score < s.home_score) {
        la *= constants::TRAILING_SIDE_BOOST;
    }

    double mh = 1.0;
    double ma = 1.0;
    if (ctx.momentum.has_events()) {
        mh = momentum::MomentumTracker::attack_multiplier(ctx.momentum.ratio(Side::Home));
        ma = momentum::MomentumTracker::attack_multiplier(ctx.momentum.ratio(Side::Away));
        lh *= mh;
        la *= ma;
    }

    auto split = split_next_goal(lh, la);
    if (!split) {
        return std::nullopt;
    }

    const auto tier = [&](double p) {
        return detail::confidence(s.minute, s.has_xg, ctx.projection.reliable, p);
    };

    std::vector<MarketResult> out;
    out.reserve(3);
    out.push_back(MarketResult{
        .kind        = MarketKind::NextGoal,
        .selection   = Selection::Home,
        .probability = split->home,
        .confidence  = tier(split->home),
        .rationale   = fmt::format("xG to come {:.2f}, momentum x{:.2f}", lh, mh),
    });
    out.push_back(MarketResult{
        .kind        = MarketKind::NextGoal,
        .selection   = Selection::Away,
        .probability = split->away,
        .confidence  = tier(split->away),
        .rationale   = fmt::format("xG to come {:.2f}, momentum x{:.2f}", la, ma),
    });
    out.push_back(MarketResult{
        .kind        = MarketKind::NextGoal,
        .selection   = Selection::NoGoal,
        .probability = split->none,
        .confidence  = tier(split->none),
        .rationale   = fmt::format("{:.2f} goals expected in {:.0f}min",
                                   lh + la, ctx.projection.time_remaining),
    });
    return out;
}

}  // namespace inplay::markets
