/// @file src/markets/match_result.cpp
/// @brief Match Result (1X2).
///
/// # Raw scores
///   base       seeded from the goal differential:
///                level   35 / 30 / 35
///                +1      70 / 20 / 10   (leader / draw / trailer)
///                +2      80 / 15 /  5
///                +3…     90 / 10 /  0
///   xG         ±clamp(10 · (λ_h − λ_a), 20) to home/away, −0.3·|adj| to draw
///   possession ±clamp(0.1 · (poss_h − poss_a), 10)
///   attacks    ±clamp(20 · (share_h − 0.5), 10)
///   time boost 30 · (minute / 90)² to the leader only
///
/// # Normalization
/// Each raw score is clamped into [floor, ceiling] first, the three are
/// summed, and only then divided by the sum and scaled to 100. No clamp
/// follows.

#include "inplay/markets.hpp"
#include "inplay/normalizer.hpp"
#include "market_detail.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <cstdlib>

namespace inplay::markets {

// ─── raw_result_scores ───────────────────────────────────────────────────────

ResultSplit raw_result_scores(const MatchSnapshot& snapshot,
                              const rate::GoalRateProjection& projection) noexcept {
    const int diff = snapshot.home_score - snapshot.away_score;
    const int lead = std::min(std::abs(diff), 3);

    double leader  = 35.0;
    double draw    = 30.0;
    double trailer = 35.0;
    if (lead > 0) {
        leader  = 60.0 + 10.0 * lead;
        draw    = 25.0 - 5.0 * lead;
        trailer = 100.0 - leader - draw;
    }
    double home = diff >= 0 ? leader : trailer;
    double away = diff >= 0 ? trailer : leader;

    const double xg_diff = projection.remaining(Side::Home) - projection.remaining(Side::Away);
    const double xg_adj  = std::clamp(xg_diff * 10.0, -20.0, 20.0);

    double poss_adj = 0.0;
    if (snapshot.home.possession + snapshot.away.possession > 0.0) {
        poss_adj = std::clamp((snapshot.home.possession - snapshot.away.possession) * 0.1,
                              -10.0, 10.0);
    }

    double attack_adj = 0.0;
    const double da = snapshot.home.dangerous_attacks + snapshot.away.dangerous_attacks;
    if (da > 0.0) {
        const double share = snapshot.home.dangerous_attacks / da;
        attack_adj = std::clamp((share - 0.5) * 20.0, -10.0, 10.0);
    }

    // Quadratic in elapsed time: a lead at 80' is worth far more than at 20'.
    const double elapsed    = std::clamp(snapshot.minute / constants::MATCH_MINUTES, 0.0, 1.0);
    const double time_boost = 30.0 * elapsed * elapsed;

    home += xg_adj + poss_adj + attack_adj;
    away -= xg_adj + poss_adj + attack_adj;
    draw -= std::abs(xg_adj) * 0.3;
    if (diff > 0) {
        home += time_boost;
    } else if (diff < 0) {
        away += time_boost;
    }

    return ResultSplit{.home = home, .draw = draw, .away = away};
}

// ─── normalize_result ─────────────────────────────────────────────────────────

std::optional<ResultSplit>
normalize_result(double raw_home, double raw_draw, double raw_away,
                 double floor, double ceiling) noexcept {
    const double raw[3] = {raw_home, raw_draw, raw_away};
    auto out = ProbabilityNormalizer::normalize(raw, floor, ceiling);
    if (!out) {
        return std::nullopt;
    }
    return ResultSplit{.home = (*out)[0], .draw = (*out)[1], .away = (*out)[2]};
}

// ─── MarketCalculator::match_result ──────────────────────────────────────────

std::optional<std::vector<MarketResult>>
MarketCalculator::match_result(const MarketContext& ctx) noexcept {
    const MatchSnapshot& s = ctx.snapshot;
    const ResultSplit raw = raw_result_scores(s, ctx.projection);
    auto split = normalize_result(raw.home, raw.draw, raw.away,
                                  ctx.config.match_result_floor,
                                  ctx.config.probability_ceiling);
    if (!split) {
        return std::nullopt;
    }

    const std::string why = fmt::format(
        "Score {}-{}, xG to come {:.2f}/{:.2f}, {:.0f}min left",
        s.home_score, s.away_score,
        ctx.projection.remaining(Side::Home), ctx.projection.remaining(Side::Away),
        ctx.projection.time_remaining);

    const auto make = [&](Selection sel, double p) {
        return MarketResult{
            .kind        = MarketKind::MatchResult,
            .selection   = sel,
            .probability = p,
            .confidence  = detail::confidence(s.minute, s.has_xg,
                                              ctx.projection.reliable, p),
            .state       = MarketState::Active,
            .rationale   = why,
        };
    };

    return std::vector<MarketResult>{
        make(Selection::Home, split->home),
        make(Selection::Draw, split->draw),
        make(Selection::Away, split->away),
    };
}

}  // namespace inplay::markets
