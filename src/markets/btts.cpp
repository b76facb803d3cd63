/// @file src/markets/btts.cpp
/// @brief Both Teams To Score.
///
/// Once both sides have scored the market is resolved and reported as
/// Complete. Otherwise:
///   - Dixon-Coles active: corrected joint mass of the score matrix over the
///     cells where both sides finish on ≥ 1 goal
///   - otherwise: P(home scores) × P(away scores), P = 1 − e^{−λ}, with a
///     side that has already scored contributing 1
/// The phase/substitution bias then shifts Yes by that many points and the
/// Yes/No pair is re-normalized.

#include "inplay/markets.hpp"
#include "inplay/normalizer.hpp"
#include "market_detail.hpp"

#include <fmt/format.h>

#include <cmath>

namespace inplay::markets {

namespace {

double side_scores(int scored, double expected) noexcept {
    return scored > 0 ? 1.0 : 1.0 - std::exp(-expected);
}

}  // anonymous namespace

std::optional<std::vector<MarketResult>>
MarketCalculator::both_teams_to_score(const MarketContext& ctx) noexcept {
    const MatchSnapshot& s = ctx.snapshot;

    if (s.home_score > 0 && s.away_score > 0) {
        return std::vector<MarketResult>{MarketResult{
            .kind        = MarketKind::BothTeamsToScore,
            .selection   = Selection::Yes,
            .probability = 100.0,
            .confidence  = ConfidenceTier::VeryHigh,
            .state       = MarketState::Complete,
            .rationale   = fmt::format("Both teams already scored ({}-{})",
                                       s.home_score, s.away_score),
        }};
    }

    const double lh = ctx.projection.remaining(Side::Home);
    const double la = ctx.projection.remaining(Side::Away);

    double p_yes = 0.0;
    const char* source = "independent Poisson";
    if (ctx.config.use_dixon_coles) {
        if (!ctx.score_matrix) {
            return std::nullopt;
        }
        p_yes = model::DixonColesCorrector::btts_mass(*ctx.score_matrix,
                                                      s.home_score, s.away_score);
        source = "Dixon-Coles";
    } else {
        p_yes = side_scores(s.home_score, lh) * side_scores(s.away_score, la);
    }
    if (!std::isfinite(p_yes)) {
        return std::nullopt;
    }

    const double bias = ctx.btts_bias;
    auto pair = ProbabilityNormalizer::normalize_pair(p_yes * 100.0 + bias,
                                                      (1.0 - p_yes) * 100.0 - bias);
    if (!pair) {
        return std::nullopt;
    }
    const auto [yes, no] = *pair;
    const bool pick_yes = yes > 50.0;
    const double p = pick_yes ? yes : no;

    return std::vector<MarketResult>{MarketResult{
        .kind        = MarketKind::BothTeamsToScore,
        .selection   = pick_yes ? Selection::Yes : Selection::No,
        .probability = p,
        .confidence  = detail::confidence(s.minute, s.has_xg,
                                          ctx.projection.reliable, p),
        .state       = MarketState::Active,
        .rationale   = fmt::format("{} {:.1f}%, xG to come {:.2f}/{:.2f}, {} bias {:+.0f}",
                                   source, p_yes * 100.0, lh, la,
                                   phase::to_string(ctx.phase), bias),
    }};
}

}  // namespace inplay::markets
