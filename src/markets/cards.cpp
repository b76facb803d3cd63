/// @file src/markets/cards.cpp
/// @brief Cards Over/Under (yellow = 1, red = 2).
///
///   expected_cards_remaining = expected_fouls_remaining / fouls_per_card
///
/// Before `card_sample_minute` both terms come from the league profile.
/// Afterwards the fouls rate is the match's own and, once a card has been
/// shown, so is the fouls:cards ratio.

#include "inplay/markets.hpp"
#include "market_detail.hpp"

#include <algorithm>
#include <cmath>

namespace inplay::markets {

namespace {

bool past_card_sample(const MatchSnapshot& s, const LeagueProfile& league) noexcept {
    return s.minute > league.card_sample_minute && s.minute > 0.0;
}

double default_fouls_per_card(const LeagueProfile& league) noexcept {
    return league.fouls_per_card > 0.0 ? league.fouls_per_card
                                       : constants::FOULS_PER_CARD;
}

}  // anonymous namespace

// ─── fouls_per_card ───────────────────────────────────────────────────────────

double fouls_per_card(const MatchSnapshot& snapshot,
                      const LeagueProfile& league) noexcept {
    // Bounds keep one booking after 25 fouls (or 3 after 2) from dominating.
    constexpr double MIN_RATIO = 1.0;
    constexpr double MAX_RATIO = 15.0;

    const double cards = snapshot.total_cards();
    const double fouls = snapshot.total_fouls();
    if (past_card_sample(snapshot, league) && cards > 0.0 && fouls > 0.0) {
        return std::clamp(fouls / cards, MIN_RATIO, MAX_RATIO);
    }
    return default_fouls_per_card(league);
}

// ─── expected_cards_remaining ────────────────────────────────────────────────

double expected_cards_remaining(const MatchSnapshot& snapshot,
                                phase::PhaseState phase,
                                const LeagueProfile& league) noexcept {
    const double remaining = rate::GoalRateEstimator::time_remaining(snapshot.minute);
    const double fouls = snapshot.total_fouls();

    double fouls_remaining = 0.0;
    if (past_card_sample(snapshot, league) && fouls > 0.0) {
        fouls_remaining = fouls / snapshot.minute * remaining;
    } else {
        fouls_remaining = std::max(league.cards_per_match, 0.0) *
                          default_fouls_per_card(league) *
                          remaining / constants::MATCH_MINUTES;
    }

    return fouls_remaining / fouls_per_card(snapshot, league) *
           detail::card_phase_factor(phase);
}

// ─── MarketCalculator::cards ─────────────────────────────────────────────────

std::optional<std::vector<MarketResult>>
MarketCalculator::cards(const MarketContext& ctx) noexcept {
    const MatchSnapshot& s = ctx.snapshot;
    const LeagueProfile& league = ctx.config.league;
    return detail::price_lines(MarketKind::Cards,
                               ctx.config.lines.cards,
                               s.total_cards(),
                               expected_cards_remaining(s, ctx.phase, league),
                               s.minute,
                               s.total_fouls() > 0.0,
                               past_card_sample(s, league),
                               std::nullopt,
                               "cards");
}

}  // namespace inplay::markets
