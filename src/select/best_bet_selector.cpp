/// @file src/select/best_bet_selector.cpp
/// @brief BestBetSelector — deterministic probability-first ranking.

#include "inplay/best_bet.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <limits>
#include <utility>

namespace inplay::select {

namespace {

/// Absent sorts before present; then ascending.
template <typename T>
int compare_optional(const std::optional<T>& a, const std::optional<T>& b) noexcept {
    if (a.has_value() != b.has_value()) {
        return a.has_value() ? 1 : -1;
    }
    if (!a) {
        return 0;
    }
    if (*a < *b) return -1;
    if (*b < *a) return 1;
    return 0;
}

double margin_for(double probability) noexcept {
    if (probability >= 80.0) return 0.05;
    if (probability >= 60.0) return 0.07;
    return 0.10;
}

/// Probability quantized to RANK_TIE_EPSILON steps. Comparing buckets keeps
/// the order transitive; a plain |Δp| < ε test does not.
long long tie_bucket(double probability) noexcept {
    constexpr double BUCKET_LIMIT = 1e18;
    if (std::isnan(probability)) {
        return std::numeric_limits<long long>::min();
    }
    const double q = std::clamp(probability / constants::RANK_TIE_EPSILON,
                                -BUCKET_LIMIT, BUCKET_LIMIT);
    return std::llround(q);
}

ValueStrength strength_for(double edge) noexcept {
    if (edge >= 8.0) return ValueStrength::VeryStrong;
    if (edge >= 5.0) return ValueStrength::Strong;
    if (edge >= 2.0) return ValueStrength::Good;
    return ValueStrength::Weak;
}

}  // anonymous namespace

const char* to_string(ValueStrength v) noexcept {
    switch (v) {
        case ValueStrength::Weak:       return "WEAK";
        case ValueStrength::Good:       return "GOOD";
        case ValueStrength::Strong:     return "STRONG";
        case ValueStrength::VeryStrong: return "VERY_STRONG";
    }
    return "?";
}

// ─── ranks_before ─────────────────────────────────────────────────────────────

bool BestBetSelector::ranks_before(const MarketResult& a,
                                   const MarketResult& b) noexcept {
    const long long qa = tie_bucket(a.probability);
    const long long qb = tie_bucket(b.probability);
    if (qa != qb) {
        return qa > qb;
    }
    const int sa = specificity(a.kind);
    const int sb = specificity(b.kind);
    if (sa != sb) {
        return sa > sb;
    }
    if (a.kind != b.kind) {
        return a.kind < b.kind;
    }
    if (const int c = compare_optional(a.line, b.line); c != 0) {
        return c < 0;
    }
    if (const int c = compare_optional(a.team, b.team); c != 0) {
        return c < 0;
    }
    return a.selection < b.selection;
}

// ─── estimate_value ───────────────────────────────────────────────────────────

ValueEstimate BestBetSelector::estimate_value(double probability) noexcept {
    // Below 1% the fair price is capped rather than running off to infinity.
    constexpr double MAX_FAIR_ODDS = 100.0;

    const double fair = probability > 1.0 ? 100.0 / probability : MAX_FAIR_ODDS;
    const double market = fair * (1.0 - margin_for(probability));
    const double edge = probability - 100.0 / market;
    return ValueEstimate{
        .fair_odds   = fair,
        .market_odds = market,
        .edge        = edge,
        .strength    = strength_for(edge),
    };
}

// ─── select ───────────────────────────────────────────────────────────────────

Recommendation BestBetSelector::select(std::span<const MarketResult> results,
                                       const SelectorConfig& config) noexcept {
    Recommendation rec;

    std::vector<MarketResult> active;
    active.reserve(results.size());
    for (const auto& r : results) {
        if (r.is_complete()) {
            ++rec.excluded_complete;
            continue;
        }
        if (!std::isfinite(r.probability)) {
            continue;
        }
        active.push_back(r);
    }

    std::sort(active.begin(), active.end(), &BestBetSelector::ranks_before);

    rec.ranked.reserve(active.size());
    for (auto& r : active) {
        const ValueEstimate value = estimate_value(r.probability);
        rec.ranked.push_back(RankedPick{.result = std::move(r), .value = value});
    }

    if (!rec.ranked.empty() &&
        rec.ranked.front().result.probability >= config.min_probability) {
        rec.best = rec.ranked.front();
    }

    // Unfiltered, so a caller whose threshold rejects `best` still gets picks.
    const std::size_t n = std::min(config.top_n, rec.ranked.size());
    rec.top.assign(rec.ranked.begin(), rec.ranked.begin() + static_cast<std::ptrdiff_t>(n));

    for (const auto& pick : rec.ranked) {
        if (pick.value.edge >= config.value_min_edge &&
            pick.result.probability >= config.value_min_probability) {
            rec.value_bets.push_back(pick);
        }
    }
    return rec;
}

}  // namespace inplay::select
