#pragma once

/// @file include/inplay/best_bet.hpp
/// @brief BestBetSelector — ranks every priced selection of one match.
///
/// # Module: Best Bet Selector
///
/// ## Ranking rule
///   1. probability, descending
///   2. at equal probability (same 1e-9 bucket, llround(p / 1e-9)): higher
///      `specificity(kind)` first
///   3. then MarketKind order, then line ascending, then team (Home first),
///      then Selection order
///
/// The order is total, so the same input always ranks identically.
/// Complete selections and non-finite probabilities never enter the list.
///
/// ## Value Estimate
/// Each ranked pick carries a rough value estimate against a typical
/// bookmaker margin: fair odds 100/p; margin 5% (p ≥ 80), 7% (p ≥ 60),
/// otherwise 10%; edge = p − 100/market_odds in percentage points.
/// Value is informational only; it does not affect the rank.

#include "inplay/constants.hpp"
#include "inplay/market.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace inplay::select {

enum class ValueStrength : std::uint8_t {
    Weak,
    Good,
    Strong,
    VeryStrong,
};

[[nodiscard]] const char* to_string(ValueStrength v) noexcept;

struct ValueEstimate {
    double        fair_odds;
    double        market_odds;  ///< Fair odds less the assumed margin
    double        edge;         ///< Percentage points
    ValueStrength strength;
};

struct RankedPick {
    MarketResult  result;
    ValueEstimate value;
};

/// Filters applied on top of the ranking.
struct SelectorConfig {
    std::size_t top_n                 = constants::DEFAULT_TOP_N;
    double      min_probability       = 0.0;
    double      value_min_probability = constants::VALUE_MIN_PROBABILITY;
    double      value_min_edge        = constants::VALUE_MIN_EDGE;
};

struct Recommendation {
    std::vector<RankedPick>   ranked;      ///< Every active pick, best first
    std::optional<RankedPick> best;        ///< Top pick ≥ min_probability
    std::vector<RankedPick>   top;         ///< First top_n of `ranked`
    std::vector<RankedPick>   value_bets;  ///< Ranked picks passing the value filter
    std::size_t               excluded_complete = 0;
};

class BestBetSelector {
public:
    BestBetSelector() = delete;

    /// Rank all results of one match.
    [[nodiscard]] static Recommendation
    select(std::span<const MarketResult> results,
           const SelectorConfig& config = SelectorConfig{}) noexcept;

    /// Strict-weak ordering used by select(); true if `a` ranks above `b`.
    [[nodiscard]] static bool
    ranks_before(const MarketResult& a, const MarketResult& b) noexcept;

    /// Value estimate for a probability in percent.
    [[nodiscard]] static ValueEstimate estimate_value(double probability) noexcept;
};

}  // namespace inplay::select
