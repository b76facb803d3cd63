#pragma once

/// @file include/inplay/poisson.hpp
/// @brief Numerically stable Poisson mass and cumulative distribution.
///
/// # Module: Poisson
///
/// ## Responsibility
/// Every count market (goals, team goals, cards, corners) reduces to
/// P(X ≤ k) for X ~ Poisson(λ). The naive form
///
///     Σ e^{−λ} λ^i / i!
///
/// overflows i! and λ^i long before λ reaches realistic corner counts and
/// loses all precision once λ passes ~20. Here each term is evaluated in
/// log space:
///
///     log p_i = −λ + i·log λ − lgamma(i + 1)
///
/// so no intermediate exceeds double range, and the sum is limited to [0, 1].
///
/// ## Guarantees
/// - `noexcept`; `nullopt` for negative or non-finite λ
/// - λ = 0 is the degenerate distribution at 0
/// - No heap allocation

#include <optional>

namespace inplay::poisson {

/// P(X = k) for X ~ Poisson(lambda).
///
/// # Returns
/// - 0 for k < 0
/// - `nullopt` if lambda < 0 or non-finite
[[nodiscard]] std::optional<double> pmf(int k, double lambda) noexcept;

/// P(X ≤ k) for X ~ Poisson(lambda).
///
/// # Returns
/// - 0 for k < 0, 1 for lambda = 0 and k ≥ 0
/// - `nullopt` if lambda < 0 or non-finite
[[nodiscard]] std::optional<double> cdf(int k, double lambda) noexcept;

/// P(X ≥ k) = 1 − P(X ≤ k − 1).
[[nodiscard]] std::optional<double> at_least(int k, double lambda) noexcept;

}  // namespace inplay::poisson
