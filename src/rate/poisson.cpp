/// @file src/rate/poisson.cpp
/// @brief Log-space Poisson pmf / cdf.

#include "inplay/poisson.hpp"

#include <algorithm>
#include <cmath>

namespace inplay::poisson {

namespace {

bool valid_lambda(double lambda) noexcept {
    return std::isfinite(lambda) && lambda >= 0.0;
}

/// log P(X = k), k ≥ 0, lambda > 0.
double log_pmf(int k, double lambda) noexcept {
    const double kd = static_cast<double>(k);
    return -lambda + kd * std::log(lambda) - std::lgamma(kd + 1.0);
}

}  // anonymous namespace

// ─── pmf ──────────────────────────────────────────────────────────────────────

std::optional<double> pmf(int k, double lambda) noexcept {
    if (!valid_lambda(lambda)) {
        return std::nullopt;
    }
    if (k < 0) {
        return 0.0;
    }
    if (lambda == 0.0) {
        return k == 0 ? 1.0 : 0.0;
    }
    return std::exp(log_pmf(k, lambda));
}

// ─── cdf ──────────────────────────────────────────────────────────────────────

std::optional<double> cdf(int k, double lambda) noexcept {
    if (!valid_lambda(lambda)) {
        return std::nullopt;
    }
    if (k < 0) {
        return 0.0;
    }
    if (lambda == 0.0) {
        return 1.0;
    }

    // Each term is evaluated independently in log space, so neither λ^i nor
    // i! is ever formed. Terms below the mode are increasing; summing them
    // in order keeps the small ones from being swamped.
    double sum = 0.0;
    for (int i = 0; i <= k; ++i) {
        sum += std::exp(log_pmf(i, lambda));
    }
    return std::clamp(sum, 0.0, 1.0);
}

// ─── at_least ─────────────────────────────────────────────────────────────────

std::optional<double> at_least(int k, double lambda) noexcept {
    auto below = cdf(k - 1, lambda);
    if (!below) {
        return std::nullopt;
    }
    return std::clamp(1.0 - *below, 0.0, 1.0);
}

}  // namespace inplay::poisson
