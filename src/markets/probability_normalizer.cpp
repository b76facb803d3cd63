/// @file src/markets/probability_normalizer.cpp
/// @brief ProbabilityNormalizer — clamp, sum, rescale. In that order only.

#include "inplay/normalizer.hpp"

#include <algorithm>
#include <cmath>

namespace inplay {

// ─── normalize ────────────────────────────────────────────────────────────────

std::optional<std::vector<double>>
ProbabilityNormalizer::normalize(std::span<const double> raw,
                                 double floor,
                                 double ceiling) noexcept {
    if (raw.empty() || !std::isfinite(floor) || !std::isfinite(ceiling) ||
        floor < 0.0 || ceiling < floor) {
        return std::nullopt;
    }

    // Step 1: clamp.
    std::vector<double> out;
    out.reserve(raw.size());
    for (double v : raw) {
        if (!std::isfinite(v)) {
            return std::nullopt;
        }
        out.push_back(std::clamp(v, floor, ceiling));
    }

    // Step 2: sum.
    double sum = 0.0;
    for (double v : out) {
        sum += v;
    }
    if (sum <= 0.0) {
        return std::nullopt;
    }

    // Step 3: rescale. Nothing touches the values after this.
    const double scale = 100.0 / sum;
    for (double& v : out) {
        v *= scale;
    }
    return out;
}

// ─── normalize_pair ───────────────────────────────────────────────────────────

std::optional<std::pair<double, double>>
ProbabilityNormalizer::normalize_pair(double first, double second,
                                      double floor, double ceiling) noexcept {
    const double raw[2] = {first, second};
    auto out = normalize(raw, floor, ceiling);
    if (!out) {
        return std::nullopt;
    }
    return std::pair<double, double>{(*out)[0], (*out)[1]};
}

// ─── is_normalized ────────────────────────────────────────────────────────────

bool ProbabilityNormalizer::is_normalized(std::span<const double> values,
                                          double tolerance) noexcept {
    if (values.empty()) {
        return false;
    }
    double sum = 0.0;
    for (double v : values) {
        if (!std::isfinite(v) || v < 0.0 || v > 100.0) {
            return false;
        }
        sum += v;
    }
    return std::abs(sum - 100.0) < tolerance;
}

}  // namespace inplay
