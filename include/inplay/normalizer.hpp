#pragma once

/// @file include/inplay/normalizer.hpp
/// @brief ProbabilityNormalizer — bound and sum invariants for a set of
///        mutually-exclusive outcomes.
///
/// # Module: Probability Normalizer
///
/// ## Contract (clamp-then-normalize)
///   1. clamp each raw value into [floor, ceiling]
///   2. sum the clamped values
///   3. rescale every value by 100 / sum
///
/// There is no step 4. Clamping again after the rescale would move the
/// total off 100 (by up to ~1.8 pp with a 5-point floor on a 1X2 set),
/// so the rescale is always the last operation.
///
/// ## Guarantees
/// - Output sums to 100 within 1e-6 and every value lies in [0, 100]
/// - Relative order of the inputs is preserved
/// - `nullopt` if the input is empty, has a non-finite value, the bounds
///   are invalid, or the clamped sum is not positive

#include "inplay/constants.hpp"

#include <optional>
#include <span>
#include <utility>
#include <vector>

namespace inplay {

class ProbabilityNormalizer {
public:
    ProbabilityNormalizer() = delete;

    /// Clamp into [floor, ceiling], then rescale to a total of 100.
    [[nodiscard]] static std::optional<std::vector<double>>
    normalize(std::span<const double> raw,
              double floor   = 0.0,
              double ceiling = constants::PROBABILITY_CEILING) noexcept;

    /// Two-outcome convenience form (Yes/No, Over/Under).
    ///
    /// # Returns
    /// {first, second} summing to 100, or `nullopt` as for normalize().
    [[nodiscard]] static std::optional<std::pair<double, double>>
    normalize_pair(double first, double second,
                   double floor   = 0.0,
                   double ceiling = constants::PROBABILITY_CEILING) noexcept;

    /// True if |Σ values − 100| < tolerance and every value is in [0, 100].
    [[nodiscard]] static bool
    is_normalized(std::span<const double> values,
                  double tolerance = constants::SUM_TOLERANCE) noexcept;
};

}  // namespace inplay
