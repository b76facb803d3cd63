#pragma once

/// @file include/inplay/dixon_coles.hpp
/// @brief DixonColesCorrector — low-score correlation correction of the
///        independent-Poisson scoreline distribution.
///
/// # Module: Dixon-Coles Corrector
///
/// ## The Core Idea
/// Independent Poisson models misprice the four low scorelines. Dixon & Coles
/// (1997) multiply each cell of the joint mass by
///
///     τ(0,0) = 1 − λμρ
///     τ(1,0) = 1 + λρ
///     τ(0,1) = 1 + μρ
///     τ(1,1) = 1 − ρ
///     τ(i,j) = 1  otherwise
///
/// where λ, μ are the home/away expected goals and ρ the correlation.
///
/// ## Score Matrix
/// The corrected distribution of the *remaining* goals is held in an
/// `Eigen::MatrixXd` M with M(i, j) = P(home scores i more, away scores j
/// more), truncated at `max_goals` per side and renormalised so that
/// M.sum() == 1. All market masses are reductions of M.
///
/// ## BTTS
/// P(BTTS) is the corrected mass over cells where both teams end with at
/// least one goal. It is never P(home scores) × P(away scores) taken from
/// the corrected marginals: that product assumes independence and discards
/// the very correlation the correction encodes.
///
/// ## Guarantees
/// - `noexcept`; `nullopt` for negative / non-finite rates or max_goals < 1
/// - τ is floored at 0 so no cell can go negative for extreme ρ
/// - With ρ = 0 the matrix equals the independent-Poisson outer product

#include "inplay/types.hpp"

#include <Eigen/Dense>

#include <cstddef>
#include <optional>
#include <vector>

namespace inplay::model {

/// Joint distribution of remaining goals, rows = home, cols = away.
using ScoreMatrix = Eigen::MatrixXd;

/// Outcome masses of a scoreline distribution (fractions, sum = 1).
struct ResultMass {
    double home_win;
    double draw;
    double away_win;
};

/// One entry of the correct-score list, as a final scoreline.
struct ScoreProbability {
    int    home_goals;
    int    away_goals;
    double probability;  ///< Fraction in [0, 1]
};

class DixonColesCorrector {
public:
    /// # Arguments
    /// * `rho`       — correlation parameter (default −0.05)
    /// * `max_goals` — per-side truncation of the score matrix
    explicit DixonColesCorrector(double rho = -0.05, int max_goals = 10) noexcept;

    /// Correction factor τ(i, j). 1.0 outside the four low-score cells.
    [[nodiscard]] static double
    tau(int i, int j, double home_rate, double away_rate, double rho) noexcept;

    /// Corrected (or, with `corrected = false`, independent) score matrix.
    [[nodiscard]] std::optional<ScoreMatrix>
    score_matrix(double home_rate, double away_rate,
                 bool corrected = true) const noexcept;

    /// P(both teams finish on ≥ 1 goal), given goals already scored.
    /// Summed over the corrected joint mass.
    [[nodiscard]] static double
    btts_mass(const ScoreMatrix& m, int home_scored = 0, int away_scored = 0) noexcept;

    /// Naive independent BTTS: (1 − e^{−λ})(1 − e^{−μ}) for a 0-0 start.
    [[nodiscard]] static double
    independent_btts(double home_rate, double away_rate) noexcept;

    /// Final-result masses, offset by the current score.
    [[nodiscard]] static ResultMass
    result_mass(const ScoreMatrix& m, int home_scored, int away_scored) noexcept;

    /// P(total remaining goals ≤ k).
    [[nodiscard]] static double
    remaining_at_most(const ScoreMatrix& m, int k) noexcept;

    /// Most likely final scorelines, descending.
    [[nodiscard]] static std::vector<ScoreProbability>
    correct_scores(const ScoreMatrix& m, int home_scored, int away_scored,
                   std::size_t top_n) noexcept;

    [[nodiscard]] double rho() const noexcept { return rho_; }
    [[nodiscard]] int max_goals() const noexcept { return max_goals_; }

private:
    double rho_;
    int    max_goals_;
};

}  // namespace inplay::model
