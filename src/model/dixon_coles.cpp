/// @file src/model/dixon_coles.cpp
/// @brief DixonColesCorrector — τ-corrected joint Poisson score matrix.
///
/// Construction:
///   1. Per-side Poisson marginals p_h(i), p_a(j), i, j ∈ [0, max_goals]
///   2. Outer product M = p_h · p_aᵀ (independent joint mass)
///   3. Multiply the four low-score cells by τ (if corrected)
///   4. Renormalise so M.sum() == 1 (absorbs truncation and τ drift)

#include "inplay/dixon_coles.hpp"
#include "inplay/poisson.hpp"

#include <algorithm>
#include <cmath>

namespace inplay::model {

// ─── Constructor ──────────────────────────────────────────────────────────────

DixonColesCorrector::DixonColesCorrector(double rho, int max_goals) noexcept
    : rho_(std::isfinite(rho) ? rho : 0.0)
    , max_goals_(max_goals) {}

// ─── tau ──────────────────────────────────────────────────────────────────────

double DixonColesCorrector::tau(int i, int j,
                                double home_rate,
                                double away_rate,
                                double rho) noexcept {
    double t = 1.0;
    if (i == 0 && j == 0) {
        t = 1.0 - home_rate * away_rate * rho;
    } else if (i == 1 && j == 0) {
        t = 1.0 + home_rate * rho;
    } else if (i == 0 && j == 1) {
        t = 1.0 + away_rate * rho;
    } else if (i == 1 && j == 1) {
        t = 1.0 - rho;
    }
    // Large |ρ| with large rates can push τ negative; a probability can't be.
    return std::max(t, 0.0);
}

// ─── score_matrix ─────────────────────────────────────────────────────────────

std::optional<ScoreMatrix>
DixonColesCorrector::score_matrix(double home_rate,
                                  double away_rate,
                                  bool corrected) const noexcept {
    if (max_goals_ < 1 ||
        !std::isfinite(home_rate) || !std::isfinite(away_rate) ||
        home_rate < 0.0 || away_rate < 0.0) {
        return std::nullopt;
    }

    const int n = max_goals_ + 1;
    Eigen::VectorXd home(n);
    Eigen::VectorXd away(n);
    for (int k = 0; k < n; ++k) {
        auto ph = poisson::pmf(k, home_rate);
        auto pa = poisson::pmf(k, away_rate);
        if (!ph || !pa) {
            return std::nullopt;
        }
        home(k) = *ph;
        away(k) = *pa;
    }

    ScoreMatrix m = home * away.transpose();

    if (corrected && rho_ != 0.0) {
        for (int i = 0; i <= 1; ++i) {
            for (int j = 0; j <= 1; ++j) {
                m(i, j) *= tau(i, j, home_rate, away_rate, rho_);
            }
        }
    }

    const double total = m.sum();
    if (!std::isfinite(total) || total <= 0.0) {
        return std::nullopt;
    }
    m /= total;
    return m;
}

// ─── btts_mass ────────────────────────────────────────────────────────────────

double DixonColesCorrector::btts_mass(const ScoreMatrix& m,
                                      int home_scored,
                                      int away_scored) noexcept {
    // A side that has already scored needs nothing more: its whole
    // dimension qualifies. Otherwise only rows/cols ≥ 1 count.
    const Eigen::Index row0 = home_scored > 0 ? 0 : 1;
    const Eigen::Index col0 = away_scored > 0 ? 0 : 1;
    if (row0 >= m.rows() || col0 >= m.cols()) {
        return 0.0;
    }
    return m.bottomRightCorner(m.rows() - row0, m.cols() - col0).sum();
}

// ─── independent_btts ─────────────────────────────────────────────────────────

double DixonColesCorrector::independent_btts(double home_rate,
                                             double away_rate) noexcept {
    return (1.0 - std::exp(-home_rate)) * (1.0 - std::exp(-away_rate));
}

// ─── result_mass ──────────────────────────────────────────────────────────────

ResultMass DixonColesCorrector::result_mass(const ScoreMatrix& m,
                                            int home_scored,
                                            int away_scored) noexcept {
    ResultMass r{0.0, 0.0, 0.0};
    const int lead = home_scored - away_scored;
    for (Eigen::Index i = 0; i < m.rows(); ++i) {
        for (Eigen::Index j = 0; j < m.cols(); ++j) {
            const long diff = lead + static_cast<long>(i) - static_cast<long>(j);
            if (diff > 0) {
                r.home_win += m(i, j);
            } else if (diff == 0) {
                r.draw += m(i, j);
            } else {
                r.away_win += m(i, j);
            }
        }
    }
    return r;
}

// ─── remaining_at_most ────────────────────────────────────────────────────────

double DixonColesCorrector::remaining_at_most(const ScoreMatrix& m, int k) noexcept {
    if (k < 0) {
        return 0.0;
    }
    double mass = 0.0;
    for (Eigen::Index i = 0; i < m.rows() && i <= k; ++i) {
        for (Eigen::Index j = 0; j < m.cols() && i + j <= k; ++j) {
            mass += m(i, j);
        }
    }
    return std::min(mass, 1.0);
}

// ─── correct_scores ───────────────────────────────────────────────────────────

std::vector<ScoreProbability>
DixonColesCorrector::correct_scores(const ScoreMatrix& m,
                                    int home_scored,
                                    int away_scored,
                                    std::size_t top_n) noexcept {
    std::vector<ScoreProbability> scores;
    scores.reserve(static_cast<std::size_t>(m.size()));
    for (Eigen::Index i = 0; i < m.rows(); ++i) {
        for (Eigen::Index j = 0; j < m.cols(); ++j) {
            scores.push_back(ScoreProbability{
                .home_goals  = home_scored + static_cast<int>(i),
                .away_goals  = away_scored + static_cast<int>(j),
                .probability = m(i, j),
            });
        }
    }

    // Stable so equal masses keep row-major (fewest home goals first) order.
    std::stable_sort(scores.begin(), scores.end(),
                     [](const ScoreProbability& a, const ScoreProbability& b) {
                         return a.probability > b.probability;
                     });

    if (scores.size() > top_n) {
        scores.resize(top_n);
    }
    return scores;
}

}  // namespace inplay::model
