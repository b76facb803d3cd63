/**
 * @file  prop_dixon_coles_distribution.cpp
 * @brief Property: the corrected score matrix is always a distribution
 *
 * Run with 10,000 random inputs:
 *   RC_PARAMS="max_success=10000" ./prop_dixon_coles_distribution
 *
 * For λ_h, λ_a ∈ [0, 4) and ρ ∈ [−0.2, 0.2]:
 *   1. every cell ≥ 0 and Σ cells = 1 ± 1e-12
 *   2. BTTS mass ∈ [0, 1]
 *   3. home / draw / away masses sum to 1
 */

#include <rapidcheck.h>
#include <cmath>

#include "inplay/dixon_coles.hpp"

using namespace inplay::model;

int main() {
    rc::check(
        "dixon_coles: score matrix is a probability distribution",
        [](unsigned h, unsigned a, int r) {
            const double lh  = static_cast<double>(h % 4000) / 1000.0;
            const double la  = static_cast<double>(a % 4000) / 1000.0;
            const double rho = static_cast<double>(r % 201) / 1000.0;

            const DixonColesCorrector dc(rho);
            auto m = dc.score_matrix(lh, la);
            RC_ASSERT(m.has_value());
            RC_ASSERT(m->minCoeff() >= 0.0);
            RC_ASSERT(std::abs(m->sum() - 1.0) < 1e-12);

            const double btts = DixonColesCorrector::btts_mass(*m);
            RC_ASSERT(btts >= 0.0 && btts <= 1.0 + 1e-12);

            const auto res = DixonColesCorrector::result_mass(*m, 0, 0);
            RC_ASSERT(std::abs(res.home_win + res.draw + res.away_win - 1.0) < 1e-12);
        }
    );

    return 0;
}
