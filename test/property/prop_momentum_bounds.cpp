/**
 * @file  prop_momentum_bounds.cpp
 * @brief Property: attack multiplier ∈ [0.2, 1.0] and windows never see stale events
 *
 * Run with 10,000 random inputs:
 *   RC_PARAMS="max_success=10000" ./prop_momentum_bounds
 */

#include <rapidcheck.h>
#include <cmath>
#include <vector>

#include "inplay/momentum.hpp"

using namespace inplay;
using namespace inplay::momentum;

int main() {
    // ── Property 1: multiplier bounded for any ratio in [0, 1] ──────────────
    rc::check(
        "momentum: multiplier in [0.2, 1.0] for ratio in [0, 1]",
        [](unsigned raw) {
            const double ratio = static_cast<double>(raw % 100001) / 100000.0;
            const double m = MomentumTracker::attack_multiplier(ratio);
            RC_ASSERT(m >= 0.2);
            RC_ASSERT(m <= 1.0);
        }
    );

    // ── Property 2: only events within [t − 5, t] are tallied ───────────────
    rc::check(
        "momentum: events outside the trailing window never count",
        [](const std::vector<unsigned>& offsets, unsigned now_raw) {
            const double now = static_cast<double>(now_raw % 95);
            std::vector<MatchEvent> events;
            int expected = 0;
            for (unsigned o : offsets) {
                // Event minute in [now − 20, now + 5).
                const double minute = now - 20.0 + static_cast<double>(o % 250) / 10.0;
                events.push_back(MatchEvent{.minute = minute, .side = Side::Home,
                                            .kind = EventKind::Shot});
                if (minute >= now - 5.0 && minute <= now) ++expected;
            }
            const auto w = MomentumTracker::window(events, now);
            RC_ASSERT(w.home.total() == expected);
            RC_ASSERT(w.away.total() == 0);

            const double r = w.ratio(Side::Home);
            RC_ASSERT(r == (expected > 0 ? 1.0 : 0.5));
        }
    );

    return 0;
}
