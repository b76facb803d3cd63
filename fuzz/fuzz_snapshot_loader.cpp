/**
 * @file  fuzz_snapshot_loader.cpp
 * @brief libFuzzer target for SnapshotLoader::parse_csv_string
 *
 * Build:
 *   cmake -DINPLAY_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_snapshot_loader
 *
 * Run for 60 seconds:
 *   ./fuzz_snapshot_loader -max_total_time=60
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB, no abort for any byte sequence.
 *   2. Every snapshot returned is fully coerced:
 *      a. minute and every team statistic finite and ≥ 0
 *      b. scores in [0, 99]
 *      c. possession ≤ 100
 *      d. every event and substitution minute finite
 *
 * Fuzzer strategy:
 *   Input is passed directly as CSV text.  The parser must handle:
 *     • Binary garbage (null bytes, high bytes)
 *     • "nan", "inf", "-inf" text tokens
 *     • Mismatched cell counts
 *     • Malformed events cells ("::", ";;;", "1e308:H:shot")
 *     • CRLF and bare CR line endings
 */

#include <cstddef>
#include <cstdint>
#include <cassert>
#include <cmath>
#include <string_view>

#include "inplay/snapshot_loader.hpp"

using namespace inplay;
using namespace inplay::core;

namespace {

void check_stats(const TeamStats& t) {
    for (double v : {t.xg, t.shots, t.shots_on_target, t.corners, t.yellow_cards,
                     t.red_cards, t.fouls, t.possession, t.dangerous_attacks}) {
        assert(std::isfinite(v));
        assert(v >= 0.0);
    }
    assert(t.possession <= 100.0);
}

}  // anonymous namespace

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const std::string_view input{
        reinterpret_cast<const char*>(data), size
    };

    const auto snapshots = SnapshotLoader::parse_csv_string(input);

    for (const auto& s : snapshots) {
        assert(std::isfinite(s.minute));
        assert(s.minute >= 0.0);
        assert(s.home_score >= 0 && s.home_score <= 99);
        assert(s.away_score >= 0 && s.away_score <= 99);
        check_stats(s.home);
        check_stats(s.away);
        for (const auto& e : s.recent_events) {
            assert(std::isfinite(e.minute));
        }
        for (const auto& sub : s.substitutions) {
            assert(std::isfinite(sub.minute));
        }
    }

    return 0;
}
