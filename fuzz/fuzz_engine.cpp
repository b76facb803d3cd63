/**
 * @file  fuzz_engine.cpp
 * @brief libFuzzer target for the full Engine pipeline (end-to-end)
 *
 * Build:
 *   cmake -DINPLAY_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_engine
 *
 * Run for 60 seconds:
 *   ./fuzz_engine -max_total_time=60
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB, no abort for any raw feed values including NaN,
 *      ±Inf, ±0.0, subnormals and huge magnitudes.
 *   2. Every MarketResult probability is finite and in [0, 100].
 *   3. Match Result and Next Goal each sum to 100 (when priced).
 *   4. No Complete result is ever ranked.
 *   5. Evaluating the same snapshot twice gives identical probabilities.
 *
 * Fuzzer strategy:
 *   Input bytes → doubles → RawSnapshot fields → coerce() → Engine.
 *   Trailing bytes become momentum events.
 */

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <cassert>
#include <cmath>

#include "inplay/engine.hpp"

using namespace inplay;
using namespace inplay::core;

namespace {

class ByteReader {
public:
    ByteReader(const uint8_t* data, size_t size) : data_(data), size_(size) {}

    double next_double() {
        double v = 0.0;
        if (pos_ + sizeof(double) <= size_) {
            std::memcpy(&v, data_ + pos_, sizeof(double));
            pos_ += sizeof(double);
        }
        return v;
    }

    bool has_byte() const { return pos_ < size_; }
    uint8_t next_byte() { return has_byte() ? data_[pos_++] : 0; }

private:
    const uint8_t* data_;
    size_t size_;
    size_t pos_ = 0;
};

RawTeamStats read_stats(ByteReader& in) {
    RawTeamStats t;
    t.xg                = in.next_double();
    t.shots             = in.next_double();
    t.shots_on_target   = in.next_double();
    t.corners           = in.next_double();
    t.yellow_cards      = in.next_double();
    t.red_cards         = in.next_double();
    t.fouls             = in.next_double();
    t.possession        = in.next_double();
    t.dangerous_attacks = in.next_double();
    return t;
}

double sum_of(const std::vector<MarketResult>& rs, MarketKind kind, int& count) {
    double sum = 0.0;
    count = 0;
    for (const auto& r : rs) {
        if (r.kind == kind) {
            sum += r.probability;
            ++count;
        }
    }
    return sum;
}

}  // anonymous namespace

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    ByteReader in(data, size);

    RawSnapshot raw;
    raw.fixture_id = 1;
    raw.minute     = in.next_double();
    raw.home_score = in.next_double();
    raw.away_score = in.next_double();
    raw.home       = read_stats(in);
    raw.away       = read_stats(in);

    // Remaining bytes: (minute byte, side/kind byte) pairs.
    while (in.has_byte()) {
        const uint8_t m = in.next_byte();
        const uint8_t k = in.next_byte();
        raw.recent_events.push_back(MatchEvent{
            .minute = static_cast<double>(m),
            .side   = (k & 1) ? Side::Away : Side::Home,
            .kind   = static_cast<EventKind>((k >> 1) % 3),
        });
    }

    const MatchSnapshot snapshot = coerce(raw);
    const Engine engine;
    const auto eval = engine.evaluate(snapshot);

    // Invariant 2: every probability in range
    for (const auto& r : eval.results) {
        assert(std::isfinite(r.probability));
        assert(r.probability >= 0.0);
        assert(r.probability <= 100.0 + 1e-9);
    }

    // Invariant 3: mutually exclusive sets sum to 100
    for (MarketKind kind : {MarketKind::MatchResult, MarketKind::NextGoal}) {
        int count = 0;
        const double sum = sum_of(eval.results, kind, count);
        if (count > 0) {
            assert(count == 3);
            assert(std::abs(sum - 100.0) < 1e-6);
        }
    }

    // Invariant 4: Complete never ranked
    for (const auto& pick : eval.recommendation.ranked) {
        assert(!pick.result.is_complete());
    }

    // Invariant 5: score-matrix readings are a distribution
    if (eval.final_result) {
        const auto& fr = *eval.final_result;
        assert(std::abs(fr.home_win + fr.draw + fr.away_win - 1.0) < 1e-6);
    }
    for (const auto& ml : eval.matrix_total_goals) {
        assert(ml.over >= -1e-9 && ml.over <= 100.0 + 1e-9);
    }

    // Invariant 6: idempotence
    const auto again = engine.evaluate(snapshot);
    assert(again.results.size() == eval.results.size());
    for (size_t i = 0; i < eval.results.size(); ++i) {
        assert(again.results[i].probability == eval.results[i].probability);
    }

    return 0;
}
