/**
 * @file  bench/bench_evaluate.cpp
 * @brief Google Benchmark suite for the in-play evaluation pipeline.
 *
 * Benchmarks
 * ----------
 *   BM_ScoreMatrix_Corrected / Independent   — 11×11 Dixon-Coles matrix
 *   BM_PoissonCdf                            — log-space tail at the 6.5 line
 *   BM_Evaluate_Single                       — one snapshot, all 8 markets
 *   BM_Evaluate_Batch                        — N independent fixtures
 *   BM_ParseCsv                              — SnapshotLoader throughput
 *
 * Build (CMake):
 *   cmake -DINPLAY_BENCH=ON ..
 *   cmake --build build --target bench_evaluate
 *   ./build/bench_evaluate --benchmark_format=json
 *
 * Throughput units: items/second (snapshots evaluated).
 */

#include "benchmark/benchmark.h"

#include "inplay/dixon_coles.hpp"
#include "inplay/engine.hpp"
#include "inplay/poisson.hpp"
#include "inplay/snapshot_loader.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

// ── Fixture helpers ────────────────────────────────────────────────────────────

/// A mid-second-half snapshot with a populated momentum window.
static inplay::MatchSnapshot make_snapshot(std::int64_t id, double minute) {
    inplay::MatchSnapshot s;
    s.fixture_id = id;
    s.minute     = minute;
    s.home_score = 1;
    s.has_xg     = true;
    s.home.xg    = 0.02 * minute;
    s.away.xg    = 0.015 * minute;
    s.home.fouls = 0.15 * minute;
    s.away.fouls = 0.12 * minute;
    s.home.corners = 0.06 * minute;
    s.away.corners = 0.04 * minute;
    s.home.yellow_cards = 1;
    for (int i = 0; i < 6; ++i) {
        s.recent_events.push_back(inplay::MatchEvent{
            .minute = minute - i,
            .side   = (i % 3 == 0) ? inplay::Side::Away : inplay::Side::Home,
            .kind   = static_cast<inplay::EventKind>(i % 3),
        });
    }
    return s;
}

// ── Model building blocks ──────────────────────────────────────────────────────

static void BM_ScoreMatrix_Corrected(benchmark::State& state) {
    const inplay::model::DixonColesCorrector dc;
    for (auto _ : state) {
        auto m = dc.score_matrix(1.3, 0.9, true);
        benchmark::DoNotOptimize(m);
    }
}
BENCHMARK(BM_ScoreMatrix_Corrected);

static void BM_ScoreMatrix_Independent(benchmark::State& state) {
    const inplay::model::DixonColesCorrector dc;
    for (auto _ : state) {
        auto m = dc.score_matrix(1.3, 0.9, false);
        benchmark::DoNotOptimize(m);
    }
}
BENCHMARK(BM_ScoreMatrix_Independent);

static void BM_PoissonCdf(benchmark::State& state) {
    for (auto _ : state) {
        auto c = inplay::poisson::cdf(6, 2.7);
        benchmark::DoNotOptimize(c);
    }
}
BENCHMARK(BM_PoissonCdf);

// ── Pipeline ───────────────────────────────────────────────────────────────────

static void BM_Evaluate_Single(benchmark::State& state) {
    const inplay::core::Engine engine;
    const auto s = make_snapshot(1, 67.0);
    for (auto _ : state) {
        auto eval = engine.evaluate(s);
        benchmark::DoNotOptimize(eval);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_Evaluate_Single);

static void BM_Evaluate_Batch(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    std::vector<inplay::MatchSnapshot> batch;
    batch.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        batch.push_back(make_snapshot(static_cast<std::int64_t>(i),
                                      10.0 + static_cast<double>(i % 80)));
    }
    const inplay::core::Engine engine;
    for (auto _ : state) {
        auto evals = engine.evaluate_all(batch);
        benchmark::DoNotOptimize(evals);
    }
    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(n));
    state.counters["fixtures_per_sec"] = benchmark::Counter(
        static_cast<double>(state.iterations() * static_cast<int64_t>(n)),
        benchmark::Counter::kIsRate);
}
BENCHMARK(BM_Evaluate_Batch)->Arg(10)->Arg(100)->Arg(1000);

static void BM_ParseCsv(benchmark::State& state) {
    std::string csv = "fixture_id,minute,home_score,away_score,home_xg,away_xg,events\n";
    for (int i = 0; i < 500; ++i) {
        csv += std::to_string(i) + ",55,1,0,1.10,0.72,51:H:shot;53:A:corner;54:H:attack\n";
    }
    for (auto _ : state) {
        auto snaps = inplay::core::SnapshotLoader::parse_csv_string(csv);
        benchmark::DoNotOptimize(snaps);
    }
    state.SetItemsProcessed(state.iterations() * 500);
}
BENCHMARK(BM_ParseCsv);

BENCHMARK_MAIN();
