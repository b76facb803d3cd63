/// @file src/main.cpp
/// @brief inplay CLI entry point.
///
/// Usage:
///   inplay --evaluate <csv_file> [options]   Price every snapshot in a CSV file
///   inplay --stream [options]                Read snapshot rows from stdin
///   inplay --help                            Print usage

#include "inplay/engine.hpp"
#include "inplay/snapshot_loader.hpp"

#include <fmt/core.h>

#include <charconv>
#include <cstdint>
#include <iostream>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace {

void print_usage() {
    fmt::print(
        "Usage:\n"
        "  inplay --evaluate <csv_file> [options]   Price every snapshot row\n"
        "  inplay --stream [options]                Stream snapshot rows from stdin\n"
        "  inplay --help                            Show this help\n"
        "\n"
        "Options:\n"
        "  --top N            Number of picks listed per snapshot (default 5)\n"
        "  --min-prob P       Minimum probability for the best pick (default 0)\n"
        "  --rho R            Dixon-Coles rho (default -0.05)\n"
        "  --no-dixon-coles   Independent Poisson scores\n"
        "  --verbose          Report dropped markets on stderr\n"
        "\n"
        "CSV format (header required, columns in any order):\n"
        "  fixture_id,minute,home_score,away_score,home_xg,away_xg,\n"
        "  home_shots,away_shots,home_shots_on_target,away_shots_on_target,\n"
        "  home_corners,away_corners,home_yellow,away_yellow,home_red,away_red,\n"
        "  home_fouls,away_fouls,home_possession,away_possession,\n"
        "  home_dangerous_attacks,away_dangerous_attacks,events,substitutions\n"
    );
}

template <typename T>
std::optional<T> parse_arg(std::string_view s) noexcept {
    T v{};
    const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
    if (ec != std::errc{} || ptr != s.data() + s.size()) {
        return std::nullopt;
    }
    return v;
}

void print_evaluation(const inplay::core::Evaluation& eval) {
    const auto& rec = eval.recommendation;
    fmt::print("Fixture {}  minute {:.0f}  phase {}  xG to come {:.2f}/{:.2f}{}\n",
               eval.fixture_id, eval.minute, inplay::phase::to_string(eval.phase),
               eval.projection.remaining(inplay::Side::Home),
               eval.projection.remaining(inplay::Side::Away),
               eval.projection.reliable ? "" : "  (early-game prior)");

    if (rec.best) {
        fmt::print("  Best: {}\n", rec.best->result.to_string());
    } else {
        fmt::print("  Best: none above threshold\n");
    }
    for (std::size_t i = 0; i < rec.top.size(); ++i) {
        const auto& pick = rec.top[i];
        fmt::print("  {:2d}. {}  fair {:.2f}  {}\n",
                   i + 1, pick.result.to_string(), pick.value.fair_odds,
                   inplay::select::to_string(pick.value.strength));
    }
    if (!eval.correct_scores.empty()) {
        fmt::print("  Likely scores:");
        for (const auto& cs : eval.correct_scores) {
            fmt::print("  {}-{} ({:.1f}%)", cs.home_goals, cs.away_goals,
                       cs.probability * 100.0);
        }
        fmt::print("\n");
    }
    if (eval.final_result) {
        fmt::print("  Score matrix: home {:.1f}%  draw {:.1f}%  away {:.1f}%",
                   eval.final_result->home_win * 100.0,
                   eval.final_result->draw * 100.0,
                   eval.final_result->away_win * 100.0);
        for (const auto& ml : eval.matrix_total_goals) {
            fmt::print("  O{} {:.1f}%", ml.line, ml.over);
        }
        fmt::print("\n");
    }
    if (rec.excluded_complete > 0) {
        fmt::print("  ({} settled selections not ranked)\n", rec.excluded_complete);
    }
    if (!eval.failed_markets.empty()) {
        fmt::print("  ({} markets unavailable)\n", eval.failed_markets.size());
    }
}

/// Price every snapshot in a CSV file.
/// Returns 0 on success, 1 on error.
int run_evaluate(const std::string& filepath, const inplay::EngineConfig& config) {
    auto snapshots = inplay::core::SnapshotLoader::load_csv(filepath);
    if (!snapshots) {
        fmt::print(stderr, "Error: cannot open file '{}'\n", filepath);
        return 1;
    }

    if (snapshots->empty()) {
        fmt::print(stderr, "Error: no valid snapshots loaded from '{}'\n", filepath);
        return 1;
    }

    fmt::print("Loaded {} snapshots from '{}'\n", snapshots->size(), filepath);

    const inplay::core::Engine engine(config);
    for (const auto& eval : engine.evaluate_all(*snapshots)) {
        print_evaluation(eval);
    }
    return 0;
}

/// Read snapshot rows from stdin and price each as it arrives.
/// The header line is the first line of stdin. A newer row for a fixture
/// replaces the previous one.
/// Returns 0 on success.
int run_stream(const inplay::EngineConfig& config) {
    const inplay::core::Engine engine(config);

    std::string line;
    std::string header;
    std::size_t row_count = 0;
    std::map<std::int64_t, double> latest_minute;

    fmt::print("inplay streaming mode. First line: header. Ctrl-D to finish.\n");

    while (std::getline(std::cin, line)) {
        // Trim carriage return for Windows-style line endings.
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty() || line[0] == '#') {
            continue;
        }

        if (header.empty()) {
            header = line;
            continue;
        }

        auto batch = inplay::core::SnapshotLoader::parse_csv_string(header + "\n" + line);
        if (batch.empty()) {
            fmt::print(stderr, "Skipping malformed row: {}\n", line);
            continue;
        }

        ++row_count;
        const auto& snapshot = batch.front();
        const auto seen = latest_minute.find(snapshot.fixture_id);
        if (seen != latest_minute.end() && snapshot.minute < seen->second) {
            fmt::print(stderr, "Skipping stale row for fixture {} (minute {:.0f} < {:.0f})\n",
                       snapshot.fixture_id, snapshot.minute, seen->second);
            continue;
        }
        latest_minute[snapshot.fixture_id] = snapshot.minute;
        print_evaluation(engine.evaluate(snapshot));
    }

    fmt::print("Processed {} rows for {} fixtures.\n", row_count, latest_minute.size());
    return 0;
}

}  // anonymous namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    inplay::EngineConfig config;
    std::string mode;
    std::string filepath;

    for (int i = 1; i < argc; ++i) {
        const std::string_view arg(argv[i]);
        const bool has_value = i + 1 < argc;

        if (arg == "--help" || arg == "-h") {
            print_usage();
            return 0;
        }
        if (arg == "--evaluate") {
            if (!has_value) {
                fmt::print(stderr, "Error: --evaluate requires a CSV file path\n");
                print_usage();
                return 1;
            }
            mode = "evaluate";
            filepath = argv[++i];
        } else if (arg == "--stream") {
            mode = "stream";
        } else if (arg == "--top" && has_value) {
            auto n = parse_arg<std::size_t>(argv[++i]);
            if (!n) {
                fmt::print(stderr, "Error: --top expects a whole number\n");
                return 1;
            }
            config.top_n = *n;
        } else if (arg == "--min-prob" && has_value) {
            auto p = parse_arg<double>(argv[++i]);
            if (!p || *p < 0.0 || *p > 100.0) {
                fmt::print(stderr, "Error: --min-prob expects a value in [0, 100]\n");
                return 1;
            }
            config.min_probability = *p;
        } else if (arg == "--rho" && has_value) {
            auto r = parse_arg<double>(argv[++i]);
            if (!r) {
                fmt::print(stderr, "Error: --rho expects a number\n");
                return 1;
            }
            config.dixon_coles_rho = *r;
        } else if (arg == "--no-dixon-coles") {
            config.use_dixon_coles = false;
        } else if (arg == "--verbose") {
            config.verbose = true;
        } else {
            fmt::print(stderr, "Unknown option: {}\n", arg);
            print_usage();
            return 1;
        }
    }

    if (mode == "evaluate") {
        return run_evaluate(filepath, config);
    }
    if (mode == "stream") {
        return run_stream(config);
    }

    print_usage();
    return 1;
}
