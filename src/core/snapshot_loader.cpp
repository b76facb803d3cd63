/// @file src/core/snapshot_loader.cpp
/// @brief CSV SnapshotLoader for live match snapshots.

#include "inplay/snapshot_loader.hpp"

#include <charconv>
#include <cmath>
#include <cstdint>
#include <fstream>
#include <sstream>
#include <string>
#include <system_error>
#include <unordered_map>

namespace inplay::core {

namespace {

std::string_view trim(std::string_view s) noexcept {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

/// Split on `sep` without trimming.
std::vector<std::string_view> split_view(std::string_view s, char sep) {
    std::vector<std::string_view> out;
    std::size_t start = 0;
    while (true) {
        const auto pos = s.find(sep, start);
        if (pos == std::string_view::npos) {
            out.push_back(s.substr(start));
            return out;
        }
        out.push_back(s.substr(start, pos - start));
        start = pos + 1;
    }
}

std::optional<double> parse_double(std::string_view s) noexcept {
    s = trim(s);
    if (s.empty()) {
        return std::nullopt;
    }
    if (s.front() == '+') {
        s.remove_prefix(1);
    }
    double v = 0.0;
    const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
    if (ec != std::errc{} || ptr != s.data() + s.size()) {
        return std::nullopt;
    }
    return v;
}

std::optional<Side> parse_side(std::string_view s) noexcept {
    s = trim(s);
    if (s == "H" || s == "h" || s == "home") return Side::Home;
    if (s == "A" || s == "a" || s == "away") return Side::Away;
    return std::nullopt;
}

std::optional<EventKind> parse_kind(std::string_view s) noexcept {
    s = trim(s);
    if (s == "shot")   return EventKind::Shot;
    if (s == "attack") return EventKind::DangerousAttack;
    if (s == "corner") return EventKind::Corner;
    return std::nullopt;
}

enum class Column {
    FixtureId,
    Minute,
    HomeScore,
    AwayScore,
    Stat,
    Events,
    Substitutions,
};

struct ColumnBinding {
    Column                                 column;
    std::optional<double> RawTeamStats::*  stat = nullptr;
    Side                                   side = Side::Home;
};

/// Header name → binding. Unknown names map to nothing and are ignored.
std::optional<ColumnBinding> bind(std::string_view name) {
    static const std::unordered_map<std::string_view, std::optional<double> RawTeamStats::*>
        STATS = {
            {"xg",                &RawTeamStats::xg},
            {"shots",             &RawTeamStats::shots},
            {"shots_on_target",   &RawTeamStats::shots_on_target},
            {"corners",           &RawTeamStats::corners},
            {"yellow",            &RawTeamStats::yellow_cards},
            {"red",               &RawTeamStats::red_cards},
            {"fouls",             &RawTeamStats::fouls},
            {"possession",        &RawTeamStats::possession},
            {"dangerous_attacks", &RawTeamStats::dangerous_attacks},
        };

    if (name == "fixture_id")    return ColumnBinding{Column::FixtureId};
    if (name == "minute")        return ColumnBinding{Column::Minute};
    if (name == "home_score")    return ColumnBinding{Column::HomeScore};
    if (name == "away_score")    return ColumnBinding{Column::AwayScore};
    if (name == "events")        return ColumnBinding{Column::Events};
    if (name == "substitutions") return ColumnBinding{Column::Substitutions};

    Side side = Side::Home;
    if (name.starts_with("home_")) {
        name.remove_prefix(5);
    } else if (name.starts_with("away_")) {
        name.remove_prefix(5);
        side = Side::Away;
    } else {
        return std::nullopt;
    }
    const auto it = STATS.find(name);
    if (it == STATS.end()) {
        return std::nullopt;
    }
    return ColumnBinding{Column::Stat, it->second, side};
}

}  // anonymous namespace

// ─── SnapshotLoader::split_line ──────────────────────────────────────────────

std::vector<std::string>
SnapshotLoader::split_line(std::string_view line) {
    std::vector<std::string> cells;
    for (auto cell : split_view(line, ',')) {
        cells.emplace_back(trim(cell));
    }
    return cells;
}

// ─── SnapshotLoader::parse_number ────────────────────────────────────────────

std::optional<double>
SnapshotLoader::parse_number(std::string_view cell, bool& ok) noexcept {
    cell = trim(cell);
    if (cell.empty()) {
        return std::nullopt;
    }
    auto v = parse_double(cell);
    if (!v) {
        ok = false;
    }
    return v;
}

// ─── SnapshotLoader::parse_events ────────────────────────────────────────────

std::vector<MatchEvent>
SnapshotLoader::parse_events(std::string_view cell) noexcept {
    std::vector<MatchEvent> events;
    if (trim(cell).empty()) {
        return events;
    }
    for (auto item : split_view(cell, ';')) {
        const auto parts = split_view(item, ':');
        if (parts.size() != 3) {
            continue;
        }
        const auto minute = parse_double(parts[0]);
        const auto side   = parse_side(parts[1]);
        const auto kind   = parse_kind(parts[2]);
        if (!minute || !std::isfinite(*minute) || !side || !kind) {
            continue;
        }
        events.push_back(MatchEvent{.minute = *minute, .side = *side, .kind = *kind});
    }
    return events;
}

// ─── SnapshotLoader::parse_substitutions ─────────────────────────────────────

std::vector<SubstitutionEvent>
SnapshotLoader::parse_substitutions(std::string_view cell) noexcept {
    std::vector<SubstitutionEvent> subs;
    if (trim(cell).empty()) {
        return subs;
    }
    for (auto item : split_view(cell, ';')) {
        const auto parts = split_view(item, ':');
        if (parts.size() != 3) {
            continue;
        }
        const auto minute = parse_double(parts[0]);
        const auto side   = parse_side(parts[1]);
        const auto kind   = trim(parts[2]);
        if (!minute || !std::isfinite(*minute) || !side ||
            (kind != "off" && kind != "def")) {
            continue;
        }
        subs.push_back(SubstitutionEvent{
            .minute    = *minute,
            .side      = *side,
            .offensive = kind == "off",
        });
    }
    return subs;
}

// ─── SnapshotLoader::parse_row ────────────────────────────────────────────────

std::optional<RawSnapshot>
SnapshotLoader::parse_row(const std::vector<std::string>& header,
                          std::string_view line) noexcept {
    const auto cells = split_line(line);
    if (cells.size() != header.size()) {
        return std::nullopt;
    }

    RawSnapshot raw;
    bool ok = true;

    for (std::size_t i = 0; i < header.size(); ++i) {
        const auto binding = bind(header[i]);
        if (!binding) {
            continue;
        }
        const std::string& cell = cells[i];

        switch (binding->column) {
            case Column::FixtureId: {
                auto v = parse_number(cell, ok);
                // Outside this range the id can't be held exactly anyway.
                constexpr double MAX_EXACT_ID = 9007199254740992.0;
                if (v && std::isfinite(*v) && std::abs(*v) <= MAX_EXACT_ID) {
                    raw.fixture_id = static_cast<std::int64_t>(*v);
                }
                break;
            }
            case Column::Minute:
                raw.minute = parse_number(cell, ok);
                break;
            case Column::HomeScore:
                raw.home_score = parse_number(cell, ok);
                break;
            case Column::AwayScore:
                raw.away_score = parse_number(cell, ok);
                break;
            case Column::Stat: {
                RawTeamStats& team = binding->side == Side::Home ? raw.home : raw.away;
                team.*(binding->stat) = parse_number(cell, ok);
                break;
            }
            case Column::Events:
                raw.recent_events = parse_events(cell);
                break;
            case Column::Substitutions:
                raw.substitutions = parse_substitutions(cell);
                break;
        }
        if (!ok) {
            return std::nullopt;
        }
    }
    return raw;
}

// ─── SnapshotLoader::parse_csv_string ────────────────────────────────────────

std::vector<MatchSnapshot>
SnapshotLoader::parse_csv_string(std::string_view csv_content) noexcept {
    std::vector<MatchSnapshot> snapshots;
    std::vector<std::string> header;
    bool have_header = false;

    for (auto line : split_view(csv_content, '\n')) {
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
        if (trim(line).empty() || trim(line).front() == '#') {
            continue;
        }
        if (!have_header) {
            header = split_line(line);
            have_header = true;
            continue;
        }
        auto raw = parse_row(header, line);
        if (raw) {
            snapshots.push_back(coerce(*raw));
        }
    }
    return snapshots;
}

// ─── SnapshotLoader::load_csv ────────────────────────────────────────────────

std::optional<std::vector<MatchSnapshot>>
SnapshotLoader::load_csv(const std::string& filepath) noexcept {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        return std::nullopt;
    }

    std::ostringstream contents;
    contents << file.rdbuf();
    return parse_csv_string(contents.str());
}

}  // namespace inplay::core
