#pragma once

/// @file include/inplay/snapshot_loader.hpp
/// @brief CSV loader for live match snapshots.
///
/// # Module: SnapshotLoader
///
/// ## Responsibility
/// Parse snapshot rows exported by the live-data collaborator into coerced
/// MatchSnapshots. An empty cell means "unknown" and reads as zero after
/// coercion. Malformed rows are skipped; the loader never crashes on bad
/// input.
///
/// ## Expected CSV Format
/// The first non-comment line is a header naming the columns. Columns may
/// appear in any order; unknown columns are ignored. Recognised names:
/// ```
/// fixture_id,minute,home_score,away_score,
/// home_xg,away_xg,home_shots,away_shots,home_shots_on_target,
/// away_shots_on_target,home_corners,away_corners,home_yellow,away_yellow,
/// home_red,away_red,home_fouls,away_fouls,home_possession,away_possession,
/// home_dangerous_attacks,away_dangerous_attacks,events,substitutions
/// ```
/// `events` holds `minute:side:kind` items separated by `;`, with side
/// `H`/`A` and kind `shot`, `attack` or `corner`. `substitutions` holds
/// `minute:side:off` / `minute:side:def` items.
///
/// ## Guarantees
/// - Never throws; `load_csv` returns `nullopt` only if the file can't be opened
/// - A row without a parseable `minute` cell is still accepted (minute 0)
/// - Does not modify any file or external state

#include "inplay/types.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace inplay::core {

class SnapshotLoader {
public:
    /// Load snapshots from a CSV file on disk.
    [[nodiscard]] static std::optional<std::vector<MatchSnapshot>>
    load_csv(const std::string& filepath) noexcept;

    /// Parse snapshots from CSV text (header line first).
    [[nodiscard]] static std::vector<MatchSnapshot>
    parse_csv_string(std::string_view csv_content) noexcept;

    /// Parse one data row against a header.
    ///
    /// # Returns
    /// `nullopt` if the cell count does not match the header or a non-empty
    /// numeric cell fails to parse.
    [[nodiscard]] static std::optional<RawSnapshot>
    parse_row(const std::vector<std::string>& header,
              std::string_view line) noexcept;

    /// Parse an `events` cell. Malformed items are skipped.
    [[nodiscard]] static std::vector<MatchEvent>
    parse_events(std::string_view cell) noexcept;

    /// Parse a `substitutions` cell. Malformed items are skipped.
    [[nodiscard]] static std::vector<SubstitutionEvent>
    parse_substitutions(std::string_view cell) noexcept;

    /// Split a CSV line on commas, trimming whitespace from every cell.
    [[nodiscard]] static std::vector<std::string>
    split_line(std::string_view line);

private:
    /// Parse a numeric cell. Empty → nullopt (absent); garbage → error flag.
    [[nodiscard]] static std::optional<double>
    parse_number(std::string_view cell, bool& ok) noexcept;
};

}  // namespace inplay::core
