#pragma once

#include <optional>
#include <string>
#include <vector>

namespace diagram_catalog {

// A 28-day AIRAC publication period, written YYNN (two-digit year, cycle 01..13).
struct AiracCycle {
    int year = 0;     // 0..99
    int number = 1;   // 1..13

    std::string to_string() const;
    AiracCycle previous() const;
    AiracCycle next() const;

    bool operator==(const AiracCycle&) const = default;
};

constexpr int cycles_per_year = 13;
constexpr int days_per_cycle = 28;

std::optional<AiracCycle> parse_cycle(const std::string& text);

// Cycle in effect on the given calendar date. Cycle 2601 starts on 2025-12-26.
// Returns nullopt for a date that does not exist, such as 2026-02-31.
std::optional<AiracCycle> cycle_for_date(int year, unsigned month, unsigned day);
AiracCycle current_cycle();

// The `count` cycles before `cycle`, newest first.
std::vector<AiracCycle> previous_cycles(const AiracCycle& cycle, int count);

// Artifact names as stored in the data directory.
std::string pdf_file_name(const std::string& airport_code, const std::string& cycle);
std::string snapshot_file_name(const std::string& airport_code, const std::string& cycle);
std::string comparison_file_name(const std::string& airport_code,
    const std::string& old_cycle, const std::string& new_cycle);

} // namespace diagram_catalog
