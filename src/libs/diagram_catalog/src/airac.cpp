#include <diagram_catalog/airac.hpp>
#include <cctype>
#include <chrono>
#include <cstdio>

namespace diagram_catalog {

namespace {

constexpr std::chrono::year_month_day reference_date{
    std::chrono::year{2025}, std::chrono::month{12}, std::chrono::day{26} };
constexpr AiracCycle reference_cycle{ 26, 1 };

int floor_div(long a, long b) {
    long q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) --q;
    return static_cast<int>(q);
}

AiracCycle cycle_for_days(std::chrono::sys_days date) {
    const long elapsed = static_cast<long>((date - std::chrono::sys_days{ reference_date }).count());
    const int cycles_passed = floor_div(elapsed, days_per_cycle);

    int number = reference_cycle.number + cycles_passed;
    int yy = reference_cycle.year;
    while (number > cycles_per_year) {
        number -= cycles_per_year;
        ++yy;
    }
    while (number < 1) {
        number += cycles_per_year;
        --yy;
    }
    return { ((yy % 100) + 100) % 100, number };
}

} // namespace

std::string AiracCycle::to_string() const {
    char buf[16];
    (void)std::snprintf(buf, sizeof(buf), "%02d%02d", year, number);
    return buf;
}

AiracCycle AiracCycle::previous() const {
    if (number > 1) return { year, number - 1 };
    return { year == 0 ? 99 : year - 1, cycles_per_year };
}

AiracCycle AiracCycle::next() const {
    if (number < cycles_per_year) return { year, number + 1 };
    return { year == 99 ? 0 : year + 1, 1 };
}

std::optional<AiracCycle> parse_cycle(const std::string& text) {
    if (text.size() != 4) return std::nullopt;
    for (char c : text)
        if (!std::isdigit(static_cast<unsigned char>(c))) return std::nullopt;
    AiracCycle out;
    out.year = (text[0] - '0') * 10 + (text[1] - '0');
    out.number = (text[2] - '0') * 10 + (text[3] - '0');
    if (out.number < 1 || out.number > cycles_per_year) return std::nullopt;
    return out;
}

std::optional<AiracCycle> cycle_for_date(int year, unsigned month, unsigned day) {
    const std::chrono::year_month_day date{
        std::chrono::year{year}, std::chrono::month{month}, std::chrono::day{day} };
    if (!date.ok()) return std::nullopt;
    return cycle_for_days(std::chrono::sys_days{ date });
}

AiracCycle current_cycle() {
    using namespace std::chrono;
    return cycle_for_days(floor<days>(system_clock::now()));
}

std::vector<AiracCycle> previous_cycles(const AiracCycle& cycle, int count) {
    std::vector<AiracCycle> out;
    AiracCycle c = cycle;
    for (int i = 0; i < count; ++i) {
        c = c.previous();
        out.push_back(c);
    }
    return out;
}

std::string pdf_file_name(const std::string& airport_code, const std::string& cycle) {
    return airport_code + "_" + cycle + ".pdf";
}

std::string snapshot_file_name(const std::string& airport_code, const std::string& cycle) {
    return airport_code + "_" + cycle + "_extracted.json";
}

std::string comparison_file_name(const std::string& airport_code,
    const std::string& old_cycle, const std::string& new_cycle)
{
    return airport_code + "_comparison_" + old_cycle + "_to_" + new_cycle + ".json";
}

} // namespace diagram_catalog
