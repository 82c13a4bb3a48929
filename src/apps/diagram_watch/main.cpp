// Airport diagram change watcher: extract snapshots from diagram PDFs and report
// differences between AIRAC cycles.

#include <diagram_catalog/airac.hpp>
#include <diagram_catalog/airport_registry.hpp>
#include <diagram_catalog/history.hpp>
#include <diagram_compare/aggregator.hpp>
#include <diagram_compare/report.hpp>
#include <diagram_extract/extractor.hpp>
#include <diagram_loaders/json_loader.hpp>
#include <diagram_scan/pdf_page_scanner.hpp>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace {

const int exit_failure = 1;
const int exit_usage = 2;

void print_usage() {
    (void)fprintf(stderr,
        "usage: diagram_watch <command> [options]\n"
        "\n"
        "  extract <pdf> [--airport CODE] [--cycle YYNN] [--out FILE]\n"
        "  compare <old.json> <new.json> [--out FILE] [--json]\n"
        "  history <CODE> [--cycle YYNN] [--max N] [--data-dir DIR]\n"
        "  cycle [YYYY-MM-DD]\n"
        "  url <CODE> <YYNN> [--airports FILE]\n");
}

// Positional arguments plus "--name value" options and bare "--flag" switches.
struct Args {
    std::vector<std::string> positional;
    std::vector<std::pair<std::string, std::string>> options;
    std::vector<std::string> flags;

    std::optional<std::string> option(const std::string& name) const {
        for (const auto& [k, v] : options)
            if (k == name) return v;
        return std::nullopt;
    }
    bool flag(const std::string& name) const {
        for (const auto& f : flags)
            if (f == name) return true;
        return false;
    }
};

const std::vector<std::string> switch_names = { "--json" };

std::optional<Args> parse_args(int argc, char* argv[], int first) {
    Args out;
    for (int i = first; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg.rfind("--", 0) != 0) {
            out.positional.push_back(arg);
            continue;
        }
        bool is_switch = false;
        for (const auto& s : switch_names)
            if (s == arg) is_switch = true;
        if (is_switch) {
            out.flags.push_back(arg);
            continue;
        }
        if (i + 1 >= argc) {
            (void)fprintf(stderr, "[diagram_watch] Missing value for %s\n", arg.c_str());
            return std::nullopt;
        }
        out.options.emplace_back(arg, argv[++i]);
    }
    return out;
}

std::string data_dir(const Args& args) {
    if (auto dir = args.option("--data-dir")) return *dir;
    if (const char* env = std::getenv("DIAGRAM_WATCH_DATA_DIR")) return env;
    return "data";
}

int run_extract(const Args& args) {
    if (args.positional.size() != 1) {
        print_usage();
        return exit_usage;
    }
    diagram_scan::PdfPageScanner scanner;
    diagram_scan::ScanError error = diagram_scan::ScanError::None;
    std::optional<diagram_model::DiagramSnapshot> snapshot = diagram_extract::extract_snapshot(scanner,
        args.positional[0], args.option("--airport").value_or(""), args.option("--cycle").value_or(""), &error);
    if (!snapshot) {
        (void)fprintf(stderr, "[diagram_watch] Extraction failed: %s\n", diagram_scan::to_string(error));
        return exit_failure;
    }

    if (auto out = args.option("--out"))
        return diagram_loaders::save_snapshot_to_json_file(*snapshot, *out) ? 0 : exit_failure;
    diagram_loaders::write_snapshot_json(std::cout, *snapshot);
    return 0;
}

int run_compare(const Args& args) {
    if (args.positional.size() != 2) {
        print_usage();
        return exit_usage;
    }
    auto old_snapshot = diagram_loaders::load_snapshot_from_json_file(args.positional[0]);
    if (!old_snapshot) {
        (void)fprintf(stderr, "[diagram_watch] Cannot load %s\n", args.positional[0].c_str());
        return exit_failure;
    }
    auto new_snapshot = diagram_loaders::load_snapshot_from_json_file(args.positional[1]);
    if (!new_snapshot) {
        (void)fprintf(stderr, "[diagram_watch] Cannot load %s\n", args.positional[1].c_str());
        return exit_failure;
    }

    const diagram_model::ComparisonResult result = diagram_compare::compare_snapshots(*old_snapshot, *new_snapshot);
    if (args.flag("--json"))
        diagram_loaders::write_comparison_json(std::cout, result);
    else
        std::cout << diagram_compare::format_report(result);

    if (auto out = args.option("--out"))
        return diagram_loaders::save_comparison_to_json_file(result, *out) ? 0 : exit_failure;
    return 0;
}

int run_history(const Args& args) {
    if (args.positional.size() != 1) {
        print_usage();
        return exit_usage;
    }
    const std::string airport = args.positional[0];

    diagram_catalog::AiracCycle current = diagram_catalog::current_cycle();
    if (auto text = args.option("--cycle")) {
        auto parsed = diagram_catalog::parse_cycle(*text);
        if (!parsed) {
            (void)fprintf(stderr, "[diagram_watch] Invalid cycle: %s\n", text->c_str());
            return exit_usage;
        }
        current = *parsed;
    }
    int max_cycles = diagram_catalog::cycles_per_year;
    if (auto text = args.option("--max")) {
        char* end = nullptr;
        const long n = std::strtol(text->c_str(), &end, 10);
        if (end == text->c_str() || *end != '\0' || n < 1 || n > 1000) {
            (void)fprintf(stderr, "[diagram_watch] Invalid --max: %s\n", text->c_str());
            return exit_usage;
        }
        max_cycles = static_cast<int>(n);
    }

    const std::filesystem::path dir = data_dir(args);
    diagram_catalog::SnapshotSource source = [&dir](const std::string& code, const std::string& cycle) {
        return diagram_loaders::load_snapshot_from_json_file(
            (dir / diagram_catalog::snapshot_file_name(code, cycle)).string());
    };

    const diagram_catalog::LastChange last = diagram_catalog::find_last_change(source, airport, current, max_cycles);
    if (!last.error.empty()) {
        (void)fprintf(stderr, "[diagram_watch] %s\n", last.error.c_str());
        return exit_failure;
    }

    std::cout << "Airport:         " << airport << "\n"
              << "Current cycle:   " << last.current_cycle << "\n"
              << "Cycles searched: " << last.cycles_searched << "\n";
    if (last.last_change_cycle) {
        std::cout << "Last change:     " << *last.last_change_cycle << "\n";
        if (last.comparison) std::cout << diagram_compare::format_report(*last.comparison);
    } else {
        std::cout << "No changes found in last " << last.cycles_searched << " cycles (~"
                  << last.cycles_searched * diagram_catalog::days_per_cycle << " days)\n";
    }
    return 0;
}

int run_cycle(const Args& args) {
    diagram_catalog::AiracCycle cycle = diagram_catalog::current_cycle();
    if (!args.positional.empty()) {
        int y = 0;
        unsigned m = 0, d = 0;
        std::optional<diagram_catalog::AiracCycle> on_date;
        if (std::sscanf(args.positional[0].c_str(), "%d-%u-%u", &y, &m, &d) == 3)
            on_date = diagram_catalog::cycle_for_date(y, m, d);
        if (!on_date) {
            (void)fprintf(stderr, "[diagram_watch] Invalid date: %s\n", args.positional[0].c_str());
            return exit_usage;
        }
        cycle = *on_date;
    }
    std::cout << cycle.to_string() << "\n";
    return 0;
}

int run_url(const Args& args) {
    if (args.positional.size() != 2) {
        print_usage();
        return exit_usage;
    }
    diagram_catalog::AirportRegistry registry = diagram_catalog::default_airport_registry();
    if (auto path = args.option("--airports")) {
        auto loaded = diagram_loaders::load_airport_registry_from_json_file(*path);
        if (!loaded) {
            (void)fprintf(stderr, "[diagram_watch] Cannot load airport registry %s\n", path->c_str());
            return exit_failure;
        }
        registry = std::move(*loaded);
    }
    auto url = diagram_catalog::diagram_url(registry, args.positional[0], args.positional[1]);
    if (!url) {
        (void)fprintf(stderr, "[diagram_watch] Unknown airport code: %s\n", args.positional[0].c_str());
        return exit_failure;
    }
    std::cout << *url << "\n";
    return 0;
}

} // namespace

int main(int argc, char* argv[])
{
    if (argc < 2) {
        print_usage();
        return exit_usage;
    }
    const std::string command = argv[1];
    std::optional<Args> args = parse_args(argc, argv, 2);
    if (!args) return exit_usage;

    if (command == "extract") return run_extract(*args);
    if (command == "compare") return run_compare(*args);
    if (command == "history") return run_history(*args);
    if (command == "cycle") return run_cycle(*args);
    if (command == "url") return run_url(*args);

    print_usage();
    return exit_usage;
}
