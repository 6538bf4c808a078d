#include "lob/cache.hpp"
#include "lob/formats.hpp"
#include "lob/diagnostic.hpp"
#include "lob/orchestrator.hpp"
#include "lob/synthesizer.hpp"
#include "lob/utility.hpp"

#include <filesystem>
#include <iostream>
#include <nlohmann/json.hpp>
#include <optional>
#include <print>
#include <string>
#include <unistd.h>
#include <vector>

namespace {

struct CliOptions {
    std::optional<std::string> expression;
    std::vector<std::filesystem::path> files;
    lob::InputFormat input_format = lob::InputFormat::Lines;
    std::optional<std::string> format;
    bool show_source = false;
    bool clear_cache = false;
    bool cache_stats = false;
    bool verbose = false;
    bool stats = false;
};

void print_help() {
    std::println("Usage: lob [options] <expression> [file...]");
    std::println("Run C++ data pipeline one-liners. Reads stdin when no file is given.");
    std::println("Options:");
    std::println("  -h, --help           Show this help message");
    std::println("  -V, --version        Show version");
    std::println("  --parse-csv          Parse input as CSV with headers (rows are lob::Row)");
    std::println("  --parse-tsv          Parse input as TSV with headers");
    std::println("  --parse-json         Parse input as JSON lines (rows are nlohmann::json)");
    std::println("  -f, --format <fmt>   Output format: debug, json, jsonl, csv, table");
    std::println("  -s, --show-source    Print the generated program instead of running it");
    std::println("  --clear-cache        Remove all cached sources and binaries");
    std::println("  --cache-stats        Show cache statistics");
    std::println("  -v, --verbose        Report toolchain and cache decisions on stderr");
    std::println("  --stats              Show timing statistics after execution");
}

void print_version() {
    std::println("lob {}", LOB_PROJ_VER);
}

void print_welcome() {
    std::println("lob - C++ Pipeline Tool\n");
    std::println("USAGE:");
    std::println("    lob [OPTIONS] <EXPRESSION> [FILE...]");
    std::println("    command | lob [OPTIONS] <EXPRESSION>\n");
    std::println("EXAMPLES:");
    std::println("    # Count even numbers");
    std::println("    seq 1 100 | lob '_.filter(|x| std::stoi(x) % 2 == 0).count()'");
    std::println("    # Output: 50\n");
    std::println("    # Process a file directly");
    std::println("    lob '_.filter(|x| x.size() > 5).take(10)' data.txt\n");
    std::println("    # Parse CSV data");
    std::println("    lob --parse-csv '_.filter(|r| std::stoi(r[\"age\"]) > 18)' users.csv\n");
    std::println("COMMON OPERATIONS:");
    std::println("    Selection:  filter, take, skip, unique, take_while, skip_while");
    std::println("    Transform:  map, enumerate, zip, flat_map, sorted");
    std::println("    Grouping:   chunk, window, group_by, join");
    std::println("    Terminal:   count, sum, min, max, first, last, to_list\n");
    std::println("OUTPUT FORMATS:");
    std::println("    --format debug      Debug rendering (default on a terminal)");
    std::println("    --format json       JSON array");
    std::println("    --format jsonl      JSON lines (default when piped)");
    std::println("    --format csv        CSV output");
    std::println("    --format table      Table output\n");
    std::println("LEARN MORE:");
    std::println("    lob --help              Full option list");
    std::println("    lob --show-source EXPR  See the generated C++ program");
    std::println("    lob --cache-stats       View the compilation cache");
}

int report(const lob::Error &err) {
    // Compilation errors arrive fully formatted.
    if (err.kind == lob::ErrorKind::Compilation) {
        std::println(std::cerr, "{}", err.message);
    } else {
        std::println(std::cerr, "Error: {}", err.describe());
    }
    if (err.kind == lob::ErrorKind::Execution && err.exit_status > 0 && err.exit_status < 256)
        return err.exit_status;
    return 1;
}

lob::Result<void> clear_cache() {
    auto locations = lob::resolve_cache_locations();
    if (!locations)
        return std::unexpected(locations.error());
    auto cache = lob::Cache::open(locations->root);
    if (!cache)
        return std::unexpected(cache.error());
    if (auto res = cache->clear(); !res)
        return res;
    std::println("Cache cleared successfully");
    return {};
}

lob::Result<void> show_cache_stats(bool as_json) {
    auto locations = lob::resolve_cache_locations();
    if (!locations)
        return std::unexpected(locations.error());
    auto cache = lob::Cache::open(locations->root);
    if (!cache)
        return std::unexpected(cache.error());
    auto stats = cache->stats();
    if (!stats)
        return std::unexpected(stats.error());

    if (as_json) {
        nlohmann::json out;
        out["binary_count"] = stats->binary_count;
        out["total_size"] = stats->total_size;
        out["cache_dir"] = cache->root().string();
        std::println("{}", out.dump(4));
        return {};
    }

    std::println("Cache statistics:");
    std::println("  Cached binaries: {}", stats->binary_count);
    std::println("  Total size: {}", stats->format_size());
    std::println("  Cache directory: {}", cache->root().string());
    return {};
}

lob::Result<void> run(const CliOptions &opts) {
    if (opts.clear_cache)
        return clear_cache();

    if (opts.cache_stats)
        return show_cache_stats(opts.format == "json");

    if (!opts.expression) {
        if (opts.files.empty() && isatty(STDIN_FILENO) == 1) {
            print_welcome();
            return {};
        }
        return std::unexpected(lob::Error::invalid_expression("No expression provided. Use --help for usage."));
    }

    lob::InputSource input{opts.files, opts.input_format};
    if (auto res = input.validate(); !res)
        return res;

    lob::OutputFormat output = lob::default_output_format(lob::stdout_is_terminal());
    if (opts.format) {
        auto parsed = lob::parse_output_format(*opts.format);
        if (!parsed)
            return std::unexpected(lob::Error::invalid_expression("Unknown output format: " + *opts.format));
        output = *parsed;
    }

    if (opts.show_source) {
        std::print("{}", lob::synthesize(*opts.expression, input, output));
        return {};
    }

    auto locations = lob::resolve_cache_locations();
    if (!locations)
        return std::unexpected(locations.error());

    lob::RunConfig config{
        .expression = *opts.expression,
        .input = std::move(input),
        .output = output,
        .verbose = opts.verbose,
        .show_stats = opts.stats,
        .color = lob::stderr_supports_color(),
    };

    auto result = lob::run_expression(config, *locations);
    if (!result)
        return std::unexpected(result.error());

    if (config.show_stats)
        lob::print_run_stats(*result);
    return {};
}

} // namespace

int main(const int argc, const char *const *argv) {
    CliOptions opts;

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            print_help();
            return 0;
        } else if (arg == "-V" || arg == "--version") {
            print_version();
            return 0;
        } else if (arg == "--parse-csv") {
            opts.input_format = lob::InputFormat::Csv;
        } else if (arg == "--parse-tsv") {
            opts.input_format = lob::InputFormat::Tsv;
        } else if (arg == "--parse-json") {
            opts.input_format = lob::InputFormat::JsonLines;
        } else if (arg == "-f" || arg == "--format") {
            if (i + 1 < argc) {
                opts.format = argv[i + 1];
                i++;
            } else {
                std::println(std::cerr, "Missing argument for {}", arg);
                return 1;
            }
        } else if (arg == "-s" || arg == "--show-source") {
            opts.show_source = true;
        } else if (arg == "--clear-cache") {
            opts.clear_cache = true;
        } else if (arg == "--cache-stats") {
            opts.cache_stats = true;
        } else if (arg == "-v" || arg == "--verbose") {
            opts.verbose = true;
        } else if (arg == "--stats") {
            opts.stats = true;
        } else if (arg.size() > 1 && arg.starts_with("-")) {
            std::println(std::cerr, "Unknown argument: {}", arg);
            print_help();
            return 1;
        } else if (!opts.expression) {
            opts.expression = std::string(arg);
        } else {
            opts.files.emplace_back(arg);
        }
    }

    if (opts.input_format != lob::InputFormat::Lines) {
        int selected = 0;
        for (int i = 1; i < argc; ++i) {
            std::string_view arg = argv[i];
            selected += arg == "--parse-csv" || arg == "--parse-tsv" || arg == "--parse-json";
        }
        if (selected > 1) {
            std::println(std::cerr, "--parse-csv, --parse-tsv and --parse-json are mutually exclusive");
            return 1;
        }
    }

    if (auto res = run(opts); !res)
        return report(res.error());

    return 0;
}
