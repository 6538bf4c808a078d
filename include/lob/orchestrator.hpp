#pragma once

#include "lob/cache.hpp"
#include "lob/compiler.hpp"
#include "lob/formats.hpp"
#include "lob/utility.hpp"

#include <chrono>
#include <filesystem>
#include <string>

namespace lob {

struct RunConfig {
    std::string expression;
    InputSource input;
    OutputFormat output = OutputFormat::JsonLines;
    bool verbose = false;
    bool show_stats = false;
    bool color = false;
};

struct RunReport {
    CompileResult compile;
    std::chrono::nanoseconds compile_time{0};
    std::chrono::nanoseconds exec_time{0};
    std::chrono::nanoseconds total_time{0};
};

/**
 * @brief synthesize -> cache lookup -> (resolve toolchain -> compile -> store) -> execute.
 *
 * The only recovery is the embedded-to-system toolchain fallback inside
 * `make_compiler`; every other error aborts the run. The executed program
 * inherits stdin, stdout and stderr and receives the input files as its
 * arguments. A non-zero child exit is an Execution error carrying the status.
 */
Result<RunReport> run_expression(const RunConfig &config, const Cache &cache, const CompilerFactory &make_compiler);

/**
 * @brief Runs with the default toolchain resolution for `locations`.
 */
Result<RunReport> run_expression(const RunConfig &config, const CacheLocations &locations);

/** @brief Prints compile, execution and total time plus hit/miss to stderr. */
void print_run_stats(const RunReport &report);

} // namespace lob
