#include "lob/orchestrator.hpp"

#include "lob/compiler.hpp"
#include "lob/process_exec.hpp"
#include "lob/synthesizer.hpp"
#include "lob/toolchain.hpp"
#include "lob/utility.hpp"

#include <chrono>
#include <print>
#include <string>
#include <vector>

namespace lob {

namespace {

using Clock = std::chrono::steady_clock;

std::chrono::duration<double, std::milli> as_ms(std::chrono::nanoseconds ns) {
    return ns;
}

} // namespace

Result<RunReport> run_expression(const RunConfig &config, const Cache &cache, const CompilerFactory &make_compiler) {
    const std::string source = synthesize(config.expression, config.input, config.output);

    if (config.verbose)
        std::println(stderr, "Compiling expression...");

    RunReport report;
    const auto compile_start = Clock::now();
    auto compiled = compile_and_cache(source, cache, make_compiler, config.expression);
    if (!compiled)
        return std::unexpected(compiled.error());
    report.compile = *compiled;
    report.compile_time = Clock::now() - compile_start;

    if (config.verbose) {
        std::println(stderr, "Compiled binary: {}", report.compile.binary_path.string());
        std::println(stderr, "Cache hit: {}", report.compile.cache_hit);
        std::println(stderr, "Executing...");
    }

    std::vector<std::string> args{report.compile.binary_path.string()};
    for (const auto &file : config.input.files)
        args.push_back(file.string());

    const auto exec_start = Clock::now();
    auto status = process_exec(std::move(args));
    report.exec_time = Clock::now() - exec_start;
    report.total_time = Clock::now() - compile_start;

    if (!status)
        return std::unexpected(status.error());
    if (*status != 0)
        return std::unexpected(Error::execution(*status));

    return report;
}

Result<RunReport> run_expression(const RunConfig &config, const CacheLocations &locations) {
    auto cache = Cache::open(locations.root);
    if (!cache)
        return std::unexpected(cache.error());

    CompilerFactory make_compiler = [&]() -> Result<Compiler> {
        auto toolchain = resolve_toolchain(locations, config.verbose);
        if (!toolchain)
            return std::unexpected(toolchain.error());
        Compiler compiler(std::move(*toolchain), config.color);
        if (config.verbose && !compiler.artifacts())
            std::println(stderr, "Runtime libraries not found; linking will fail");
        return compiler;
    };

    return run_expression(config, *cache, make_compiler);
}

void print_run_stats(const RunReport &report) {
    std::println(stderr, "");
    std::println(stderr, "Statistics:");
    std::println(stderr, "  Compilation time: {:.2f}ms", as_ms(report.compile_time).count());
    std::println(stderr, "  Execution time:   {:.2f}ms", as_ms(report.exec_time).count());
    std::println(stderr, "  Total time:       {:.2f}ms", as_ms(report.total_time).count());
    std::println(stderr, "  Cache:            {}",
                 report.compile.cache_hit ? "Hit (binary reused)" : "Miss (compiled)");
}

} // namespace lob
