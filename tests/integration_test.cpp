// Integration Tests
// End-to-end runs of the orchestrator: synthesize, cache, compile and execute

#include "lob/artifacts.hpp"
#include "lob/cache.hpp"
#include "lob/compiler.hpp"
#include "lob/orchestrator.hpp"
#include "lob/synthesizer.hpp"
#include "lob/toolchain.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>
#include <optional>

using namespace lob;
using lob::test::ScopedStdin;
using lob::test::TempDir;
using lob::test::write_file;
namespace fs = std::filesystem;

// ============================================================================
// Orchestration with prebuilt binaries
// ============================================================================

// Seeds the cache with shell scripts under the keys of synthesized programs,
// so execution can be exercised without a compiler.
class OrchestratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto opened = Cache::open(dir.path() / "cache");
        ASSERT_TRUE(opened.has_value());
        cache.emplace(std::move(*opened));
        write_file(dir.path() / "input.txt", "one\n");
    }

    RunConfig config_for(std::string expression) const {
        return RunConfig{
            .expression = std::move(expression),
            .input = InputSource{{dir.path() / "input.txt"}, InputFormat::Lines},
            .output = OutputFormat::JsonLines,
        };
    }

    void seed(const RunConfig &config, const std::string &script) const {
        const auto key = Cache::hash_source(synthesize(config.expression, config.input, config.output));
        ASSERT_TRUE(key.has_value()) << key.error().describe();
        const auto path = cache->binary_path(*key);
        write_file(path, "#!/bin/sh\n" + script + "\n");
        fs::permissions(path, fs::perms::owner_all, fs::perm_options::add);
    }

    CompilerFactory forbidden() {
        return [this]() -> Result<Compiler> {
            ++factory_calls;
            return std::unexpected(Error::toolchain("no compiler in this test"));
        };
    }

    TempDir dir;
    std::optional<Cache> cache;
    int factory_calls = 0;
};

TEST_F(OrchestratorTest, CachedBinaryRunsWithoutToolchain) {
    const auto config = config_for("_.count()");
    seed(config, "exit 0");

    auto report = run_expression(config, *cache, forbidden());
    ASSERT_TRUE(report.has_value()) << report.error().describe();
    EXPECT_TRUE(report->compile.cache_hit);
    EXPECT_EQ(factory_calls, 0);
}

TEST_F(OrchestratorTest, InputFilesPassedAsArguments) {
    const auto config = config_for("_.take(1)");
    seed(config, "echo \"$@\"");

    ::testing::internal::CaptureStdout();
    auto report = run_expression(config, *cache, forbidden());
    const auto out = ::testing::internal::GetCapturedStdout();
    ASSERT_TRUE(report.has_value()) << report.error().describe();
    EXPECT_EQ(out, (dir.path() / "input.txt").string() + "\n");
}

TEST_F(OrchestratorTest, NonZeroExitIsExecutionError) {
    const auto config = config_for("_.first()");
    seed(config, "exit 7");

    auto report = run_expression(config, *cache, forbidden());
    ASSERT_FALSE(report.has_value());
    EXPECT_EQ(report.error().kind, ErrorKind::Execution);
    EXPECT_EQ(report.error().exit_status, 7);
    EXPECT_EQ(report.error().message, "Execution failed with status: 7");
}

TEST_F(OrchestratorTest, ToolchainFailureOnMiss) {
    const auto config = config_for("_.last()");

    auto report = run_expression(config, *cache, forbidden());
    ASSERT_FALSE(report.has_value());
    EXPECT_EQ(report.error().kind, ErrorKind::Toolchain);
    EXPECT_EQ(factory_calls, 1);

    auto stats = cache->stats();
    ASSERT_TRUE(stats.has_value());
    EXPECT_EQ(stats->binary_count, 0u);
}

// ============================================================================
// Full pipeline with the system compiler
// ============================================================================

// Needs a working C++ compiler and the runtime archives from this build tree.
class PipelineTest : public ::testing::Test {
protected:
    void SetUp() override {
        artifacts = find_library_artifacts(default_candidate_providers());
        if (!artifacts)
            GTEST_SKIP() << "runtime archives not found";
        auto toolchain = probe_system_compiler(system_compiler_name());
        if (!toolchain)
            GTEST_SKIP() << toolchain.error().describe();
        handle = *toolchain;

        auto opened = Cache::open(dir.path() / "cache");
        ASSERT_TRUE(opened.has_value());
        cache.emplace(std::move(*opened));

        write_file(dir.path() / "log.txt", "INFO: start\nERROR: fail\nINFO: retry\nERROR: again\n");
    }

    CompilerFactory factory() {
        return [this]() -> Result<Compiler> {
            ++compiles;
            return Compiler(handle, artifacts);
        };
    }

    RunConfig config_for(std::string expression) const {
        return RunConfig{
            .expression = std::move(expression),
            .input = InputSource{{dir.path() / "log.txt"}, InputFormat::Lines},
            .output = OutputFormat::JsonLines,
        };
    }

    Result<RunReport> run_captured(const RunConfig &config, std::string &out) {
        ::testing::internal::CaptureStdout();
        auto report = run_expression(config, *cache, factory());
        out = ::testing::internal::GetCapturedStdout();
        return report;
    }

    TempDir dir;
    std::optional<LibraryArtifacts> artifacts;
    ToolchainHandle handle;
    std::optional<Cache> cache;
    int compiles = 0;
};

TEST_F(PipelineTest, FilterLogFileThenHitCache) {
    const auto config = config_for("_.filter(|line| line.starts_with(\"ERROR\"))");

    std::string out;
    auto first = run_captured(config, out);
    ASSERT_TRUE(first.has_value()) << first.error().message;
    EXPECT_EQ(out, "\"ERROR: fail\"\n\"ERROR: again\"\n");
    EXPECT_FALSE(first->compile.cache_hit);

    auto second = run_captured(config, out);
    ASSERT_TRUE(second.has_value()) << second.error().message;
    EXPECT_EQ(out, "\"ERROR: fail\"\n\"ERROR: again\"\n");
    EXPECT_TRUE(second->compile.cache_hit);
    EXPECT_EQ(second->compile.binary_path, first->compile.binary_path);
    EXPECT_EQ(compiles, 1);
}

TEST_F(PipelineTest, DistinctExpressionsDistinctBinaries) {
    std::string out;
    auto counted = run_captured(config_for("_.count()"), out);
    ASSERT_TRUE(counted.has_value()) << counted.error().message;
    EXPECT_EQ(out, "4\n");

    auto taken = run_captured(config_for("_.take(1)"), out);
    ASSERT_TRUE(taken.has_value()) << taken.error().message;
    EXPECT_EQ(out, "\"INFO: start\"\n");
    EXPECT_NE(counted->compile.binary_path, taken->compile.binary_path);

    auto stats = cache->stats();
    ASSERT_TRUE(stats.has_value());
    EXPECT_EQ(stats->binary_count, 2u);
}

TEST_F(PipelineTest, CompileErrorIsTranslatedAndNotCached) {
    std::string out;
    auto report = run_captured(config_for("_.no_such_operation()"), out);
    ASSERT_FALSE(report.has_value());
    EXPECT_EQ(report.error().kind, ErrorKind::Compilation);
    EXPECT_NE(report.error().message.find("Compilation Error"), std::string::npos);

    auto stats = cache->stats();
    ASSERT_TRUE(stats.has_value());
    EXPECT_EQ(stats->binary_count, 0u);
}

TEST_F(PipelineTest, RuntimeFailureIsExecutionError) {
    std::string out;
    auto report = run_captured(config_for("_.map(|x| std::stoi(x)).sum()"), out);
    ASSERT_FALSE(report.has_value());
    EXPECT_EQ(report.error().kind, ErrorKind::Execution);
}

TEST_F(PipelineTest, FilterStdinWithDefaultFormat) {
    write_file(dir.path() / "stdin.txt", "INFO: ok\nERROR: fail\nWARN: meh\nERROR: again\n");
    ScopedStdin stdin_from(dir.path() / "stdin.txt");

    // Captured stdout is not a terminal, so the default is what a pipe gets.
    const RunConfig config{
        .expression = "_.filter(|x| x.contains(\"ERROR\"))",
        .input = InputSource{},
        .output = default_output_format(false),
    };

    std::string out;
    auto report = run_captured(config, out);
    ASSERT_TRUE(report.has_value()) << report.error().message;
    EXPECT_EQ(out, "\"ERROR: fail\"\n\"ERROR: again\"\n");
}
