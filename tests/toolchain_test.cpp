// Toolchain Tests
// Tests for embedded toolchain extraction, system compiler probing and subprocess helpers

#include "lob/process_exec.hpp"
#include "lob/toolchain.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>
#include <vector>

using namespace lob;
using lob::test::ScopedEnv;
using lob::test::TempDir;
using lob::test::write_file;
namespace fs = std::filesystem;

namespace {

// Builds a gzip tarball holding bin/c++ with the system tar.
std::optional<std::vector<unsigned char>> make_toolchain_archive(const fs::path &scratch) {
    const auto tree = scratch / "tree";
    write_file(tree / "bin" / "c++", "#!/bin/sh\nexit 0\n");
    const auto archive = scratch / "toolchain.tar.gz";
    auto res = process_quiet({"tar", "-czf", archive.string(), "-C", tree.string(), "."});
    if (!res || *res != 0)
        return std::nullopt;
    const auto bytes = lob::test::read_file(archive);
    return std::vector<unsigned char>(bytes.begin(), bytes.end());
}

} // namespace

// ============================================================================
// EmbeddedToolchain
// ============================================================================

class EmbeddedToolchainTest : public ::testing::Test {
protected:
    fs::path toolchain_dir() const {
        return dir.path() / "cache" / "toolchain";
    }

    TempDir dir;
};

TEST_F(EmbeddedToolchainTest, EmptyArchiveUnavailable) {
    EmbeddedToolchain embedded(toolchain_dir(), {});
    EXPECT_FALSE(embedded.is_valid());

    auto res = embedded.ensure_extracted();
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().kind, ErrorKind::Toolchain);
    EXPECT_TRUE(res.error().message.starts_with("No embedded toolchain available"));
}

TEST_F(EmbeddedToolchainTest, ExistingToolchainReused) {
    write_file(toolchain_dir() / "bin" / "c++", "");
    EmbeddedToolchain embedded(toolchain_dir(), {});

    EXPECT_TRUE(embedded.is_valid());
    EXPECT_TRUE(embedded.ensure_extracted().has_value());

    const auto handle = embedded.handle();
    EXPECT_EQ(handle.compiler, toolchain_dir() / "bin" / "c++");
    ASSERT_TRUE(handle.stdlib_root.has_value());
    EXPECT_EQ(*handle.stdlib_root, toolchain_dir());
    EXPECT_TRUE(handle.embedded);
}

TEST_F(EmbeddedToolchainTest, DirectoryWithoutCompilerIsInvalid) {
    fs::create_directories(toolchain_dir() / "bin");
    EmbeddedToolchain embedded(toolchain_dir(), {});
    EXPECT_FALSE(embedded.is_valid());
    EXPECT_FALSE(embedded.ensure_extracted().has_value());
}

TEST_F(EmbeddedToolchainTest, ExtractsArchive) {
    auto archive = make_toolchain_archive(dir.path() / "scratch");
    if (!archive)
        GTEST_SKIP() << "tar is not available";

    EmbeddedToolchain embedded(toolchain_dir(), *archive);
    auto res = embedded.ensure_extracted();
    ASSERT_TRUE(res.has_value()) << res.error().describe();
    EXPECT_TRUE(embedded.is_valid());

    const auto perms = fs::status(embedded.compiler_path()).permissions();
    EXPECT_NE(perms & fs::perms::owner_exec, fs::perms::none);

    // No staging directories left next to the toolchain.
    for (const auto &entry : fs::directory_iterator(toolchain_dir().parent_path()))
        EXPECT_EQ(entry.path(), toolchain_dir());
}

TEST_F(EmbeddedToolchainTest, IncompleteExtractionReplaced) {
    auto archive = make_toolchain_archive(dir.path() / "scratch");
    if (!archive)
        GTEST_SKIP() << "tar is not available";

    write_file(toolchain_dir() / "leftover", "partial");
    EmbeddedToolchain embedded(toolchain_dir(), *archive);
    ASSERT_FALSE(embedded.is_valid());

    ASSERT_TRUE(embedded.ensure_extracted().has_value());
    EXPECT_TRUE(embedded.is_valid());
    EXPECT_FALSE(fs::exists(toolchain_dir() / "leftover"));
}

// ============================================================================
// System compiler
// ============================================================================

TEST(SystemCompilerTest, NameFromEnvironment) {
    {
        ScopedEnv env("LOB_CXX", "clang++");
        EXPECT_EQ(system_compiler_name(), "clang++");
    }
    ScopedEnv env("LOB_CXX", std::nullopt);
    EXPECT_EQ(system_compiler_name(), "c++");
}

TEST(SystemCompilerTest, MissingCompiler) {
    auto res = probe_system_compiler("lob-no-such-compiler");
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().kind, ErrorKind::Toolchain);
    EXPECT_EQ(res.error().message, "lob-no-such-compiler not found. Install a C++ compiler or set LOB_CXX");
}

TEST(SystemCompilerTest, BrokenCompiler) {
    auto res = probe_system_compiler("false");
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().message, "false not working properly");
}

TEST(SystemCompilerTest, WorkingCompiler) {
    auto res = probe_system_compiler("true");
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(res->compiler, fs::path("true"));
    EXPECT_FALSE(res->stdlib_root.has_value());
    EXPECT_FALSE(res->embedded);
}

// ============================================================================
// Resolution order
// ============================================================================

TEST(ResolveToolchainTest, EmbeddedPreferred) {
    TempDir dir;
    write_file(dir.path() / "toolchain" / "bin" / "c++", "");
    EmbeddedToolchain embedded(dir.path() / "toolchain", {});

    auto res = resolve_toolchain(embedded, "true", false);
    ASSERT_TRUE(res.has_value());
    EXPECT_TRUE(res->embedded);
}

TEST(ResolveToolchainTest, FallsBackToSystem) {
    TempDir dir;
    EmbeddedToolchain embedded(dir.path() / "toolchain", {});

    auto res = resolve_toolchain(embedded, "true", false);
    ASSERT_TRUE(res.has_value());
    EXPECT_FALSE(res->embedded);
    EXPECT_EQ(res->compiler, fs::path("true"));
}

TEST(ResolveToolchainTest, BothUnavailable) {
    TempDir dir;
    EmbeddedToolchain embedded(dir.path() / "toolchain", {});

    auto res = resolve_toolchain(embedded, "lob-no-such-compiler", false);
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().kind, ErrorKind::Toolchain);
}

// ============================================================================
// Subprocess helpers
// ============================================================================

TEST(ProcessTest, CaptureSeparatesStreams) {
    auto res = process_capture({"sh", "-c", "echo out; echo err >&2; exit 3"});
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(res->status, 3);
    EXPECT_EQ(res->out, "out\n");
    EXPECT_EQ(res->err, "err\n");
}

TEST(ProcessTest, WorkingDirectory) {
    TempDir dir;
    auto res = process_capture({"pwd"}, dir.path().string());
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(res->out, fs::canonical(dir.path()).string() + "\n");
}

TEST(ProcessTest, EmptyCommandRejected) {
    auto res = process_exec({});
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().kind, ErrorKind::Io);
}

TEST(ProcessTest, MissingProgram) {
    auto res = process_quiet({"lob-no-such-program"});
    EXPECT_FALSE(res.has_value());
}
