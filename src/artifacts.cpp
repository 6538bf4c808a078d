#include "lob/artifacts.hpp"

#include <cstdlib>
#include <filesystem>
#include <string>
#include <string_view>

#ifndef LOB_RUNTIME_INCLUDE_DIR
#define LOB_RUNTIME_INCLUDE_DIR ""
#endif

namespace lob {

namespace {

constexpr std::string_view PRELUDE_STEM = "liblob_prelude";
constexpr std::string_view CORE_STEM = "liblob_core";
constexpr std::string_view ARCHIVE_EXT = ".a";

bool is_file(const std::filesystem::path &p) {
    std::error_code ec;
    return std::filesystem::is_regular_file(p, ec);
}

// deps/liblob_prelude-<hash>.a
std::optional<std::filesystem::path> find_hashed(const std::filesystem::path &deps, std::string_view stem) {
    std::error_code ec;
    if (!std::filesystem::is_directory(deps, ec))
        return std::nullopt;

    std::filesystem::directory_iterator it(deps, ec);
    if (ec)
        return std::nullopt;

    const std::string prefix = std::string(stem) + "-";
    std::optional<std::filesystem::path> best;
    for (const std::filesystem::directory_iterator end{}; it != end; it.increment(ec)) {
        const auto &entry = *it;
        const std::string name = entry.path().filename().string();
        std::error_code entry_ec;
        if (!name.starts_with(prefix) || !name.ends_with(ARCHIVE_EXT) || !entry.is_regular_file(entry_ec))
            continue;
        // Directory order is unspecified; pick the smallest name so repeated runs agree.
        if (!best || entry.path() < *best)
            best = entry.path();
    }
    if (ec)
        return std::nullopt;
    return best;
}

std::vector<std::filesystem::path> ancestors_of(std::filesystem::path dir) {
    std::vector<std::filesystem::path> result;
    while (!dir.empty()) {
        result.push_back(dir);
        auto parent = dir.parent_path();
        if (parent == dir)
            break;
        dir = std::move(parent);
    }
    return result;
}

std::vector<std::filesystem::path> build_roots_of_ancestors(const std::filesystem::path &start) {
    std::vector<std::filesystem::path> roots;
    for (const auto &ancestor : ancestors_of(start)) {
        auto under = build_roots_under(ancestor);
        roots.insert(roots.end(), under.begin(), under.end());
    }
    return roots;
}

std::optional<std::filesystem::path> current_executable_dir() {
    std::error_code ec;
    auto exe = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (ec || exe.empty())
        return std::nullopt;
    return exe.parent_path();
}

std::optional<std::filesystem::path> current_dir() {
    std::error_code ec;
    auto cwd = std::filesystem::current_path(ec);
    if (ec)
        return std::nullopt;
    return cwd;
}

std::vector<std::filesystem::path> manifest_candidates() {
    const char *manifest = std::getenv("LOB_MANIFEST_DIR");
    if (!manifest || !*manifest)
        return {};
    return build_roots_of_ancestors(std::filesystem::absolute(manifest));
}

std::vector<std::filesystem::path> executable_candidates() {
    auto exe_dir = current_executable_dir();
    if (!exe_dir)
        return {};

    std::vector<std::filesystem::path> roots;
    // Test binaries are placed in <build>/tests.
    if (exe_dir->filename() == "tests")
        roots.push_back(exe_dir->parent_path());
    roots.push_back(*exe_dir);
    roots.push_back(exe_dir->parent_path() / "lib");
    return roots;
}

std::vector<std::filesystem::path> cwd_candidates() {
    auto cwd = current_dir();
    if (!cwd)
        return {};
    std::vector<std::filesystem::path> roots{*cwd};
    auto under = build_roots_under(*cwd);
    roots.insert(roots.end(), under.begin(), under.end());
    return roots;
}

std::vector<std::filesystem::path> cwd_ancestor_candidates() {
    auto cwd = current_dir();
    if (!cwd)
        return {};
    return build_roots_of_ancestors(*cwd);
}

bool has_prelude_header(const std::filesystem::path &include_dir) {
    return is_file(include_dir / "lob" / "prelude.hpp");
}

} // namespace

std::vector<std::filesystem::path> build_roots_under(const std::filesystem::path &dir) {
    return {dir / "build", dir / "build" / "Release", dir / "build" / "Debug"};
}

std::optional<LibraryArtifacts> probe_artifact_root(const std::filesystem::path &root) {
    const auto deps = root / "deps";

    const auto prelude = root / (std::string(PRELUDE_STEM) + std::string(ARCHIVE_EXT));
    const auto core = root / (std::string(CORE_STEM) + std::string(ARCHIVE_EXT));
    if (is_file(prelude) && is_file(core))
        return LibraryArtifacts{root, prelude, core, deps};

    auto hashed_prelude = find_hashed(deps, PRELUDE_STEM);
    auto hashed_core = find_hashed(deps, CORE_STEM);
    if (hashed_prelude && hashed_core)
        return LibraryArtifacts{root, *hashed_prelude, *hashed_core, deps};

    return std::nullopt;
}

std::optional<LibraryArtifacts> find_library_artifacts(std::span<const CandidateProvider> providers) {
    for (const auto &provider : providers) {
        for (const auto &root : provider()) {
            if (auto found = probe_artifact_root(root))
                return found;
        }
    }
    return std::nullopt;
}

std::vector<CandidateProvider> default_candidate_providers() {
    return {manifest_candidates, executable_candidates, cwd_candidates, cwd_ancestor_candidates};
}

std::filesystem::path runtime_include_dir(const std::optional<LibraryArtifacts> &artifacts) {
    if (artifacts) {
        for (const auto &candidate : {artifacts->root / "include", artifacts->root.parent_path() / "include"}) {
            if (has_prelude_header(candidate))
                return candidate;
        }
    }
    return LOB_RUNTIME_INCLUDE_DIR;
}

} // namespace lob
