#pragma once

#include <filesystem>
#include <functional>
#include <optional>
#include <span>
#include <vector>

namespace lob {

/**
 * @brief The runtime archives a generated program links against.
 */
struct LibraryArtifacts {
    std::filesystem::path root;
    std::filesystem::path prelude; ///< liblob_prelude.a (or a hash-suffixed copy under deps/)
    std::filesystem::path core;    ///< liblob_core.a (or a hash-suffixed copy under deps/)
    std::filesystem::path deps_dir;
};

/** @brief Yields candidate build roots in preference order. */
using CandidateProvider = std::function<std::vector<std::filesystem::path>()>;

/**
 * @brief Checks one root for both archives.
 *
 * Fixed-name files directly in `root` are preferred; otherwise
 * `root/deps/liblob_prelude-<hash>.a` and `root/deps/liblob_core-<hash>.a`.
 */
std::optional<LibraryArtifacts> probe_artifact_root(const std::filesystem::path &root);

/**
 * @brief Walks providers in order and returns the first root holding both archives.
 */
std::optional<LibraryArtifacts> find_library_artifacts(std::span<const CandidateProvider> providers);

/**
 * @brief Build output roots below `dir`: `dir/build`, `dir/build/Release`, `dir/build/Debug`.
 */
std::vector<std::filesystem::path> build_roots_under(const std::filesystem::path &dir);

/**
 * @brief The default discovery order.
 *
 * 1. Every ancestor of `$LOB_MANIFEST_DIR`, checking its build roots.
 * 2. Around the running executable, with a special case for test binaries
 *    living in a `tests/` directory of a build root.
 * 3. The current working directory.
 * 4. Every ancestor of the current working directory.
 */
std::vector<CandidateProvider> default_candidate_providers();

/**
 * @brief Header directory for generated programs.
 *
 * `root/include` or `root/../include` when it holds lob/prelude.hpp, else the
 * include directory recorded when lob was built.
 */
std::filesystem::path runtime_include_dir(const std::optional<LibraryArtifacts> &artifacts);

} // namespace lob
