#pragma once

#include "lob/cache.hpp"
#include "lob/utility.hpp"

#include <filesystem>
#include <optional>
#include <span>
#include <string>

namespace lob {

/**
 * @brief A compiler the tool can invoke.
 */
struct ToolchainHandle {
    std::filesystem::path compiler;
    std::optional<std::filesystem::path> stdlib_root; ///< Passed as --sysroot when set.
    bool embedded = false;
};

/**
 * @brief The toolchain archive carried inside the lob binary, extracted on first use.
 *
 * The extraction directory counts as ready only when `bin/c++` exists inside
 * it. A directory left behind by an interrupted extraction is removed and
 * extracted again.
 */
class EmbeddedToolchain {
public:
    EmbeddedToolchain(std::filesystem::path dir, std::span<const unsigned char> archive)
        : dir_(std::move(dir)), archive_(archive) {
    }

    /**
     * @brief Extracts the archive unless a valid extraction already exists.
     * @return Toolchain error when no archive was embedded or unpacking fails.
     */
    Result<void> ensure_extracted(bool verbose = false) const;

    bool is_valid() const;

    std::filesystem::path compiler_path() const {
        return dir_ / "bin" / "c++";
    }

    const std::filesystem::path &sysroot() const {
        return dir_;
    }

    ToolchainHandle handle() const {
        return {compiler_path(), sysroot(), true};
    }

private:
    std::filesystem::path dir_;
    std::span<const unsigned char> archive_;
};

/** @brief `LOB_CXX` when set, otherwise "c++". */
std::string system_compiler_name();

/**
 * @brief Checks that `compiler --version` runs and exits 0.
 * @return Handle without a stdlib override, or a Toolchain error.
 */
Result<ToolchainHandle> probe_system_compiler(const std::string &compiler);

/**
 * @brief Embedded toolchain first, system compiler second.
 */
Result<ToolchainHandle> resolve_toolchain(const EmbeddedToolchain &embedded, const std::string &system_compiler,
                                          bool verbose);

/**
 * @brief Resolves against the built-in archive and the configured system compiler.
 */
Result<ToolchainHandle> resolve_toolchain(const CacheLocations &locations, bool verbose);

} // namespace lob
