#pragma once

#include "lob/utility.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace lob {

/**
 * @brief Process-wide on-disk locations, resolved once and passed explicitly.
 */
struct CacheLocations {
    std::filesystem::path root;          ///< Holds `sources/` and `binaries/`.
    std::filesystem::path toolchain_dir; ///< Extraction target for the embedded toolchain.

    static CacheLocations under(const std::filesystem::path &root) {
        return {root, root / "toolchain"};
    }
};

/**
 * @brief Resolves the cache root from the environment.
 *
 * `LOB_CACHE_DIR` wins; otherwise `$XDG_CACHE_HOME/lob`, then `$HOME/.cache/lob`.
 * @return Cache error when none of them is available.
 */
Result<CacheLocations> resolve_cache_locations();

struct CacheStats {
    size_t binary_count = 0;
    uint64_t total_size = 0;

    /** @brief Human-scaled size: "500 B", "1.00 KB", "1.50 MB", "2.00 GB". */
    std::string format_size() const;
};

/**
 * @brief Content-addressed store of generated sources and compiled binaries.
 *
 * Both artifacts of an entry share one key, the SHA-256 of the source text.
 * Entries are written to a temporary sibling and renamed into place, so
 * concurrent processes racing on the same key see either no file or a whole
 * one. There is no locking; a race only wastes a compile.
 */
class Cache {
public:
    /**
     * @brief Opens the cache at `root`, creating `sources/` and `binaries/` as needed.
     */
    static Result<Cache> open(std::filesystem::path root);

    const std::filesystem::path &root() const {
        return root_;
    }

    /**
     * @brief Hex SHA-256 of the source bytes.
     * @return Cache error when the digest cannot be computed.
     */
    static Result<std::string> hash_source(std::string_view source);

    /** @brief Path of the cached binary for `key` if one exists. Never reads it. */
    std::optional<std::filesystem::path> lookup(std::string_view key) const;

    /** @brief Writes `source` to `sources/<key>` and returns that path. */
    Result<std::filesystem::path> store_source(std::string_view key, std::string_view source) const;

    /** @brief Where the binary for `key` lives. Existence is not implied. */
    std::filesystem::path binary_path(std::string_view key) const;

    /** @brief A fresh, unique temporary path beside `binary_path(key)` for the compiler to write. */
    std::filesystem::path staging_path(std::string_view key) const;

    /** @brief Atomically moves a fully linked binary from `staged` to `binary_path(key)`. */
    Result<std::filesystem::path> commit_binary(const std::filesystem::path &staged, std::string_view key) const;

    /** @brief Removes and recreates both subdirectories. Safe when they are absent. */
    Result<void> clear() const;

    /** @brief Count and total size of the binaries subdirectory. */
    Result<CacheStats> stats() const;

private:
    explicit Cache(std::filesystem::path root) : root_(std::move(root)) {
    }

    std::filesystem::path sources_dir() const {
        return root_ / "sources";
    }
    std::filesystem::path binaries_dir() const {
        return root_ / "binaries";
    }

    std::filesystem::path root_;
};

/** @brief Marker embedded in temporary file names; such files are not cache entries. */
inline constexpr std::string_view TEMP_MARKER = ".tmp-";

/** @brief A process-unique temporary sibling of `target`. */
std::filesystem::path unique_temp_sibling(const std::filesystem::path &target);

} // namespace lob
