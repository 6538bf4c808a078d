#include "lob/cache.hpp"

#include "lob/sha256.hpp"
#include "lob/utility.hpp"

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <fstream>
#include <stdexcept>
#include <unistd.h>

namespace lob {

namespace {

constexpr std::string_view APP_NAME = "lob";

Error fs_error(std::string_view what, const std::filesystem::path &path, const std::error_code &ec) {
    return Error::io(std::format("{} {}: {}", what, path.string(), ec.message()));
}

Result<void> ensure_dir(const std::filesystem::path &dir) {
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec)
        return std::unexpected(fs_error("Failed to create directory", dir, ec));
    return {};
}

Result<void> write_atomically(const std::filesystem::path &target, std::string_view content) {
    const auto temp = unique_temp_sibling(target);
    {
        std::ofstream out(temp, std::ios::binary | std::ios::trunc);
        if (!out)
            return std::unexpected(Error::io(std::format("Failed to open {} for writing", temp.string())));
        out.write(content.data(), static_cast<std::streamsize>(content.size()));
        out.close();
        if (!out) {
            std::error_code ignored;
            std::filesystem::remove(temp, ignored);
            return std::unexpected(Error::io(std::format("Failed to write {}", temp.string())));
        }
    }

    std::error_code ec;
    std::filesystem::rename(temp, target, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(temp, ignored);
        return std::unexpected(fs_error("Failed to move into place", target, ec));
    }
    return {};
}

} // namespace

std::filesystem::path unique_temp_sibling(const std::filesystem::path &target) {
    static std::atomic<uint64_t> counter = 0;
    const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    auto name = std::format("{}{}{}-{}-{}", target.filename().string(), TEMP_MARKER, getpid(), stamp,
                            counter.fetch_add(1, std::memory_order_relaxed));
    return target.parent_path() / name;
}

Result<CacheLocations> resolve_cache_locations() {
    if (const char *override_dir = std::getenv("LOB_CACHE_DIR"); override_dir && *override_dir) {
        return CacheLocations::under(override_dir);
    }
    if (const char *xdg = std::getenv("XDG_CACHE_HOME"); xdg && *xdg) {
        return CacheLocations::under(std::filesystem::path(xdg) / APP_NAME);
    }
    if (const char *home = std::getenv("HOME"); home && *home) {
        return CacheLocations::under(std::filesystem::path(home) / ".cache" / APP_NAME);
    }
    return std::unexpected(Error::cache("No cache directory found"));
}

std::string CacheStats::format_size() const {
    constexpr uint64_t KB = 1024;
    constexpr uint64_t MB = 1024 * KB;
    constexpr uint64_t GB = 1024 * MB;

    const auto scaled = [this](uint64_t unit) { return static_cast<double>(total_size) / static_cast<double>(unit); };
    if (total_size >= GB)
        return std::format("{:.2f} GB", scaled(GB));
    if (total_size >= MB)
        return std::format("{:.2f} MB", scaled(MB));
    if (total_size >= KB)
        return std::format("{:.2f} KB", scaled(KB));
    return std::format("{} B", total_size);
}

Result<Cache> Cache::open(std::filesystem::path root) {
    Cache cache(std::move(root));
    if (auto res = ensure_dir(cache.sources_dir()); !res)
        return std::unexpected(res.error());
    if (auto res = ensure_dir(cache.binaries_dir()); !res)
        return std::unexpected(res.error());
    return cache;
}

Result<std::string> Cache::hash_source(std::string_view source) {
    try {
        return sha256(source).to_hex();
    } catch (const std::runtime_error &e) {
        return std::unexpected(Error::cache(std::format("Failed to hash source: {}", e.what())));
    }
}

std::optional<std::filesystem::path> Cache::lookup(std::string_view key) const {
    auto path = binary_path(key);
    std::error_code ec;
    if (std::filesystem::is_regular_file(path, ec))
        return path;
    return std::nullopt;
}

Result<std::filesystem::path> Cache::store_source(std::string_view key, std::string_view source) const {
    if (auto res = ensure_dir(sources_dir()); !res)
        return std::unexpected(res.error());
    auto path = sources_dir() / std::string(key);
    if (auto res = write_atomically(path, source); !res)
        return std::unexpected(res.error());
    return path;
}

std::filesystem::path Cache::binary_path(std::string_view key) const {
    return binaries_dir() / std::string(key);
}

std::filesystem::path Cache::staging_path(std::string_view key) const {
    return unique_temp_sibling(binary_path(key));
}

Result<std::filesystem::path> Cache::commit_binary(const std::filesystem::path &staged, std::string_view key) const {
    auto target = binary_path(key);
    std::error_code ec;
    std::filesystem::rename(staged, target, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(staged, ignored);
        return std::unexpected(fs_error("Failed to move binary into place", target, ec));
    }
    return target;
}

Result<void> Cache::clear() const {
    for (const auto &dir : {binaries_dir(), sources_dir()}) {
        std::error_code ec;
        std::filesystem::remove_all(dir, ec);
        if (ec)
            return std::unexpected(fs_error("Failed to remove", dir, ec));
        if (auto res = ensure_dir(dir); !res)
            return res;
    }
    return {};
}

Result<CacheStats> Cache::stats() const {
    CacheStats stats;
    std::error_code ec;
    if (!std::filesystem::exists(binaries_dir(), ec))
        return stats;

    std::filesystem::directory_iterator it(binaries_dir(), ec);
    if (ec)
        return std::unexpected(fs_error("Failed to read", binaries_dir(), ec));

    for (const std::filesystem::directory_iterator end{}; it != end; it.increment(ec)) {
        const auto &entry = *it;
        std::error_code entry_ec;
        if (!entry.is_regular_file(entry_ec) || entry_ec)
            continue;
        if (entry.path().filename().string().contains(TEMP_MARKER))
            continue;
        const auto size = entry.file_size(entry_ec);
        if (entry_ec)
            return std::unexpected(fs_error("Failed to stat", entry.path(), entry_ec));
        stats.binary_count++;
        stats.total_size += size;
    }
    if (ec)
        return std::unexpected(fs_error("Failed to read", binaries_dir(), ec));
    return stats;
}

} // namespace lob
