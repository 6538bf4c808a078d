#include "lob/toolchain.hpp"

#include "lob/cache.hpp"
#include "lob/embedded_toolchain.hpp"
#include "lob/process_exec.hpp"
#include "lob/utility.hpp"

#include <cstdlib>
#include <filesystem>
#include <format>
#include <fstream>
#include <print>

namespace lob {

namespace {

// Private scratch directory, removed on every exit path.
class StagingDir {
public:
    explicit StagingDir(std::filesystem::path path) : path_(std::move(path)) {
    }
    StagingDir(const StagingDir &) = delete;
    StagingDir &operator=(const StagingDir &) = delete;
    ~StagingDir() {
        std::error_code ignored;
        std::filesystem::remove_all(path_, ignored);
    }

    const std::filesystem::path &path() const {
        return path_;
    }

private:
    std::filesystem::path path_;
};

Error extract_error(std::string_view what, const std::error_code &ec) {
    return Error::toolchain(std::format("{}: {}", what, ec.message()));
}

} // namespace

bool EmbeddedToolchain::is_valid() const {
    std::error_code ec;
    return std::filesystem::is_directory(dir_, ec) && std::filesystem::exists(compiler_path(), ec);
}

Result<void> EmbeddedToolchain::ensure_extracted(bool verbose) const {
    if (is_valid())
        return {};

    if (archive_.empty()) {
        return std::unexpected(Error::toolchain(
            "No embedded toolchain available. This binary was built without an embedded toolchain."));
    }

    std::error_code ec;
    if (std::filesystem::exists(dir_, ec)) {
        if (verbose)
            std::println(stderr, "Removing incomplete toolchain at {}", dir_.string());
        std::filesystem::remove_all(dir_, ec);
        if (ec)
            return std::unexpected(extract_error("Failed to remove incomplete toolchain", ec));
    }

    std::filesystem::create_directories(dir_.parent_path(), ec);
    if (ec)
        return std::unexpected(extract_error("Failed to create toolchain directory", ec));

    StagingDir staging(unique_temp_sibling(dir_));
    const auto unpacked = staging.path() / "root";
    std::filesystem::create_directories(unpacked, ec);
    if (ec)
        return std::unexpected(extract_error("Failed to create staging directory", ec));

    std::println(stderr, "First run: extracting embedded toolchain...");

    const auto archive_file = staging.path() / "toolchain.tar.gz";
    {
        std::ofstream out(archive_file, std::ios::binary);
        out.write(reinterpret_cast<const char *>(archive_.data()), static_cast<std::streamsize>(archive_.size()));
        if (!out)
            return std::unexpected(Error::toolchain("Failed to write toolchain archive"));
    }

    auto res = process_quiet({"tar", "-xzf", archive_file.string(), "-C", unpacked.string()});
    if (!res)
        return std::unexpected(Error::toolchain(std::format("Failed to extract toolchain: {}", res.error().message)));
    if (*res != 0)
        return std::unexpected(Error::toolchain(std::format("Failed to extract toolchain: tar exited with {}", *res)));

    const auto compiler = unpacked / "bin" / "c++";
    if (std::filesystem::exists(compiler, ec)) {
        using std::filesystem::perms;
        std::filesystem::permissions(compiler,
                                     perms::owner_all | perms::group_read | perms::group_exec | perms::others_read |
                                         perms::others_exec,
                                     ec);
        if (ec)
            return std::unexpected(extract_error("Failed to set compiler permissions", ec));
    }

    std::filesystem::rename(unpacked, dir_, ec);
    if (ec) {
        // Another process finished first.
        if (is_valid())
            return {};
        return std::unexpected(extract_error("Failed to move toolchain into place", ec));
    }

    std::println(stderr, "Toolchain ready!");
    return {};
}

std::string system_compiler_name() {
    if (const char *cxx = std::getenv("LOB_CXX"); cxx && *cxx)
        return cxx;
    return "c++";
}

Result<ToolchainHandle> probe_system_compiler(const std::string &compiler) {
    auto res = process_quiet({compiler, "--version"});
    if (!res) {
        return std::unexpected(
            Error::toolchain(std::format("{} not found. Install a C++ compiler or set LOB_CXX", compiler)));
    }
    if (*res != 0)
        return std::unexpected(Error::toolchain(std::format("{} not working properly", compiler)));
    return ToolchainHandle{compiler, std::nullopt, false};
}

Result<ToolchainHandle> resolve_toolchain(const EmbeddedToolchain &embedded, const std::string &system_compiler,
                                          bool verbose) {
    if (auto res = embedded.ensure_extracted(verbose); res) {
        if (embedded.is_valid()) {
            if (verbose)
                std::println(stderr, "Using embedded toolchain");
            return embedded.handle();
        }
        if (verbose)
            std::println(stderr, "Embedded toolchain invalid, falling back to {}", system_compiler);
    } else if (verbose) {
        std::println(stderr, "Embedded toolchain not available: {}", res.error().message);
        std::println(stderr, "Falling back to {}", system_compiler);
    }

    return probe_system_compiler(system_compiler);
}

Result<ToolchainHandle> resolve_toolchain(const CacheLocations &locations, bool verbose) {
    EmbeddedToolchain embedded(locations.toolchain_dir, embedded_toolchain_archive());
    return resolve_toolchain(embedded, system_compiler_name(), verbose);
}

} // namespace lob
