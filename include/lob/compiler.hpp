#pragma once

#include "lob/artifacts.hpp"
#include "lob/cache.hpp"
#include "lob/toolchain.hpp"
#include "lob/utility.hpp"

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace lob {

struct CompileResult {
    std::filesystem::path binary_path;
    bool cache_hit = false;
};

/**
 * @brief Drives the C++ compiler for generated programs.
 */
class Compiler {
public:
    /**
     * @param toolchain The compiler to run.
     * @param artifacts Runtime archives to link; when absent the link fails with undefined references.
     * @param color Style the translated diagnostics with ANSI escapes.
     */
    Compiler(ToolchainHandle toolchain, std::optional<LibraryArtifacts> artifacts, bool color = false);

    /** @brief Uses the default artifact discovery order. */
    explicit Compiler(ToolchainHandle toolchain, bool color = false);

    /**
     * @brief The full argument vector for one compile, compiler first.
     */
    std::vector<std::string> command_line(const std::filesystem::path &source,
                                          const std::filesystem::path &output) const;

    /**
     * @brief Compiles `source` into `output`.
     *
     * On a non-zero exit the compiler's stderr is translated and returned as a
     * Compilation error. The raw text is never returned.
     */
    Result<void> compile(const std::filesystem::path &source, const std::filesystem::path &output,
                         std::optional<std::string_view> expression) const;

    const ToolchainHandle &toolchain() const {
        return toolchain_;
    }
    const std::optional<LibraryArtifacts> &artifacts() const {
        return artifacts_;
    }

private:
    ToolchainHandle toolchain_;
    std::optional<LibraryArtifacts> artifacts_;
    std::filesystem::path include_dir_;
    bool color_;
};

using CompilerFactory = std::function<Result<Compiler>()>;

/**
 * @brief Returns the cached binary for `source`, compiling it first on a miss.
 *
 * `make_compiler` runs only on a miss, so a hit never touches the toolchain.
 * The binary is linked into a temporary path and renamed into the cache only
 * after the compiler succeeds.
 */
Result<CompileResult> compile_and_cache(std::string_view source, const Cache &cache,
                                        const CompilerFactory &make_compiler,
                                        std::optional<std::string_view> expression);

} // namespace lob
