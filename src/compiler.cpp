#include "lob/compiler.hpp"

#include "lob/artifacts.hpp"
#include "lob/diagnostic.hpp"
#include "lob/process_exec.hpp"
#include "lob/utility.hpp"

#include <filesystem>
#include <format>
#include <utility>

namespace lob {

namespace {

constexpr auto ARGS_VEC_INIT_SZ = 20;

std::optional<LibraryArtifacts> discover_artifacts() {
    const auto providers = default_candidate_providers();
    return find_library_artifacts(providers);
}

} // namespace

Compiler::Compiler(ToolchainHandle toolchain, std::optional<LibraryArtifacts> artifacts, bool color)
    : toolchain_(std::move(toolchain)), artifacts_(std::move(artifacts)),
      include_dir_(runtime_include_dir(artifacts_)), color_(color) {
}

Compiler::Compiler(ToolchainHandle toolchain, bool color)
    : Compiler(std::move(toolchain), discover_artifacts(), color) {
}

std::vector<std::string> Compiler::command_line(const std::filesystem::path &source,
                                                const std::filesystem::path &output) const {
    std::vector<std::string> args;
    args.reserve(ARGS_VEC_INIT_SZ);

    args.push_back(toolchain_.compiler.string());
    args.insert(args.end(), {"-std=c++23", "-O3", "-o", output.string()});
    // Cached sources have no extension, so the language must be named.
    args.insert(args.end(), {"-x", "c++", source.string(), "-x", "none"});

    if (!include_dir_.empty()) {
        args.push_back("-I");
        args.push_back(include_dir_.string());
    }

    if (artifacts_) {
        // prelude before core: the prelude calls into core
        args.push_back(artifacts_->prelude.string());
        args.push_back(artifacts_->core.string());
        args.push_back("-L");
        args.push_back(artifacts_->deps_dir.string());
    }

    if (toolchain_.stdlib_root) {
        args.push_back(std::format("--sysroot={}", toolchain_.stdlib_root->string()));
    }

    return args;
}

Result<void> Compiler::compile(const std::filesystem::path &source, const std::filesystem::path &output,
                               std::optional<std::string_view> expression) const {
    auto res = process_capture(command_line(source, output));
    if (!res)
        return std::unexpected(Error::toolchain(res.error().message));

    if (res->status != 0) {
        return std::unexpected(Error::compilation(format_compilation_error(res->err, expression, color_)));
    }
    return {};
}

Result<CompileResult> compile_and_cache(std::string_view source, const Cache &cache,
                                        const CompilerFactory &make_compiler,
                                        std::optional<std::string_view> expression) {
    const auto hashed = Cache::hash_source(source);
    if (!hashed)
        return std::unexpected(hashed.error());
    const std::string &key = *hashed;

    if (auto cached = cache.lookup(key))
        return CompileResult{*cached, true};

    auto compiler = make_compiler();
    if (!compiler)
        return std::unexpected(compiler.error());

    auto source_path = cache.store_source(key, source);
    if (!source_path)
        return std::unexpected(source_path.error());

    const auto staged = cache.staging_path(key);
    if (auto res = compiler->compile(*source_path, staged, expression); !res) {
        std::error_code ignored;
        std::filesystem::remove(staged, ignored);
        return std::unexpected(res.error());
    }

    auto binary = cache.commit_binary(staged, key);
    if (!binary)
        return std::unexpected(binary.error());
    return CompileResult{*binary, false};
}

} // namespace lob
