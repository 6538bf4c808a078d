#pragma once

#include <expected>
#include <string>
#include <string_view>
#include <utility>

namespace lob {

enum class ErrorKind {
    Io,
    Cache,
    Toolchain,
    Compilation,
    InvalidExpression,
    Execution,
};

/**
 * @brief Error carried by every fallible lob operation.
 *
 * Compilation errors hold display-ready text produced by the diagnostic
 * translator. Execution errors additionally hold the child's exit status.
 */
struct Error {
    ErrorKind kind;
    std::string message;
    int exit_status = 0;

    static Error io(std::string msg) {
        return {ErrorKind::Io, std::move(msg)};
    }
    static Error cache(std::string msg) {
        return {ErrorKind::Cache, std::move(msg)};
    }
    static Error toolchain(std::string msg) {
        return {ErrorKind::Toolchain, std::move(msg)};
    }
    static Error compilation(std::string msg) {
        return {ErrorKind::Compilation, std::move(msg)};
    }
    static Error invalid_expression(std::string msg) {
        return {ErrorKind::InvalidExpression, std::move(msg)};
    }
    static Error execution(int status) {
        return {ErrorKind::Execution, "Execution failed with status: " + std::to_string(status), status};
    }

    /** @brief Message prefixed with the error category, as printed after "Error: ". */
    std::string describe() const;
};

template <typename T>
using Result = std::expected<T, Error>;

std::string_view to_string(ErrorKind kind);

} // namespace lob
