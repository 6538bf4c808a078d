#include "lob/utility.hpp"

#include <format>

namespace lob {

std::string_view to_string(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::Io:
        return "IO error";
    case ErrorKind::Cache:
        return "Cache error";
    case ErrorKind::Toolchain:
        return "Toolchain error";
    case ErrorKind::Compilation:
        return "Compilation failed";
    case ErrorKind::InvalidExpression:
        return "Invalid expression";
    case ErrorKind::Execution:
        return "Execution failed";
    }
    return "Error";
}

std::string Error::describe() const {
    if (kind == ErrorKind::Execution)
        return message;
    return std::format("{}: {}", to_string(kind), message);
}

} // namespace lob
