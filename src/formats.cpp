#include "lob/formats.hpp"

#include "lob/utility.hpp"

#include <filesystem>
#include <format>
#include <unistd.h>

namespace lob {

Result<void> InputSource::validate() const {
    for (const auto &file : files) {
        std::error_code ec;
        if (!std::filesystem::exists(file, ec)) {
            return std::unexpected(Error::io(std::format("File not found: {}", file.string())));
        }
    }
    return {};
}

std::optional<OutputFormat> parse_output_format(std::string_view name) {
    if (name == "debug")
        return OutputFormat::Debug;
    if (name == "json")
        return OutputFormat::Json;
    if (name == "jsonl" || name == "jsonlines")
        return OutputFormat::JsonLines;
    if (name == "csv")
        return OutputFormat::Csv;
    if (name == "table")
        return OutputFormat::Table;
    return std::nullopt;
}

OutputFormat default_output_format(bool is_terminal) {
    return is_terminal ? OutputFormat::Debug : OutputFormat::JsonLines;
}

bool stdout_is_terminal() {
    return isatty(STDOUT_FILENO) == 1;
}

std::string_view to_string(InputFormat format) {
    switch (format) {
    case InputFormat::Lines:
        return "lines";
    case InputFormat::Csv:
        return "csv";
    case InputFormat::Tsv:
        return "tsv";
    case InputFormat::JsonLines:
        return "jsonl";
    }
    return "lines";
}

std::string_view to_string(OutputFormat format) {
    switch (format) {
    case OutputFormat::Debug:
        return "debug";
    case OutputFormat::Json:
        return "json";
    case OutputFormat::JsonLines:
        return "jsonl";
    case OutputFormat::Csv:
        return "csv";
    case OutputFormat::Table:
        return "table";
    }
    return "debug";
}

} // namespace lob
