#pragma once

#include "lob/utility.hpp"

#include <filesystem>
#include <optional>
#include <string_view>
#include <vector>

namespace lob {

enum class InputFormat {
    Lines,
    Csv,
    Tsv,
    JsonLines,
};

enum class OutputFormat {
    Debug,
    Json,
    JsonLines,
    Csv,
    Table,
};

/**
 * @brief Where the generated program reads its records from.
 *
 * An empty file list means standard input.
 */
struct InputSource {
    std::vector<std::filesystem::path> files;
    InputFormat format = InputFormat::Lines;

    bool is_stdin() const {
        return files.empty();
    }

    /**
     * @brief Checks that every named file exists.
     * @return Io error naming the first missing file.
     */
    Result<void> validate() const;
};

/**
 * @brief Parses an output format name ("debug", "json", "jsonl", "jsonlines", "csv", "table").
 */
std::optional<OutputFormat> parse_output_format(std::string_view name);

/**
 * @brief Debug on a terminal, JSON lines when piped.
 */
OutputFormat default_output_format(bool stdout_is_terminal);

bool stdout_is_terminal();

std::string_view to_string(InputFormat format);
std::string_view to_string(OutputFormat format);

} // namespace lob
