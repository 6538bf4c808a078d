#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace lob {

/** @brief Strips leading and trailing ASCII whitespace. */
std::string_view trim(std::string_view text);

/**
 * @brief Splits one delimited record into fields.
 *
 * Fields may be wrapped in double quotes; inside quotes the delimiter is
 * literal and a doubled quote stands for one quote. Records never span lines.
 */
std::vector<std::string> split_record(std::string_view line, char delimiter);

/** @brief Quotes a field for CSV output when it contains ',', '"' or a line break. */
std::string csv_escape(std::string_view field);

/** @brief Renders text as a double-quoted literal with C-style escapes. */
std::string quote_debug(std::string_view text);

/** @brief Parses a whole-string integer, ignoring surrounding whitespace. Returns 0 on malformed input. */
long long parse_integer(std::string_view text);

/** @brief Parses a whole-string floating-point value. Returns 0.0 on malformed input. */
double parse_double(std::string_view text);

} // namespace lob
