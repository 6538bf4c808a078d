#pragma once

#include "lob/seq.hpp"
#include "lob/text.hpp"

#include <algorithm>
#include <cstddef>
#include <filesystem>
#include <format>
#include <iostream>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <ostream>
#include <print>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace lob {

/** @brief One CSV or TSV record keyed by the header row. */
using Row = std::map<std::string, std::string>;

// Input. Lines are trimmed and blank lines dropped. Files that cannot be
// opened contribute nothing. Each file carries its own header row.

Seq<std::string> input();
Seq<std::string> input_from_files(const std::vector<std::filesystem::path> &paths);
Seq<std::string> read_lines(std::istream &in);

Seq<Row> input_csv();
Seq<Row> input_csv_from_files(const std::vector<std::filesystem::path> &paths);
Seq<Row> input_tsv();
Seq<Row> input_tsv_from_files(const std::vector<std::filesystem::path> &paths);

/** @brief Records parsed from raw lines whose first line is the header. */
Seq<Row> parse_records(Seq<std::string> lines, char delimiter);

/** @brief One JSON value per line. Lines that do not parse are skipped. */
Seq<nlohmann::json> input_json();
Seq<nlohmann::json> input_json_from_files(const std::vector<std::filesystem::path> &paths);

namespace detail {

template <typename T>
struct is_optional : std::false_type {};
template <typename T>
struct is_optional<std::optional<T>> : std::true_type {};

template <typename T>
struct is_pair : std::false_type {};
template <typename A, typename B>
struct is_pair<std::pair<A, B>> : std::true_type {};

template <typename T>
concept MapLike = requires {
    typename T::key_type;
    typename T::mapped_type;
};

template <typename T>
concept Iterable = requires(const T &value) {
    std::begin(value);
    std::end(value);
};

template <typename T>
concept Json = std::same_as<T, nlohmann::json>;

/** @brief A header plus string cells, the common shape of CSV and table output. */
struct Table {
    std::vector<std::string> header;
    std::vector<std::vector<std::string>> rows;
};

} // namespace detail

/** @brief Renders any supported value for the debug output format. */
template <typename T>
std::string debug_string(const T &value) {
    if constexpr (detail::Json<T>) {
        return value.dump();
    } else if constexpr (detail::StringLike<T>) {
        return quote_debug(value);
    } else if constexpr (std::is_same_v<T, bool>) {
        return value ? "true" : "false";
    } else if constexpr (std::is_same_v<T, char>) {
        return std::format("'{}'", value);
    } else if constexpr (std::is_arithmetic_v<T>) {
        return std::format("{}", value);
    } else if constexpr (detail::is_optional<T>::value) {
        return value ? debug_string(*value) : std::string("nullopt");
    } else if constexpr (detail::is_pair<T>::value) {
        return std::format("({}, {})", debug_string(value.first), debug_string(value.second));
    } else if constexpr (detail::MapLike<T>) {
        std::string out = "{";
        bool first = true;
        for (const auto &[key, mapped] : value) {
            if (!first)
                out += ", ";
            first = false;
            out += debug_string(key) + ": " + debug_string(mapped);
        }
        return out + "}";
    } else if constexpr (detail::Iterable<T>) {
        std::string out = "[";
        bool first = true;
        for (const auto &item : value) {
            if (!first)
                out += ", ";
            first = false;
            out += debug_string(item);
        }
        return out + "]";
    } else {
        return std::format("{}", value);
    }
}

template <typename T>
void print_debug(const T &value) {
    std::println("{}", debug_string(value));
}

namespace detail {

// Text stays unquoted in cells; everything else uses its debug rendering.
template <typename T>
std::string cell_string(const T &value) {
    if constexpr (Json<T>) {
        if (value.is_string())
            return value.template get<std::string>();
        if (value.is_null())
            return {};
        return value.dump();
    } else if constexpr (StringLike<T>) {
        return std::string(value);
    } else if constexpr (is_optional<T>::value) {
        return value ? cell_string(*value) : std::string();
    } else {
        return debug_string(value);
    }
}

/**
 * @brief Lays items out as columns.
 *
 * Records (string-keyed maps, JSON objects) take their columns from the
 * first record's keys in sorted order; a missing key is an empty cell.
 * Pairs and sequences become positional columns; anything else is a single
 * "value" column. No items means no header either.
 */
template <typename T>
Table tabulate(const std::vector<T> &items) {
    Table table;
    if (items.empty())
        return table;

    if constexpr (Json<T>) {
        if (items.front().is_object()) {
            for (const auto &entry : items.front().items())
                table.header.push_back(entry.key());
            std::sort(table.header.begin(), table.header.end());
            for (const auto &item : items) {
                std::vector<std::string> row;
                for (const auto &key : table.header)
                    row.push_back(item.is_object() && item.contains(key) ? cell_string(item.at(key)) : std::string());
                table.rows.push_back(std::move(row));
            }
            return table;
        }
        table.header.push_back("value");
        for (const auto &item : items)
            table.rows.push_back({cell_string(item)});
    } else if constexpr (MapLike<T> && StringLike<typename T::key_type>) {
        for (const auto &entry : items.front())
            table.header.emplace_back(entry.first);
        std::sort(table.header.begin(), table.header.end());
        for (const auto &item : items) {
            std::vector<std::string> row;
            for (const auto &key : table.header) {
                auto it = item.find(key);
                row.push_back(it == item.end() ? std::string() : cell_string(it->second));
            }
            table.rows.push_back(std::move(row));
        }
    } else if constexpr (is_pair<T>::value) {
        table.header = {"0", "1"};
        for (const auto &item : items)
            table.rows.push_back({cell_string(item.first), cell_string(item.second)});
    } else if constexpr (Iterable<T> && !StringLike<T>) {
        std::size_t width = 0;
        for (const auto &item : items) {
            std::vector<std::string> row;
            for (const auto &cell : item)
                row.push_back(cell_string(cell));
            width = std::max(width, row.size());
            table.rows.push_back(std::move(row));
        }
        for (std::size_t i = 0; i < width; ++i)
            table.header.push_back(std::to_string(i));
        for (auto &row : table.rows)
            row.resize(width);
    } else {
        table.header.push_back("value");
        for (const auto &item : items)
            table.rows.push_back({cell_string(item)});
    }
    return table;
}

} // namespace detail

/** @brief Writes a header line then one line per row, escaping as needed. */
void write_csv_table(std::ostream &out, const std::vector<std::string> &header,
                     const std::vector<std::vector<std::string>> &rows);

template <typename T>
void write_csv(std::ostream &out, const std::vector<T> &items) {
    const auto table = detail::tabulate(items);
    write_csv_table(out, table.header, table.rows);
}

template <typename T>
void write_csv(const std::vector<T> &items) {
    write_csv(std::cout, items);
}

} // namespace lob
