#pragma once

#include "lob/prelude.hpp"

#include <print>
#include <string>
#include <vector>

namespace lob {

/**
 * @brief Draws a bordered text table. Column widths fit the widest cell.
 */
std::string render_table(const std::vector<std::string> &header, const std::vector<std::vector<std::string>> &rows);

/** @brief Prints items as a table; an empty list prints nothing. */
template <typename T>
void print_table(const std::vector<T> &items) {
    if (items.empty())
        return;
    const auto table = detail::tabulate(items);
    std::print("{}", render_table(table.header, table.rows));
}

} // namespace lob
