#include "lob/prelude.hpp"
#include "lob/table_output.hpp"

#include <algorithm>
#include <ostream>

namespace lob {

namespace {

void write_csv_line(std::ostream &out, const std::vector<std::string> &fields) {
    for (size_t i = 0; i < fields.size(); ++i) {
        if (i != 0)
            out << ',';
        out << csv_escape(fields[i]);
    }
    out << '\n';
}

std::string border(const std::vector<size_t> &widths) {
    std::string line = "+";
    for (const auto width : widths) {
        line.append(width + 2, '-');
        line += '+';
    }
    return line + '\n';
}

std::string table_line(const std::vector<std::string> &cells, const std::vector<size_t> &widths) {
    std::string line = "|";
    for (size_t i = 0; i < widths.size(); ++i) {
        const std::string &cell = i < cells.size() ? cells[i] : std::string();
        line += ' ';
        line += cell;
        line.append(widths[i] - cell.size() + 1, ' ');
        line += '|';
    }
    return line + '\n';
}

} // namespace

void write_csv_table(std::ostream &out, const std::vector<std::string> &header,
                     const std::vector<std::vector<std::string>> &rows) {
    if (rows.empty())
        return;
    write_csv_line(out, header);
    for (const auto &row : rows)
        write_csv_line(out, row);
    out.flush();
}

std::string render_table(const std::vector<std::string> &header, const std::vector<std::vector<std::string>> &rows) {
    if (rows.empty())
        return {};

    std::vector<size_t> widths(header.size(), 0);
    for (size_t i = 0; i < header.size(); ++i)
        widths[i] = header[i].size();
    for (const auto &row : rows) {
        for (size_t i = 0; i < row.size() && i < widths.size(); ++i)
            widths[i] = std::max(widths[i], row[i].size());
    }

    std::string out = border(widths);
    out += table_line(header, widths);
    out += border(widths);
    for (const auto &row : rows)
        out += table_line(row, widths);
    out += border(widths);
    return out;
}

} // namespace lob
