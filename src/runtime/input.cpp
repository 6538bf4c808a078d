#include "lob/prelude.hpp"

#include <fstream>
#include <memory>

namespace lob {

namespace {

Seq<std::string> raw_lines(std::istream &in) {
    return Seq<std::string>([&in]() -> std::optional<std::string> {
        std::string line;
        if (std::getline(in, line))
            return line;
        return std::nullopt;
    });
}

// Opened on the first pull; an unreadable file yields nothing.
Seq<std::string> raw_file_lines(const std::filesystem::path &path) {
    auto stream = std::make_shared<std::ifstream>();
    return Seq<std::string>([path, stream, opened = false]() mutable -> std::optional<std::string> {
        if (!opened) {
            opened = true;
            stream->open(path);
        }
        std::string line;
        if (stream->is_open() && std::getline(*stream, line))
            return line;
        return std::nullopt;
    });
}

Seq<std::string> clean(const Seq<std::string> &lines) {
    return lines.map([](std::string &line) { return std::string(trim(line)); })
        .filter([](const std::string &line) { return !line.empty(); });
}

template <typename F>
auto per_file(const std::vector<std::filesystem::path> &paths, F reader) {
    return from(paths).flat_map([reader](std::filesystem::path &path) { return reader(raw_file_lines(path)); });
}

Seq<nlohmann::json> parse_json_lines(const Seq<std::string> &lines) {
    return Seq<nlohmann::json>([lines = clean(lines)]() -> std::optional<nlohmann::json> {
        while (auto line = lines.next()) {
            auto value = nlohmann::json::parse(*line, nullptr, false);
            if (!value.is_discarded())
                return value;
        }
        return std::nullopt;
    });
}

} // namespace

Seq<std::string> read_lines(std::istream &in) {
    return clean(raw_lines(in));
}

Seq<std::string> input() {
    return read_lines(std::cin);
}

Seq<std::string> input_from_files(const std::vector<std::filesystem::path> &paths) {
    return per_file(paths, [](const Seq<std::string> &lines) { return clean(lines); });
}

Seq<Row> parse_records(Seq<std::string> lines, char delimiter) {
    auto content = lines.filter([](const std::string &line) { return !trim(line).empty(); });
    return Seq<Row>([content, delimiter,
                     header = std::optional<std::vector<std::string>>()]() mutable -> std::optional<Row> {
        if (!header) {
            auto first = content.next();
            if (!first)
                return std::nullopt;
            header = split_record(*first, delimiter);
            for (auto &name : *header)
                name = std::string(trim(name));
        }

        auto line = content.next();
        if (!line)
            return std::nullopt;

        // Extra fields are dropped; short records omit the trailing columns.
        auto fields = split_record(*line, delimiter);
        Row row;
        for (size_t i = 0; i < header->size() && i < fields.size(); ++i)
            row[(*header)[i]] = std::move(fields[i]);
        return row;
    });
}

Seq<Row> input_csv() {
    return parse_records(raw_lines(std::cin), ',');
}

Seq<Row> input_csv_from_files(const std::vector<std::filesystem::path> &paths) {
    return per_file(paths, [](const Seq<std::string> &lines) { return parse_records(lines, ','); });
}

Seq<Row> input_tsv() {
    return parse_records(raw_lines(std::cin), '\t');
}

Seq<Row> input_tsv_from_files(const std::vector<std::filesystem::path> &paths) {
    return per_file(paths, [](const Seq<std::string> &lines) { return parse_records(lines, '\t'); });
}

Seq<nlohmann::json> input_json() {
    return parse_json_lines(raw_lines(std::cin));
}

Seq<nlohmann::json> input_json_from_files(const std::vector<std::filesystem::path> &paths) {
    return per_file(paths, [](const Seq<std::string> &lines) { return parse_json_lines(lines); });
}

} // namespace lob
