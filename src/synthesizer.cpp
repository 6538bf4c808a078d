#include "lob/synthesizer.hpp"

#include "lob/formats.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <format>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace lob {

namespace {

constexpr std::string_view INPUT_BINDING = "input_data";

// clang-format off
constexpr std::array<std::string_view, 14> TERMINAL_TOKENS = {
    ".count(", ".sum(", ".sum<", ".reduce(", ".fold(", ".first(", ".last(",
    ".min(", ".max(", ".any(", ".all(", ".collect(", ".collect<", ".to_list(",
};
// clang-format on

std::string_view trim(std::string_view sv) {
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front())))
        sv.remove_prefix(1);
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back())))
        sv.remove_suffix(1);
    return sv;
}

bool is_ident_start(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

bool is_ident_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

// Index one past the closing quote of the literal starting at `pos`.
size_t skip_literal(std::string_view src, size_t pos) {
    const char quote = src[pos];
    size_t i = pos + 1;
    while (i < src.size()) {
        if (src[i] == '\\') {
            i += 2;
        } else if (src[i] == quote) {
            return i + 1;
        } else {
            ++i;
        }
    }
    return src.size();
}

// '\'' doubles as a digit separator (1'000), which must not open a literal.
bool opens_literal(std::string_view src, size_t pos) {
    if (src[pos] == '"')
        return true;
    return src[pos] == '\'' && (pos == 0 || !is_ident_char(src[pos - 1]));
}

// End of a closure body: the first ',' ';' or unbalanced closer at depth zero.
size_t find_body_end(std::string_view src, size_t pos) {
    int depth = 0;
    size_t i = pos;
    while (i < src.size()) {
        const char c = src[i];
        if (opens_literal(src, i)) {
            i = skip_literal(src, i);
            continue;
        }
        if (c == '(' || c == '[' || c == '{') {
            ++depth;
        } else if (c == ')' || c == ']' || c == '}') {
            if (depth == 0)
                return i;
            --depth;
        } else if ((c == ',' || c == ';') && depth == 0) {
            return i;
        }
        ++i;
    }
    return src.size();
}

bool is_block(std::string_view body) {
    if (body.empty() || body.front() != '{')
        return false;
    int depth = 0;
    for (size_t i = 0; i < body.size(); ++i) {
        if (opens_literal(body, i)) {
            i = skip_literal(body, i) - 1;
            continue;
        }
        if (body[i] == '{') {
            ++depth;
        } else if (body[i] == '}' && --depth == 0) {
            return i + 1 == body.size();
        }
    }
    return false;
}

struct Closure {
    std::string text;
    size_t end;
};

std::optional<Closure> parse_closure(std::string_view src, size_t pos) {
    std::vector<std::string_view> params;
    size_t i = pos + 1;
    auto skip_spaces = [&] {
        while (i < src.size() && std::isspace(static_cast<unsigned char>(src[i])))
            ++i;
    };

    skip_spaces();
    if (i < src.size() && src[i] == '|') {
        ++i;
    } else {
        while (true) {
            skip_spaces();
            if (i >= src.size() || !is_ident_start(src[i]))
                return std::nullopt;
            const size_t start = i;
            while (i < src.size() && is_ident_char(src[i]))
                ++i;
            params.push_back(src.substr(start, i - start));
            skip_spaces();
            if (i >= src.size())
                return std::nullopt;
            if (src[i] == '|') {
                ++i;
                break;
            }
            if (src[i] != ',')
                return std::nullopt;
            ++i;
        }
    }

    const size_t end = find_body_end(src, i);
    const std::string_view body = trim(src.substr(i, end - i));
    if (body.empty())
        return std::nullopt;

    std::string text = "[&](";
    for (size_t p = 0; p < params.size(); ++p) {
        if (p != 0)
            text += ", ";
        text += "auto &&";
        text += params[p];
    }
    text += ") ";

    const std::string expanded = expand_closures(body);
    if (is_block(body)) {
        text += expanded;
    } else {
        text += std::format("{{ return {}; }}", expanded);
    }

    // Keep trailing whitespace that preceded the terminator.
    size_t kept = end;
    while (kept > i && std::isspace(static_cast<unsigned char>(src[kept - 1])))
        --kept;
    text.append(src.substr(kept, end - kept));
    return Closure{std::move(text), end};
}

void emit_output(std::string &code, OutputFormat output, bool terminal) {
    if (terminal) {
        switch (output) {
        case OutputFormat::Debug:
            code += "    lob::print_debug(result);\n";
            break;
        case OutputFormat::JsonLines:
            code += "    lob::print_jsonl(result);\n";
            break;
        case OutputFormat::Json:
            code += "    lob::print_json(result);\n";
            break;
        case OutputFormat::Csv:
            // CSV is row oriented, so a single value becomes a one-row table.
            code += "    lob::write_csv(std::vector<decltype(result)>{result});\n";
            break;
        case OutputFormat::Table:
            code += "    lob::print_table(std::vector<decltype(result)>{result});\n";
            break;
        }
        return;
    }

    switch (output) {
    case OutputFormat::Debug:
        code += "    for (auto &&item : result) {\n";
        code += "        lob::print_debug(item);\n";
        code += "    }\n";
        break;
    case OutputFormat::JsonLines:
        code += "    for (auto &&item : result) {\n";
        code += "        lob::print_jsonl(item);\n";
        code += "    }\n";
        break;
    case OutputFormat::Json:
        code += "    lob::print_json(result.to_list());\n";
        break;
    case OutputFormat::Csv:
        code += "    lob::write_csv(result.to_list());\n";
        break;
    case OutputFormat::Table:
        code += "    lob::print_table(result.to_list());\n";
        break;
    }
}

} // namespace

std::string_view acquisition_call(InputFormat format, bool from_files) {
    switch (format) {
    case InputFormat::Lines:
        return from_files ? "lob::input_from_files(input_files)" : "lob::input()";
    case InputFormat::Csv:
        return from_files ? "lob::input_csv_from_files(input_files)" : "lob::input_csv()";
    case InputFormat::Tsv:
        return from_files ? "lob::input_tsv_from_files(input_files)" : "lob::input_tsv()";
    case InputFormat::JsonLines:
        return from_files ? "lob::input_json_from_files(input_files)" : "lob::input_json()";
    }
    return "lob::input()";
}

bool is_terminal_expression(std::string_view expression) {
    return std::ranges::any_of(TERMINAL_TOKENS,
                               [&](std::string_view token) { return expression.contains(token); });
}

std::string expand_closures(std::string_view expression) {
    std::string out;
    out.reserve(expression.size() * 2);

    // Start of text counts as an argument position.
    char last_significant = '(';
    size_t i = 0;
    while (i < expression.size()) {
        const char c = expression[i];
        if (opens_literal(expression, i)) {
            const size_t end = skip_literal(expression, i);
            out.append(expression.substr(i, end - i));
            last_significant = c;
            i = end;
            continue;
        }
        if (c == '|' && (last_significant == '(' || last_significant == ',')) {
            if (auto closure = parse_closure(expression, i)) {
                out += closure->text;
                last_significant = ')';
                i = closure->end;
                continue;
            }
        }
        out += c;
        if (!std::isspace(static_cast<unsigned char>(c)))
            last_significant = c;
        ++i;
    }
    return out;
}

std::string synthesize(std::string_view expression, const InputSource &input, OutputFormat output) {
    std::string code;
    code += "#include <lob/prelude.hpp>\n";
    if (output == OutputFormat::Json || output == OutputFormat::JsonLines) {
        code += "#include <lob/json_output.hpp>\n";
    } else if (output == OutputFormat::Table) {
        code += "#include <lob/table_output.hpp>\n";
    }
    code += '\n';

    const bool uses_input = trim(expression).starts_with('_');
    const bool from_files = uses_input && !input.is_stdin();

    code += from_files ? "int main(int argc, char **argv) {\n" : "int main() {\n";

    std::string body(expression);
    if (uses_input) {
        if (from_files) {
            code += "    const std::vector<std::filesystem::path> input_files(argv + 1, argv + argc);\n";
        }
        code += std::format("    auto {} = {};\n", INPUT_BINDING, acquisition_call(input.format, from_files));
        // Only the first '_' is the input marker; later ones belong to the user.
        body.replace(body.find('_'), 1, INPUT_BINDING);
    }

    code += std::format("    auto result = {};\n", expand_closures(body));
    emit_output(code, output, is_terminal_expression(expression));
    code += "    return 0;\n";
    code += "}\n";
    return code;
}

} // namespace lob
