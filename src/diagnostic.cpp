#include "lob/diagnostic.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <format>
#include <initializer_list>
#include <string>
#include <string_view>
#include <unistd.h>
#include <vector>

namespace lob {

namespace {

constexpr std::string_view RED_BOLD = "1;31";
constexpr std::string_view RED = "31";
constexpr std::string_view YELLOW_BOLD = "1;33";
constexpr std::string_view YELLOW = "33";
constexpr std::string_view GREEN = "32";
constexpr std::string_view BLUE = "34";
constexpr std::string_view CYAN = "36";
constexpr std::string_view CYAN_BOLD = "1;36";

constexpr std::string_view TIP = "Tip: Check your expression syntax and ensure all parentheses match";

bool has_any(std::string_view text, std::initializer_list<std::string_view> needles) {
    return std::ranges::any_of(needles, [&](std::string_view n) { return text.contains(n); });
}

bool mentions_string(std::string_view text) {
    return has_any(text, {"basic_string", "std::string"});
}

bool mentions_number(std::string_view text) {
    return has_any(text, {"'int'", "'long", "'double'", "'float'", "'unsigned", "'short'", "integer"});
}

std::string paint(std::string_view text, std::string_view code, bool color) {
    if (!color || text.empty())
        return std::string(text);
    return std::format("\033[{}m{}\033[0m", code, text);
}

std::string_view ltrim(std::string_view sv) {
    while (!sv.empty() && (sv.front() == ' ' || sv.front() == '\t'))
        sv.remove_prefix(1);
    return sv;
}

bool is_blank(std::string_view sv) {
    return std::ranges::all_of(sv, [](char c) { return std::isspace(static_cast<unsigned char>(c)); });
}

// "    7 |     auto x = ..."
bool is_numbered_source_line(std::string_view line) {
    auto rest = ltrim(line);
    size_t digits = 0;
    while (digits < rest.size() && std::isdigit(static_cast<unsigned char>(rest[digits])))
        ++digits;
    if (digits == 0)
        return false;
    rest = ltrim(rest.substr(digits));
    return rest.starts_with('|');
}

// "      |     ^~~~~" or a bare caret line
bool is_annotation_line(std::string_view line) {
    auto rest = ltrim(line);
    if (rest.starts_with('|'))
        return true;
    return line.contains('^') &&
           std::ranges::all_of(rest, [](char c) { return c == '^' || c == '~' || c == ' ' || c == '|'; });
}

bool is_summary_line(std::string_view line) {
    return line.starts_with("compilation terminated") ||
           (line.ends_with(" generated.") && has_any(line, {"error", "warning"}));
}

std::optional<std::string_view> parse_method_in(std::optional<std::string_view> expression) {
    if (!expression)
        return std::nullopt;
    for (std::string_view method : {"parse_csv", "parse_tsv", "parse_json"}) {
        if (expression->contains(std::format(".{}", method)))
            return method;
    }
    return std::nullopt;
}

std::string flag_for(std::string_view method) {
    std::string flag = "--";
    for (char c : method)
        flag += c == '_' ? '-' : c;
    return flag;
}

} // namespace

std::optional<Suggestion> suggest_fix(std::string_view diagnostic, std::optional<std::string_view> expression) {
    const bool comparison = has_any(diagnostic, {"no match for 'operator<", "no match for 'operator>",
                                                 "no match for 'operator==", "no match for 'operator!=",
                                                 "invalid operands to binary expression", "comparison between"});
    if (comparison && mentions_string(diagnostic) && mentions_number(diagnostic)) {
        return Suggestion{"Cannot compare string with number",
                          {
                              "Parse to a number first: std::stoi(x) > 5",
                              "Compare string lengths instead: x.size() > 5",
                              "Compare as strings: x > \"5\"",
                          }};
    }

    const bool range_artifact = has_any(diagnostic, {"'begin' was not declared", "'end' was not declared"});
    const bool unresolved_free =
        !range_artifact &&
        has_any(diagnostic, {"was not declared in this scope", "use of undeclared identifier", "is not a member of"});
    const auto parse_method = parse_method_in(expression);
    const bool missing_member = has_any(diagnostic, {"has no member named", "no member named"});
    if (unresolved_free || (parse_method && missing_member)) {
        if (parse_method) {
            return Suggestion{std::format("{}() is not a method", *parse_method),
                              {std::format("Use the {} flag: lob {} '_.filter(...)'", flag_for(*parse_method),
                                           flag_for(*parse_method))}};
        }
        return Suggestion{"Unknown function or method",
                          {
                              "Check available operations: filter, map, take, skip, count, sum",
                              "Qualify standard library calls with std::, e.g. std::stoi",
                          }};
    }

    if (diagnostic.contains("lambda") &&
        has_any(diagnostic, {"inconsistent deduction for auto return type", "inconsistent types",
                             "must match previous return type", "could not convert", "cannot convert",
                             "no viable conversion"})) {
        return Suggestion{"Type mismatch in closure",
                          {
                              "Check that every branch of the closure returns the same type",
                              "Use an explicit return type: [&](auto &&x) -> long { ... }",
                          }};
    }

    if (diagnostic.contains("operator[]") && mentions_string(diagnostic) &&
        has_any(diagnostic, {"const char", "char const", "char["})) {
        return Suggestion{"Cannot index string with string",
                          {
                              "For CSV: use the --parse-csv flag to parse rows",
                              "Access columns with: row[\"column_name\"]",
                          }};
    }

    if (diagnostic.contains("optional<") &&
        has_any(diagnostic, {"cannot convert", "could not convert", "no match for", "invalid operands",
                             "no viable conversion", "no member named", "has no member named"})) {
        return Suggestion{"Operation returns std::optional - need to extract the value",
                          {
                              "Extract value: value.value()",
                              "With fallback: value.value_or(default)",
                          }};
    }

    if (has_any(diagnostic, {"invalid range expression", "'begin' was not declared",
                             "no matching function for call to 'begin(", "is not iterable"})) {
        return Suggestion{"Value is not iterable",
                          {
                              "Create a sequence: lob::from(values)",
                              "Check if result is terminal (count, sum return values, not sequences)",
                          }};
    }

    return std::nullopt;
}

std::string simplify_location(std::string_view line) {
    size_t start = line.find_first_not_of(' ');
    if (start == std::string_view::npos)
        return std::string(line);

    for (std::string_view prefix : {"In file included from ", "from "}) {
        if (line.substr(start).starts_with(prefix)) {
            start += prefix.size();
            break;
        }
    }

    const size_t colon = line.find(':', start);
    if (colon == std::string_view::npos)
        return std::string(line);

    const std::string_view path = line.substr(start, colon - start);
    const size_t slash = path.rfind('/');
    if (slash == std::string_view::npos || path.contains(' '))
        return std::string(line);

    std::string simplified(line.substr(0, start));
    simplified += path.substr(slash + 1);
    simplified += line.substr(colon);
    return simplified;
}

std::vector<DiagnosticLine> categorize_diagnostic(std::string_view diagnostic) {
    std::vector<DiagnosticLine> lines;

    size_t start = 0;
    while (start < diagnostic.size()) {
        size_t end = diagnostic.find('\n', start);
        if (end == std::string_view::npos)
            end = diagnostic.size();

        std::string_view line = diagnostic.substr(start, end - start);
        if (!line.empty() && line.back() == '\r')
            line.remove_suffix(1);
        start = end + 1;

        if (is_blank(line)) {
            lines.push_back({LineKind::Blank, ""});
            continue;
        }
        if (is_summary_line(line)) {
            lines.push_back({LineKind::Summary, std::string(line)});
            continue;
        }
        if (is_numbered_source_line(line)) {
            lines.push_back({LineKind::SourceLine, std::string(line)});
            continue;
        }
        if (is_annotation_line(line)) {
            lines.push_back({LineKind::Annotation, std::string(line)});
            continue;
        }

        std::string simplified = simplify_location(line);
        const std::string_view trimmed = ltrim(line);
        LineKind kind = LineKind::Other;
        if (has_any(line, {": error: ", ": fatal error: "}) || trimmed.starts_with("error:") ||
            trimmed.starts_with("fatal error:")) {
            kind = LineKind::ErrorHeader;
        } else if (line.contains(": warning: ") || trimmed.starts_with("warning:")) {
            kind = LineKind::WarningHeader;
        } else if (has_any(line, {": note: ", ": help: "}) || trimmed.starts_with("note:") ||
                   trimmed.starts_with("help:")) {
            kind = LineKind::Note;
        } else if (simplified != line || trimmed.starts_with("In file included from")) {
            kind = LineKind::Location;
        }
        lines.push_back({kind, std::move(simplified)});
    }
    return lines;
}

std::string format_compilation_error(std::string_view diagnostic, std::optional<std::string_view> expression,
                                     bool color) {
    std::vector<std::string> out;

    out.push_back(paint("✗ Compilation Error", RED_BOLD, color));
    out.emplace_back();

    if (expression) {
        out.push_back(
            std::format("  {} {}", paint("Your expression:", CYAN_BOLD, color), paint(*expression, YELLOW, color)));
        out.emplace_back();
    }

    if (auto suggestion = suggest_fix(diagnostic, expression)) {
        out.push_back(std::format("  {} {}", paint("Problem:", YELLOW_BOLD, color), suggestion->problem));
        out.push_back(std::format("  {}", paint("How to fix:", YELLOW_BOLD, color)));
        for (const auto &fix : suggestion->fixes)
            out.push_back(std::format("    • {}", paint(fix, GREEN, color)));
        out.emplace_back();
    }

    for (const auto &line : categorize_diagnostic(diagnostic)) {
        switch (line.kind) {
        case LineKind::ErrorHeader:
            out.push_back("  " + paint(line.text, RED_BOLD, color));
            break;
        case LineKind::WarningHeader:
            out.push_back("  " + paint(line.text, YELLOW_BOLD, color));
            break;
        case LineKind::Location:
            out.push_back("  " + paint(line.text, CYAN, color));
            break;
        case LineKind::Annotation:
            out.push_back("  " + paint(line.text, RED_BOLD, color));
            break;
        case LineKind::Note:
            out.push_back("  " + paint(line.text, BLUE, color));
            break;
        case LineKind::Summary:
            out.emplace_back();
            out.push_back("  " + paint(line.text, RED, color));
            break;
        case LineKind::Blank:
            out.emplace_back();
            break;
        case LineKind::SourceLine:
        case LineKind::Other:
            out.push_back("  " + line.text);
            break;
        }
    }

    out.emplace_back();
    out.push_back(paint(TIP, BLUE, color));

    std::string report;
    for (size_t i = 0; i < out.size(); ++i) {
        if (i != 0)
            report += '\n';
        report += out[i];
    }
    return report;
}

bool stderr_supports_color() {
    const char *no_color = std::getenv("NO_COLOR");
    if (no_color && *no_color)
        return false;
    return isatty(STDERR_FILENO) == 1;
}

} // namespace lob
