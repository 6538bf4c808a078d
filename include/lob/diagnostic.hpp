#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace lob {

/**
 * @brief A recognized failure pattern and what the user can do about it.
 */
struct Suggestion {
    std::string problem;
    std::vector<std::string> fixes;
};

/**
 * @brief Matches compiler stderr against a fixed, ordered rule list. First match wins.
 *
 * Rules, in order: string/number comparison, unresolved function (with a
 * dedicated message for `.parse_csv()` style calls), closure return type
 * mismatch, string indexed with a string, unextracted std::optional, value
 * used as a range.
 *
 * @param expression The user's expression, when known.
 * @return No value when nothing matches.
 */
std::optional<Suggestion> suggest_fix(std::string_view diagnostic, std::optional<std::string_view> expression);

enum class LineKind {
    ErrorHeader,
    WarningHeader,
    Location,
    SourceLine,
    Annotation,
    Note,
    Summary,
    Blank,
    Other,
};

struct DiagnosticLine {
    LineKind kind;
    std::string text;
};

/**
 * @brief Splits raw compiler output into lines tagged by kind.
 *
 * Paths in location prefixes are reduced to their base name; source lines
 * (`  7 | ...`) are kept verbatim. Never fails, whatever the input.
 */
std::vector<DiagnosticLine> categorize_diagnostic(std::string_view diagnostic);

/**
 * @brief Replaces the leading `dir/file:` of a compiler location with `file:`.
 */
std::string simplify_location(std::string_view line);

/**
 * @brief Builds the report shown for a failed compile.
 *
 * Header, the echoed expression, a suggestion block when a rule matches,
 * every diagnostic line restyled by kind, and a closing tip.
 */
std::string format_compilation_error(std::string_view diagnostic, std::optional<std::string_view> expression,
                                     bool color);

/** @brief True when stderr is a terminal and NO_COLOR is unset. */
bool stderr_supports_color();

} // namespace lob
