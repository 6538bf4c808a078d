// Diagnostic Tests
// Tests for suggestion rules, line categorization and the formatted report

#include "lob/diagnostic.hpp"

#include <gtest/gtest.h>

using namespace lob;

namespace {

constexpr std::string_view GCC_UNDECLARED =
    "/home/user/.cache/lob/sources/3f2a: In function 'int main()':\n"
    "/home/user/.cache/lob/sources/3f2a:5:32: error: 'foo' was not declared in this scope\n"
    "    5 |     auto result = input_data.map(foo);\n"
    "      |                                  ^~~\n"
    "compilation terminated due to -Wfatal-errors.\n";

std::string problem_for(std::string_view diagnostic, std::optional<std::string_view> expression = std::nullopt) {
    auto suggestion = suggest_fix(diagnostic, expression);
    return suggestion ? suggestion->problem : std::string("<none>");
}

} // namespace

// ============================================================================
// Suggestion rules
// ============================================================================

TEST(SuggestionTest, StringComparedWithNumber) {
    const auto diag = "error: no match for 'operator>' (operand types are "
                      "'std::__cxx11::basic_string<char>' and 'int')";
    auto suggestion = suggest_fix(diag, "_.filter(|x| x > 5)");
    ASSERT_TRUE(suggestion.has_value());
    EXPECT_EQ(suggestion->problem, "Cannot compare string with number");
    ASSERT_FALSE(suggestion->fixes.empty());
    EXPECT_EQ(suggestion->fixes.front(), "Parse to a number first: std::stoi(x) > 5");
}

TEST(SuggestionTest, ClangInvalidOperands) {
    const auto diag = "error: invalid operands to binary expression ('std::string' (aka "
                      "'basic_string<char>') and 'int')";
    EXPECT_EQ(problem_for(diag), "Cannot compare string with number");
}

TEST(SuggestionTest, UnknownFunction) {
    EXPECT_EQ(problem_for(GCC_UNDECLARED), "Unknown function or method");
    EXPECT_EQ(problem_for("error: use of undeclared identifier 'stoi'"), "Unknown function or method");
}

TEST(SuggestionTest, ParseMethodMistakenForExpressionMethod) {
    const auto diag = "error: 'class lob::Seq<std::__cxx11::basic_string<char> >' has no member named 'parse_csv'";
    auto suggestion = suggest_fix(diag, "_.parse_csv().count()");
    ASSERT_TRUE(suggestion.has_value());
    EXPECT_EQ(suggestion->problem, "parse_csv() is not a method");
    ASSERT_EQ(suggestion->fixes.size(), 1u);
    EXPECT_TRUE(suggestion->fixes.front().contains("--parse-csv"));
}

TEST(SuggestionTest, ParseJsonMapsToFlag) {
    const auto diag = "error: 'class lob::Seq<int>' has no member named 'parse_json'";
    auto suggestion = suggest_fix(diag, "_.parse_json()");
    ASSERT_TRUE(suggestion.has_value());
    EXPECT_TRUE(suggestion->fixes.front().contains("--parse-json"));
}

TEST(SuggestionTest, ClosureTypeMismatch) {
    const auto diag = "In lambda function:\n"
                      "error: inconsistent deduction for auto return type: 'int' and then 'double'";
    EXPECT_EQ(problem_for(diag), "Type mismatch in closure");
}

TEST(SuggestionTest, StringIndexedWithString) {
    const auto diag = "error: no match for 'operator[]' (operand types are "
                      "'std::__cxx11::basic_string<char>' and 'const char [4]')";
    EXPECT_EQ(problem_for(diag), "Cannot index string with string");
}

TEST(SuggestionTest, UnextractedOptional) {
    const auto diag = "error: no match for 'operator+' (operand types are 'std::optional<long long int>' and 'long')";
    auto suggestion = suggest_fix(diag, std::nullopt);
    ASSERT_TRUE(suggestion.has_value());
    EXPECT_EQ(suggestion->problem, "Operation returns std::optional - need to extract the value");
    EXPECT_EQ(suggestion->fixes.size(), 2u);
}

TEST(SuggestionTest, NotIterable) {
    EXPECT_EQ(problem_for("error: 'begin' was not declared in this scope"), "Value is not iterable");
    EXPECT_EQ(problem_for("error: invalid range expression of type 'unsigned long'; no viable 'begin' function"),
              "Value is not iterable");
}

TEST(SuggestionTest, FirstMatchingRuleWins) {
    // Both a comparison and an undeclared name: comparison is checked first.
    const auto diag = "error: no match for 'operator<' (operand types are 'std::string' and 'int')\n"
                      "error: 'foo' was not declared in this scope";
    EXPECT_EQ(problem_for(diag), "Cannot compare string with number");
}

TEST(SuggestionTest, UnrecognizedDiagnosticHasNoSuggestion) {
    EXPECT_FALSE(suggest_fix("error: expected ';' before '}' token", std::nullopt).has_value());
    EXPECT_FALSE(suggest_fix("", std::nullopt).has_value());
}

// ============================================================================
// Line categorization
// ============================================================================

TEST(CategorizeTest, GccDiagnostic) {
    const auto lines = categorize_diagnostic(GCC_UNDECLARED);
    ASSERT_EQ(lines.size(), 5u);

    EXPECT_EQ(lines[0].kind, LineKind::Location);
    EXPECT_EQ(lines[0].text, "3f2a: In function 'int main()':");
    EXPECT_EQ(lines[1].kind, LineKind::ErrorHeader);
    EXPECT_EQ(lines[1].text, "3f2a:5:32: error: 'foo' was not declared in this scope");
    EXPECT_EQ(lines[2].kind, LineKind::SourceLine);
    EXPECT_EQ(lines[2].text, "    5 |     auto result = input_data.map(foo);");
    EXPECT_EQ(lines[3].kind, LineKind::Annotation);
    EXPECT_EQ(lines[4].kind, LineKind::Summary);
}

TEST(CategorizeTest, NotesAndWarnings) {
    const auto lines = categorize_diagnostic("/a/b/x.cpp:1:1: warning: unused variable 'y'\n"
                                             "/a/b/x.cpp:2:1: note: candidate: 'f()'\n"
                                             "\n"
                                             "2 errors generated.");
    ASSERT_EQ(lines.size(), 4u);
    EXPECT_EQ(lines[0].kind, LineKind::WarningHeader);
    EXPECT_EQ(lines[0].text, "x.cpp:1:1: warning: unused variable 'y'");
    EXPECT_EQ(lines[1].kind, LineKind::Note);
    EXPECT_EQ(lines[2].kind, LineKind::Blank);
    EXPECT_EQ(lines[3].kind, LineKind::Summary);
}

TEST(CategorizeTest, OtherLinesKeptVerbatim) {
    const auto lines = categorize_diagnostic("something odd happened");
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0].kind, LineKind::Other);
    EXPECT_EQ(lines[0].text, "something odd happened");
}

TEST(SimplifyLocationTest, StripsDirectories) {
    EXPECT_EQ(simplify_location("/usr/include/lob/seq.hpp:12:5: error: x"), "seq.hpp:12:5: error: x");
    EXPECT_EQ(simplify_location("In file included from /usr/include/lob/prelude.hpp:3,"),
              "In file included from prelude.hpp:3,");
    EXPECT_EQ(simplify_location("                 from /src/x/main.cpp:1:"), "                 from main.cpp:1:");
}

TEST(SimplifyLocationTest, LeavesOtherTextAlone) {
    EXPECT_EQ(simplify_location("error: no path here"), "error: no path here");
    EXPECT_EQ(simplify_location("a note: with / slash and spaces: x"), "a note: with / slash and spaces: x");
    EXPECT_EQ(simplify_location(""), "");
}

// ============================================================================
// Formatted report
// ============================================================================

TEST(FormatCompilationErrorTest, PlainLayout) {
    const auto report = format_compilation_error(GCC_UNDECLARED, "_.map(foo)", false);

    EXPECT_TRUE(report.starts_with("✗ Compilation Error\n\n  Your expression: _.map(foo)\n\n"));
    EXPECT_TRUE(report.contains("  Problem: Unknown function or method\n  How to fix:\n    • "));
    EXPECT_TRUE(report.contains("  3f2a:5:32: error: 'foo' was not declared in this scope\n"));
    EXPECT_TRUE(report.contains("\n\n  compilation terminated due to -Wfatal-errors."));
    EXPECT_TRUE(report.ends_with("\nTip: Check your expression syntax and ensure all parentheses match"));
    EXPECT_FALSE(report.contains("\033["));
    EXPECT_FALSE(report.contains("/home/user"));
}

TEST(FormatCompilationErrorTest, ColorUsesAnsiEscapes) {
    const auto report = format_compilation_error(GCC_UNDECLARED, "_.map(foo)", true);
    EXPECT_TRUE(report.contains("\033[1;31m✗ Compilation Error\033[0m"));
}

TEST(FormatCompilationErrorTest, NoExpressionNoSuggestion) {
    const auto report = format_compilation_error("error: expected ';'", std::nullopt, false);
    EXPECT_FALSE(report.contains("Your expression:"));
    EXPECT_FALSE(report.contains("Problem:"));
    EXPECT_TRUE(report.contains("  error: expected ';'"));
}

TEST(FormatCompilationErrorTest, TotalOnEmptyInput) {
    const auto report = format_compilation_error("", std::nullopt, false);
    EXPECT_TRUE(report.starts_with("✗ Compilation Error"));
    EXPECT_TRUE(report.ends_with("Tip: Check your expression syntax and ensure all parentheses match"));
}
