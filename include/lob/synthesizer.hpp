#pragma once

#include "lob/formats.hpp"

#include <string>
#include <string_view>

namespace lob {

/**
 * @brief Renders a complete C++ program around a user expression.
 *
 * Output is a pure function of (expression, input format and source kind,
 * output format): identical inputs produce byte-identical text, which is what
 * makes the text usable as a cache key. File paths are never embedded; the
 * program receives them as positional arguments.
 *
 * Synthesis never fails. Whether the expression is valid C++ is for the
 * compiler to decide.
 */
std::string synthesize(std::string_view expression, const InputSource &input, OutputFormat output);

/**
 * @brief True when the expression already reduces to a single value.
 *
 * Heuristic: a substring scan for a fixed set of terminal operation calls
 * (count, sum, reduce, fold, first, last, min, max, any, all, collect,
 * to_list). A closure body that merely calls one of them is misclassified.
 */
bool is_terminal_expression(std::string_view expression);

/**
 * @brief The acquisition call for an input format and source kind, e.g. "lob::input_csv()".
 */
std::string_view acquisition_call(InputFormat format, bool from_files);

/**
 * @brief Rewrites `|x| body` closure shorthand into generic lambdas.
 *
 * Only shorthand in argument position (right after '(' or ',') is rewritten.
 * Anything that does not form a complete shorthand is copied verbatim.
 */
std::string expand_closures(std::string_view expression);

} // namespace lob
