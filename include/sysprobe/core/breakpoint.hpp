/**
 * @file breakpoint.hpp
 * @brief Syscall breakpoints and their condition expressions
 *
 * A breakpoint names a syscall and optionally carries a condition. The
 * condition language is a conjunction of field comparisons:
 *
 * ```
 * condition  := comparison ( "&&" comparison )*
 * comparison := field op literal
 * field      := name | result | duration_ns | error | pid | tid | argc | arg<N>
 * op         := "==" | "!=" | "<" | "<=" | ">" | ">=" | "contains"
 * literal    := integer | "quoted string" | bare-word
 * ```
 *
 * Examples:
 * ```
 * arg0 contains "/etc/"
 * result < 0 && error == ENOENT
 * duration_ns > 1000000
 * ```
 *
 * @date 2025
 */

#pragma once

#include "sysprobe/monitors/capture_source.hpp"

#include <string>
#include <vector>
#include <optional>
#include <cstdint>

namespace sysprobe {
namespace core {

/**
 * @enum ComparisonOp
 * @brief Comparison operator of one condition clause
 */
enum class ComparisonOp {
    EQUAL,
    NOT_EQUAL,
    LESS,
    LESS_EQUAL,
    GREATER,
    GREATER_EQUAL,
    CONTAINS
};

std::string ComparisonOpToString(ComparisonOp op);

/**
 * @struct Comparison
 * @brief One `field op literal` clause
 */
struct Comparison {
    std::string field;
    ComparisonOp op{ComparisonOp::EQUAL};
    std::string literal;                 ///< Literal text (unquoted)
    bool quoted{false};                  ///< Literal was written as a quoted string
    std::optional<long> numeric_literal; ///< Set for unquoted integer literals
};

/**
 * @class BreakpointCondition
 * @brief Parsed condition predicate over SyscallEvent fields
 *
 * Numeric operators applied to a field that has no numeric value evaluate to
 * false. A missing `error` compares as the empty string. `argN` beyond the
 * argument list makes its clause false.
 */
class BreakpointCondition {
public:
    /**
     * @brief Parse a condition expression
     * @param expression Condition text
     * @return Parsed condition
     *
     * @throws InvalidArgumentError on empty input, unknown fields, missing
     *         operators or literals
     */
    static BreakpointCondition Parse(const std::string& expression);

    /**
     * @brief Evaluate the condition against an event
     * @return true if every clause holds
     */
    bool Evaluate(const monitors::SyscallEvent& event) const;

    /// Expression text as given to Parse()
    const std::string& ToString() const { return expression_; }

    const std::vector<Comparison>& Clauses() const { return clauses_; }

private:
    std::vector<Comparison> clauses_;
    std::string expression_;

    static Comparison ParseClause(const std::string& clause);
    static bool EvaluateClause(const Comparison& clause, const monitors::SyscallEvent& event);
};

/**
 * @struct Breakpoint
 * @brief Rule that stops a trace session when a matching syscall occurs
 */
struct Breakpoint {
    uint64_t id{0};                                ///< Assigned by the session manager
    std::string syscall_name;                      ///< Syscall to match exactly
    std::optional<BreakpointCondition> condition;  ///< Absent = match on name only
    uint64_t hit_count{0};                         ///< Times this breakpoint fired

    /**
     * @brief Check whether an event triggers this breakpoint
     */
    bool Matches(const monitors::SyscallEvent& event) const;

    /**
     * @brief Build a breakpoint from "NAME" or "NAME:CONDITION"
     * @throws InvalidArgumentError if the name is empty or the condition malformed
     */
    static Breakpoint FromSpec(const std::string& spec);
};

} // namespace core
} // namespace sysprobe
