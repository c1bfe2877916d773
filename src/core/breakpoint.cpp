/**
 * @file breakpoint.cpp
 * @brief Implementation of breakpoint condition parsing and evaluation
 *
 * @date 2025
 */

#include "sysprobe/core/breakpoint.hpp"
#include "sysprobe/core/errors.hpp"
#include "sysprobe/utils/string_utils.hpp"

#include <cctype>

namespace sysprobe {
namespace core {

using utils::StringUtils;
using monitors::SyscallEvent;

namespace {

struct FieldValue {
    std::string text;
    std::optional<long> number;
};

FieldValue NumericField(long value) {
    return FieldValue{std::to_string(value), value};
}

bool IsArgumentField(const std::string& field) {
    if (field.size() < 4 || !StringUtils::StartsWith(field, "arg") || field == "argc") {
        return false;
    }
    for (size_t i = 3; i < field.size(); ++i) {
        if (!std::isdigit(static_cast<unsigned char>(field[i]))) {
            return false;
        }
    }
    return field.size() <= 6;  // arg0 .. arg999
}

bool IsKnownField(const std::string& field) {
    static const std::vector<std::string> fields = {
        "name", "result", "duration_ns", "error", "pid", "tid", "argc"
    };
    for (const auto& known : fields) {
        if (field == known) {
            return true;
        }
    }
    return IsArgumentField(field);
}

std::optional<FieldValue> ReadField(const std::string& field, const SyscallEvent& event) {
    if (field == "name") {
        return FieldValue{event.name, std::nullopt};
    }
    if (field == "error") {
        return FieldValue{event.error.value_or(""), std::nullopt};
    }
    if (field == "result") {
        return NumericField(event.result);
    }
    if (field == "duration_ns") {
        return NumericField(static_cast<long>(event.duration_ns));
    }
    if (field == "pid") {
        return NumericField(event.pid);
    }
    if (field == "tid") {
        return NumericField(event.tid);
    }
    if (field == "argc") {
        return NumericField(static_cast<long>(event.parameters.size()));
    }

    // argN
    size_t index = std::stoul(field.substr(3));
    if (index >= event.parameters.size()) {
        return std::nullopt;
    }

    const auto& arg = event.parameters[index];
    if (auto value = std::get_if<long>(&arg)) {
        return NumericField(*value);
    }
    if (auto text = std::get_if<std::string>(&arg)) {
        return FieldValue{*text, std::nullopt};
    }
    return FieldValue{monitors::FormatArgument(arg), std::nullopt};
}

// Split on "&&" outside quoted literals
std::vector<std::string> SplitConjunction(const std::string& expression) {
    std::vector<std::string> parts;
    std::string current;
    bool in_quotes = false;
    bool escaped = false;

    for (size_t i = 0; i < expression.size(); ++i) {
        char c = expression[i];
        if (in_quotes) {
            current += c;
            if (escaped) {
                escaped = false;
            } else if (c == '\\') {
                escaped = true;
            } else if (c == '"') {
                in_quotes = false;
            }
            continue;
        }

        if (c == '"') {
            in_quotes = true;
        } else if (c == '&' && i + 1 < expression.size() && expression[i + 1] == '&') {
            parts.push_back(StringUtils::Trim(current));
            current.clear();
            ++i;
            continue;
        }
        current += c;
    }

    if (in_quotes) {
        throw InvalidArgumentError("Unterminated string literal in condition: " + expression);
    }

    parts.push_back(StringUtils::Trim(current));
    return parts;
}

} // anonymous namespace

std::string ComparisonOpToString(ComparisonOp op) {
    switch (op) {
        case ComparisonOp::EQUAL:         return "==";
        case ComparisonOp::NOT_EQUAL:     return "!=";
        case ComparisonOp::LESS:          return "<";
        case ComparisonOp::LESS_EQUAL:    return "<=";
        case ComparisonOp::GREATER:       return ">";
        case ComparisonOp::GREATER_EQUAL: return ">=";
        case ComparisonOp::CONTAINS:      return "contains";
        default:                          return "?";
    }
}

/****************************************************************************
 * BreakpointCondition
 ****************************************************************************/

BreakpointCondition BreakpointCondition::Parse(const std::string& expression) {
    std::string trimmed = StringUtils::Trim(expression);
    if (trimmed.empty()) {
        throw InvalidArgumentError("Breakpoint condition is empty");
    }

    BreakpointCondition condition;
    condition.expression_ = trimmed;

    for (const auto& part : SplitConjunction(trimmed)) {
        if (part.empty()) {
            throw InvalidArgumentError("Empty clause in condition: " + trimmed);
        }
        condition.clauses_.push_back(ParseClause(part));
    }

    return condition;
}

Comparison BreakpointCondition::ParseClause(const std::string& clause) {
    Comparison comparison;

    // Field name
    size_t pos = 0;
    while (pos < clause.size() &&
           (std::isalnum(static_cast<unsigned char>(clause[pos])) || clause[pos] == '_')) {
        pos++;
    }
    comparison.field = clause.substr(0, pos);

    if (comparison.field.empty()) {
        throw InvalidArgumentError("Expected field name in clause: " + clause);
    }
    if (!IsKnownField(comparison.field)) {
        throw InvalidArgumentError("Unknown field '" + comparison.field + "' in clause: " + clause);
    }

    while (pos < clause.size() && std::isspace(static_cast<unsigned char>(clause[pos]))) {
        pos++;
    }

    // Operator, two-character forms first
    std::string rest = clause.substr(pos);
    static const std::vector<std::pair<std::string, ComparisonOp>> operators = {
        {"==", ComparisonOp::EQUAL},
        {"!=", ComparisonOp::NOT_EQUAL},
        {"<=", ComparisonOp::LESS_EQUAL},
        {">=", ComparisonOp::GREATER_EQUAL},
        {"<", ComparisonOp::LESS},
        {">", ComparisonOp::GREATER},
    };

    bool found = false;
    for (const auto& [token, op] : operators) {
        if (StringUtils::StartsWith(rest, token)) {
            comparison.op = op;
            rest = rest.substr(token.size());
            found = true;
            break;
        }
    }

    if (!found && StringUtils::StartsWith(rest, "contains") &&
        (rest.size() == 8 || std::isspace(static_cast<unsigned char>(rest[8])) || rest[8] == '"')) {
        comparison.op = ComparisonOp::CONTAINS;
        rest = rest.substr(8);
        found = true;
    }

    if (!found) {
        throw InvalidArgumentError("Expected comparison operator in clause: " + clause);
    }

    // Literal
    std::string literal = StringUtils::Trim(rest);
    if (literal.empty()) {
        throw InvalidArgumentError("Missing literal in clause: " + clause);
    }

    if (literal.front() == '"') {
        auto text = StringUtils::Unquote(literal);
        if (!text) {
            throw InvalidArgumentError("Malformed string literal in clause: " + clause);
        }
        comparison.literal = *text;
        comparison.quoted = true;
    } else {
        if (literal.find_first_of(" \t") != std::string::npos) {
            throw InvalidArgumentError("Unexpected text after literal in clause: " + clause);
        }
        comparison.literal = literal;
        comparison.numeric_literal = StringUtils::ParseInteger(literal);
    }

    return comparison;
}

bool BreakpointCondition::Evaluate(const SyscallEvent& event) const {
    for (const auto& clause : clauses_) {
        if (!EvaluateClause(clause, event)) {
            return false;
        }
    }
    return true;
}

bool BreakpointCondition::EvaluateClause(const Comparison& clause, const SyscallEvent& event) {
    auto value = ReadField(clause.field, event);
    if (!value) {
        return false;
    }

    bool numeric = value->number.has_value() && clause.numeric_literal.has_value();

    switch (clause.op) {
        case ComparisonOp::EQUAL:
            return numeric ? *value->number == *clause.numeric_literal
                           : value->text == clause.literal;
        case ComparisonOp::NOT_EQUAL:
            return numeric ? *value->number != *clause.numeric_literal
                           : value->text != clause.literal;
        case ComparisonOp::CONTAINS:
            return StringUtils::Contains(value->text, clause.literal);
        case ComparisonOp::LESS:
            return numeric && *value->number < *clause.numeric_literal;
        case ComparisonOp::LESS_EQUAL:
            return numeric && *value->number <= *clause.numeric_literal;
        case ComparisonOp::GREATER:
            return numeric && *value->number > *clause.numeric_literal;
        case ComparisonOp::GREATER_EQUAL:
            return numeric && *value->number >= *clause.numeric_literal;
    }
    return false;
}

/****************************************************************************
 * Breakpoint
 ****************************************************************************/

bool Breakpoint::Matches(const SyscallEvent& event) const {
    if (event.name != syscall_name) {
        return false;
    }
    return !condition || condition->Evaluate(event);
}

Breakpoint Breakpoint::FromSpec(const std::string& spec) {
    Breakpoint breakpoint;

    auto colon = spec.find(':');
    breakpoint.syscall_name = StringUtils::Trim(spec.substr(0, colon));
    if (breakpoint.syscall_name.empty()) {
        throw InvalidArgumentError("Breakpoint needs a syscall name: " + spec);
    }

    if (colon != std::string::npos) {
        breakpoint.condition = BreakpointCondition::Parse(spec.substr(colon + 1));
    }

    return breakpoint;
}

} // namespace core
} // namespace sysprobe
