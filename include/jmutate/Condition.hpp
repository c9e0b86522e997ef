/**
 * @file Condition.hpp
 * @brief Strictly-typed predicates evaluated against slot values
 *
 * A condition never coerces: comparing the string "5" with the number 0
 * is simply false. Evaluation never throws.
 */

#ifndef JMUTATE_CONDITION_HPP
#define JMUTATE_CONDITION_HPP

#include "jmutate/Value.hpp"

#include <memory>
#include <optional>
#include <regex>
#include <string>

namespace jmutate {

/**
 * @brief Closed set of condition operators
 */
enum class ConditionOp {
    Equal,
    NotEqual,
    Less,
    LessEqual,
    Greater,
    GreaterEqual,
    In,
    NotIn,
    Matches,
    Contains,
    StartsWith,
    EndsWith,
    IsNull,
    IsEmpty
};

/**
 * @brief Look up an operator by its rule-file name
 *
 * Accepts symbolic and word forms: "==" / "eq", "<" / "lt",
 * "matches" / "regex", "startswith" / "starts_with", ...
 *
 * @return The operator, or nullopt if the name is unknown
 */
std::optional<ConditionOp> parse_condition_op(const std::string& name);

/**
 * @brief Canonical name of an operator (used in diagnostics)
 */
std::string condition_op_name(ConditionOp op);

/**
 * @brief A compiled predicate
 *
 * Build with Condition::make(), which checks that the operand fits the
 * operator and compiles regular expressions up front. A Condition is
 * immutable afterwards and safe to evaluate from several threads.
 */
struct Condition {
    ConditionOp op = ConditionOp::Equal;
    Value operand;

    /// Category the inspected value must have; unset only for In/NotIn
    /// over an empty or mixed-type list.
    std::optional<Kind> expected;

    /// Compiled pattern for ConditionOp::Matches
    std::shared_ptr<const std::regex> pattern;

    /**
     * @brief Build and check a condition
     *
     * @param op Operator
     * @param operand Operand value (ignored shape rules for IsNull/IsEmpty
     *        when null, which means "true")
     * @param expected Explicit expected category; inferred from the
     *        operand when unset
     * @throws std::invalid_argument if the operand does not suit the
     *         operator, the explicit type contradicts the operand, or the
     *         regular expression does not compile
     */
    static Condition make(ConditionOp op, Value operand,
                          std::optional<Kind> expected = std::nullopt);
};

/**
 * @brief Evaluate a condition against a value
 *
 * @return true if the predicate holds; false on any category mismatch
 *
 * Examples:
 * ```cpp
 * auto gt0 = Condition::make(ConditionOp::Greater, 0);
 * evaluate(gt0, Value(5));     // true
 * evaluate(gt0, Value("5"));   // false, no coercion
 * ```
 */
bool evaluate(const Condition& condition, const Value& value);

} // namespace jmutate

#endif // JMUTATE_CONDITION_HPP
