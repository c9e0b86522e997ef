/**
 * @file Action.hpp
 * @brief Value operations applied to matched slots
 *
 * Every operation is typed: applied to a value it cannot handle it
 * produces no result (a no-op) instead of failing. A sequence feeds each
 * step's output into the next step and carries the unchanged value past
 * steps that no-op.
 *
 * Operators:
 * - replace(value), default/coalesce(value)
 * - cast(to)
 * - trim, uppercase, lowercase
 * - add/sub/mul/div(by)
 * - round(digits)            half away from zero
 * - formatDate(from, to)     strptime/strftime patterns
 * - offsetDate(amount, unit) ISO-8601 dates and date-times
 * - convertUnit(from, to)    see Units.hpp
 * - map(mappings, null_values)
 * - sequence(steps)
 */

#ifndef JMUTATE_ACTION_HPP
#define JMUTATE_ACTION_HPP

#include "jmutate/DateTime.hpp"
#include "jmutate/PathExpr.hpp"
#include "jmutate/Value.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace jmutate {

/**
 * @brief Closed set of action operators
 */
enum class ActionOp {
    Replace,
    Default,
    Cast,
    Trim,
    Uppercase,
    Lowercase,
    Add,
    Sub,
    Mul,
    Div,
    Round,
    FormatDate,
    OffsetDate,
    ConvertUnit,
    Map,
    Sequence
};

/**
 * @brief Look up an operator by its rule-file name
 *
 * "coalesce" is an alias of "default"; "formatDate"/"format_date" and
 * "offsetDate"/"offset_date" and "convertUnit"/"convert_unit" are
 * equivalent spellings.
 */
std::optional<ActionOp> parse_action_op(const std::string& name);

/**
 * @brief Canonical name of an operator
 */
std::string action_op_name(ActionOp op);

/**
 * @brief Target of a cast
 */
enum class CastTarget {
    String,
    Number,
    Integer,
    Float,
    Boolean
};

std::optional<CastTarget> parse_cast_target(const std::string& name);

/**
 * @brief One single-operator step with its parameters
 *
 * Only the fields used by @ref op are meaningful.
 */
struct ActionStep {
    ActionOp op = ActionOp::Replace;

    Value value;                          ///< replace, default
    CastTarget cast_to = CastTarget::String;
    Value by;                             ///< add, sub, mul, div
    int digits = 0;                       ///< round
    std::string from;                     ///< formatDate pattern, convertUnit unit
    std::string to;                       ///< formatDate pattern, convertUnit unit
    std::int64_t amount = 0;              ///< offsetDate
    DateUnit unit = DateUnit::Days;       ///< offsetDate
    Value mappings = Value::object();     ///< map
    std::vector<std::string> null_values; ///< map
};

/**
 * @brief Run one step against a value
 * @return The new value, or nullopt when the step does not apply
 */
std::optional<Value> execute_step(const ActionStep& step, const Value& current);

/**
 * @brief A single step or an ordered sequence of steps
 *
 * Immutable once built; shared by every transformation using its rule.
 */
class Action {
public:
    Action() = default;

    static Action single(ActionStep step);
    static Action sequence(std::vector<ActionStep> steps);

    bool is_sequence() const noexcept { return sequence_; }
    const std::vector<ActionStep>& steps() const noexcept { return steps_; }

    /**
     * @brief Compute the action's result for a value
     * @return The final value, or nullopt if every step was a no-op
     */
    std::optional<Value> execute(const Value& current) const;

    /**
     * @brief Execute against a slot and store the result
     * @return true if the slot was written
     */
    bool apply(const Slot& slot) const;

private:
    std::vector<ActionStep> steps_;
    bool sequence_ = false;
};

/**
 * @brief Free-function form of Action::execute() on a slot's value
 */
std::optional<Value> execute(const Action& action, const Slot& slot);

} // namespace jmutate

#endif // JMUTATE_ACTION_HPP
