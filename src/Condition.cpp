/**
 * @file Condition.cpp
 * @brief Implementation of the condition evaluator
 */

#include "jmutate/Condition.hpp"

#include <algorithm>
#include <stdexcept>

namespace jmutate {

namespace {

bool is_ordering(ConditionOp op) {
    return op == ConditionOp::Less || op == ConditionOp::LessEqual ||
           op == ConditionOp::Greater || op == ConditionOp::GreaterEqual;
}

bool is_text(ConditionOp op) {
    return op == ConditionOp::Matches || op == ConditionOp::Contains ||
           op == ConditionOp::StartsWith || op == ConditionOp::EndsWith;
}

/**
 * @brief Common element category of a list, if all elements share one
 */
std::optional<Kind> element_kind(const Value& list) {
    if (list.empty()) return std::nullopt;
    Kind first = kind_of(list.front());
    for (const auto& elem : list) {
        if (kind_of(elem) != first) return std::nullopt;
    }
    return first;
}

bool list_contains(const Value& list, const Value& value) {
    return std::any_of(list.begin(), list.end(),
                       [&](const Value& elem) { return strict_equal(elem, value); });
}

bool compare_ordered(ConditionOp op, const Value& lhs, const Value& rhs) {
    switch (op) {
        case ConditionOp::Less: return lhs < rhs;
        case ConditionOp::LessEqual: return lhs <= rhs;
        case ConditionOp::Greater: return lhs > rhs;
        case ConditionOp::GreaterEqual: return lhs >= rhs;
        default: return false;
    }
}

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // anonymous namespace

std::optional<ConditionOp> parse_condition_op(const std::string& name) {
    if (name == "==" || name == "eq") return ConditionOp::Equal;
    if (name == "!=" || name == "ne") return ConditionOp::NotEqual;
    if (name == "<" || name == "lt") return ConditionOp::Less;
    if (name == "<=" || name == "le") return ConditionOp::LessEqual;
    if (name == ">" || name == "gt") return ConditionOp::Greater;
    if (name == ">=" || name == "ge") return ConditionOp::GreaterEqual;
    if (name == "in") return ConditionOp::In;
    if (name == "not_in") return ConditionOp::NotIn;
    if (name == "matches" || name == "regex") return ConditionOp::Matches;
    if (name == "contains") return ConditionOp::Contains;
    if (name == "startswith" || name == "starts_with") return ConditionOp::StartsWith;
    if (name == "endswith" || name == "ends_with") return ConditionOp::EndsWith;
    if (name == "isnull" || name == "is_null") return ConditionOp::IsNull;
    if (name == "isempty" || name == "is_empty") return ConditionOp::IsEmpty;
    return std::nullopt;
}

std::string condition_op_name(ConditionOp op) {
    switch (op) {
        case ConditionOp::Equal: return "==";
        case ConditionOp::NotEqual: return "!=";
        case ConditionOp::Less: return "<";
        case ConditionOp::LessEqual: return "<=";
        case ConditionOp::Greater: return ">";
        case ConditionOp::GreaterEqual: return ">=";
        case ConditionOp::In: return "in";
        case ConditionOp::NotIn: return "not_in";
        case ConditionOp::Matches: return "matches";
        case ConditionOp::Contains: return "contains";
        case ConditionOp::StartsWith: return "startswith";
        case ConditionOp::EndsWith: return "endswith";
        case ConditionOp::IsNull: return "isnull";
        case ConditionOp::IsEmpty: return "isempty";
    }
    return "unknown";
}

Condition Condition::make(ConditionOp op, Value operand, std::optional<Kind> expected) {
    Condition cond;
    cond.op = op;
    const std::string name = condition_op_name(op);

    if (op == ConditionOp::IsNull || op == ConditionOp::IsEmpty) {
        if (operand.is_null()) operand = true;
        if (!operand.is_boolean()) {
            throw std::invalid_argument("'" + name + "' expects a boolean value");
        }
        cond.operand = std::move(operand);
        return cond;
    }

    if (op == ConditionOp::In || op == ConditionOp::NotIn) {
        if (!operand.is_array()) {
            throw std::invalid_argument("'" + name + "' expects an array value");
        }
        auto inferred = element_kind(operand);
        if (expected && inferred && *expected != *inferred) {
            throw std::invalid_argument("type '" + kind_name(*expected) +
                                        "' contradicts list of " + kind_name(*inferred));
        }
        cond.expected = expected ? expected : inferred;
        cond.operand = std::move(operand);
        return cond;
    }

    Kind actual = kind_of(operand);
    if (expected && *expected != actual) {
        throw std::invalid_argument("type '" + kind_name(*expected) +
                                    "' contradicts value of type " + kind_name(actual));
    }
    if (is_ordering(op) && actual != Kind::Number && actual != Kind::String) {
        throw std::invalid_argument("'" + name + "' expects a number or string value");
    }
    if (is_text(op) && actual != Kind::String) {
        throw std::invalid_argument("'" + name + "' expects a string value");
    }
    if (op == ConditionOp::Matches) {
        try {
            cond.pattern = std::make_shared<const std::regex>(
                operand.get<std::string>(), std::regex::ECMAScript);
        } catch (const std::regex_error& e) {
            throw std::invalid_argument(std::string("invalid regular expression: ") + e.what());
        }
    }
    cond.expected = actual;
    cond.operand = std::move(operand);
    return cond;
}

bool evaluate(const Condition& condition, const Value& value) {
    const Value& operand = condition.operand;

    switch (condition.op) {
        case ConditionOp::IsNull:
            return value.is_null() == operand.get<bool>();

        case ConditionOp::IsEmpty:
            if (value.is_string()) {
                return value.get_ref<const std::string&>().empty() == operand.get<bool>();
            }
            if (is_container(value)) {
                return value.empty() == operand.get<bool>();
            }
            return false;

        case ConditionOp::In:
        case ConditionOp::NotIn: {
            if (condition.expected && kind_of(value) != *condition.expected) return false;
            if (!condition.expected && is_container(value)) return false;
            bool found = list_contains(operand, value);
            return condition.op == ConditionOp::In ? found : !found;
        }

        default:
            break;
    }

    // Remaining operators are strictly typed against the operand's category
    if (!condition.expected || kind_of(value) != *condition.expected) {
        return false;
    }

    switch (condition.op) {
        case ConditionOp::Equal:
            return strict_equal(value, operand);
        case ConditionOp::NotEqual:
            return !strict_equal(value, operand);
        case ConditionOp::Less:
        case ConditionOp::LessEqual:
        case ConditionOp::Greater:
        case ConditionOp::GreaterEqual:
            return compare_ordered(condition.op, value, operand);
        case ConditionOp::Matches:
            return condition.pattern &&
                   std::regex_search(value.get_ref<const std::string&>(), *condition.pattern);
        case ConditionOp::Contains:
            return value.get_ref<const std::string&>().find(
                       operand.get_ref<const std::string&>()) != std::string::npos;
        case ConditionOp::StartsWith:
            return value.get_ref<const std::string&>().rfind(
                       operand.get_ref<const std::string&>(), 0) == 0;
        case ConditionOp::EndsWith:
            return ends_with(value.get_ref<const std::string&>(),
                             operand.get_ref<const std::string&>());
        default:
            return false;
    }
}

} // namespace jmutate
