/**
 * @file Action.cpp
 * @brief Implementation of the action executor
 */

#include "jmutate/Action.hpp"
#include "jmutate/Units.hpp"
#include "jmutate/Util.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <limits>

namespace jmutate {

namespace {

// Largest magnitude for which every integer has an exact double
constexpr double kMaxExactDouble = 9007199254740992.0;

// Products below this magnitude cannot overflow int64
constexpr double kSafeProduct = 9.0e18;

bool is_numeric(const Value& v) {
    return v.is_number();
}

/**
 * @brief Read a number as int64 if it is an integer that fits
 */
std::optional<std::int64_t> as_int64(const Value& v) {
    if (v.is_number_unsigned()) {
        auto u = v.get<std::uint64_t>();
        if (u > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
            return std::nullopt;
        }
        return static_cast<std::int64_t>(u);
    }
    if (v.is_number_integer()) {
        return v.get<std::int64_t>();
    }
    return std::nullopt;
}

std::optional<Value> finite(double result) {
    if (!std::isfinite(result)) return std::nullopt;
    return Value(result);
}

/**
 * @brief Integer arithmetic that stays integral when exact and in range
 */
std::optional<Value> integer_arithmetic(ActionOp op, std::int64_t a, std::int64_t b) {
    constexpr auto kMax = std::numeric_limits<std::int64_t>::max();
    constexpr auto kMin = std::numeric_limits<std::int64_t>::min();

    switch (op) {
        case ActionOp::Add:
            if ((b > 0 && a > kMax - b) || (b < 0 && a < kMin - b)) break;
            return Value(a + b);
        case ActionOp::Sub:
            if ((b < 0 && a > kMax + b) || (b > 0 && a < kMin + b)) break;
            return Value(a - b);
        case ActionOp::Mul:
            if (std::fabs(static_cast<double>(a) * static_cast<double>(b)) >= kSafeProduct) break;
            return Value(a * b);
        case ActionOp::Div:
            if (b == 0) return std::nullopt;
            if (a == kMin && b == -1) break;
            if (a % b == 0) return Value(a / b);
            break;
        default:
            return std::nullopt;
    }

    // Not representable as an exact int64: fall back to floating point
    double x = static_cast<double>(a);
    double y = static_cast<double>(b);
    switch (op) {
        case ActionOp::Add: return finite(x + y);
        case ActionOp::Sub: return finite(x - y);
        case ActionOp::Mul: return finite(x * y);
        case ActionOp::Div: return finite(x / y);
        default: return std::nullopt;
    }
}

std::optional<Value> arithmetic(ActionOp op, const Value& current, const Value& by) {
    if (!is_numeric(current) || !is_numeric(by)) return std::nullopt;

    auto a = as_int64(current);
    auto b = as_int64(by);
    if (a && b) {
        return integer_arithmetic(op, *a, *b);
    }

    double x = current.get<double>();
    double y = by.get<double>();
    switch (op) {
        case ActionOp::Add: return finite(x + y);
        case ActionOp::Sub: return finite(x - y);
        case ActionOp::Mul: return finite(x * y);
        case ActionOp::Div:
            if (y == 0.0) return std::nullopt;
            return finite(x / y);
        default: return std::nullopt;
    }
}

/**
 * @brief Round half away from zero at a decimal position
 *
 * A scaled value within a few ulps of .5 counts as a tie, so 2.675
 * (stored as 2.67499999...) rounds to 2.68 as written.
 */
double round_half_away(double v, int digits) {
    // Negative positions divide by an exact power of ten
    double scale = std::pow(10.0, std::abs(digits));
    double scaled = digits >= 0 ? v * scale : v / scale;
    double whole = std::trunc(scaled);
    double frac = std::fabs(scaled - whole);
    double tolerance = 1e-9 * std::max(1.0, std::fabs(scaled));

    double rounded;
    if (std::fabs(frac - 0.5) <= tolerance) {
        rounded = whole + (scaled >= 0 ? 1.0 : -1.0);
    } else {
        rounded = std::round(scaled);
    }
    return digits >= 0 ? rounded / scale : rounded * scale;
}

std::optional<Value> round_value(const Value& current, int digits) {
    if (!is_numeric(current)) return std::nullopt;

    if (auto i = as_int64(current)) {
        if (digits >= 0) return std::nullopt;
        double rounded = round_half_away(static_cast<double>(*i), digits);
        if (std::fabs(rounded) >= kSafeProduct) return std::nullopt;
        return Value(static_cast<std::int64_t>(rounded));
    }
    if (current.is_number_unsigned()) return std::nullopt;
    return finite(round_half_away(current.get<double>(), digits));
}

/**
 * @brief Parse a string holding exactly one JSON number
 */
std::optional<Value> parse_number(const std::string& text) {
    std::string trimmed = trim(text);
    if (trimmed.empty()) return std::nullopt;
    try {
        Value parsed = Value::parse(trimmed);
        if (parsed.is_number()) return parsed;
    } catch (const Value::exception&) {
        // not a number literal
    }
    return std::nullopt;
}

std::optional<Value> to_integer(const Value& number) {
    if (number.is_number_integer()) return number;
    double d = number.get<double>();
    if (!std::isfinite(d) || std::trunc(d) != d || std::fabs(d) >= kSafeProduct) {
        return std::nullopt;
    }
    return Value(static_cast<std::int64_t>(d));
}

std::optional<Value> to_float(const Value& number) {
    if (number.is_number_float()) return number;
    if (auto i = as_int64(number)) {
        if (std::fabs(static_cast<double>(*i)) > kMaxExactDouble) return std::nullopt;
        return Value(static_cast<double>(*i));
    }
    return std::nullopt;
}

std::optional<Value> cast_value(const Value& current, CastTarget target) {
    switch (target) {
        case CastTarget::String:
            if (current.is_number()) return Value(current.dump());
            if (current.is_boolean()) return Value(current.get<bool>() ? "true" : "false");
            return std::nullopt;

        case CastTarget::Number:
            if (current.is_string()) return parse_number(current.get<std::string>());
            return std::nullopt;

        case CastTarget::Integer:
            if (current.is_string()) {
                auto number = parse_number(current.get<std::string>());
                if (!number) return std::nullopt;
                return to_integer(*number);
            }
            if (current.is_number_float()) return to_integer(current);
            return std::nullopt;

        case CastTarget::Float:
            if (current.is_string()) {
                auto number = parse_number(current.get<std::string>());
                if (!number) return std::nullopt;
                return to_float(*number);
            }
            if (current.is_number_integer()) return to_float(current);
            return std::nullopt;

        case CastTarget::Boolean:
            if (current.is_string()) {
                std::string text = to_lower(trim(current.get<std::string>()));
                if (text == "true") return Value(true);
                if (text == "false") return Value(false);
            }
            return std::nullopt;
    }
    return std::nullopt;
}

std::optional<Value> convert_unit(const Value& current, const std::string& from,
                                  const std::string& to) {
    if (!is_numeric(current)) return std::nullopt;
    auto factor = conversion_factor(from, to);
    if (!factor) return std::nullopt;

    if (auto i = as_int64(current)) {
        if (*factor >= 1.0 && std::trunc(*factor) == *factor) {
            double product = static_cast<double>(*i) * *factor;
            if (std::fabs(product) < kSafeProduct) {
                return Value(*i * static_cast<std::int64_t>(*factor));
            }
        }
    }
    return finite(current.get<double>() * *factor);
}

std::optional<Value> map_value(const ActionStep& step, const Value& current) {
    if (!current.is_string()) return std::nullopt;
    std::string key = trim(current.get<std::string>());
    if (key.empty()) return Value(nullptr);

    if (std::find(step.null_values.begin(), step.null_values.end(), key) !=
        step.null_values.end()) {
        return Value(nullptr);
    }
    auto it = step.mappings.find(key);
    if (it != step.mappings.end()) {
        return *it;
    }
    // Unmapped values pass through trimmed
    return Value(key);
}

} // anonymous namespace

std::optional<ActionOp> parse_action_op(const std::string& name) {
    if (name == "replace") return ActionOp::Replace;
    if (name == "default" || name == "coalesce") return ActionOp::Default;
    if (name == "cast") return ActionOp::Cast;
    if (name == "trim") return ActionOp::Trim;
    if (name == "uppercase") return ActionOp::Uppercase;
    if (name == "lowercase") return ActionOp::Lowercase;
    if (name == "add") return ActionOp::Add;
    if (name == "sub") return ActionOp::Sub;
    if (name == "mul") return ActionOp::Mul;
    if (name == "div") return ActionOp::Div;
    if (name == "round") return ActionOp::Round;
    if (name == "formatDate" || name == "format_date") return ActionOp::FormatDate;
    if (name == "offsetDate" || name == "offset_date") return ActionOp::OffsetDate;
    if (name == "convertUnit" || name == "convert_unit") return ActionOp::ConvertUnit;
    if (name == "map") return ActionOp::Map;
    if (name == "sequence") return ActionOp::Sequence;
    return std::nullopt;
}

std::string action_op_name(ActionOp op) {
    switch (op) {
        case ActionOp::Replace: return "replace";
        case ActionOp::Default: return "default";
        case ActionOp::Cast: return "cast";
        case ActionOp::Trim: return "trim";
        case ActionOp::Uppercase: return "uppercase";
        case ActionOp::Lowercase: return "lowercase";
        case ActionOp::Add: return "add";
        case ActionOp::Sub: return "sub";
        case ActionOp::Mul: return "mul";
        case ActionOp::Div: return "div";
        case ActionOp::Round: return "round";
        case ActionOp::FormatDate: return "formatDate";
        case ActionOp::OffsetDate: return "offsetDate";
        case ActionOp::ConvertUnit: return "convertUnit";
        case ActionOp::Map: return "map";
        case ActionOp::Sequence: return "sequence";
    }
    return "unknown";
}

std::optional<CastTarget> parse_cast_target(const std::string& name) {
    if (name == "string") return CastTarget::String;
    if (name == "number") return CastTarget::Number;
    if (name == "integer" || name == "int") return CastTarget::Integer;
    if (name == "float" || name == "double") return CastTarget::Float;
    if (name == "boolean" || name == "bool") return CastTarget::Boolean;
    return std::nullopt;
}

std::optional<Value> execute_step(const ActionStep& step, const Value& current) {
    switch (step.op) {
        case ActionOp::Replace:
            return step.value;

        case ActionOp::Default:
            if (current.is_null()) return step.value;
            return std::nullopt;

        case ActionOp::Cast:
            return cast_value(current, step.cast_to);

        case ActionOp::Trim:
            if (!current.is_string()) return std::nullopt;
            return Value(trim(current.get<std::string>()));

        case ActionOp::Uppercase:
            if (!current.is_string()) return std::nullopt;
            return Value(to_upper(current.get<std::string>()));

        case ActionOp::Lowercase:
            if (!current.is_string()) return std::nullopt;
            return Value(to_lower(current.get<std::string>()));

        case ActionOp::Add:
        case ActionOp::Sub:
        case ActionOp::Mul:
        case ActionOp::Div:
            return arithmetic(step.op, current, step.by);

        case ActionOp::Round:
            return round_value(current, step.digits);

        case ActionOp::FormatDate: {
            if (!current.is_string()) return std::nullopt;
            auto parsed = parse_datetime(current.get<std::string>(), step.from);
            if (!parsed) return std::nullopt;
            return Value(format_datetime(*parsed, step.to));
        }

        case ActionOp::OffsetDate: {
            if (!current.is_string()) return std::nullopt;
            auto parsed = parse_iso_datetime(current.get<std::string>());
            if (!parsed) return std::nullopt;
            auto shifted = offset_datetime(parsed->value, step.amount, step.unit);
            if (!shifted) return std::nullopt;
            return Value(format_datetime(*shifted, parsed->pattern));
        }

        case ActionOp::ConvertUnit:
            return convert_unit(current, step.from, step.to);

        case ActionOp::Map:
            return map_value(step, current);

        case ActionOp::Sequence:
            // Nested sequences are flattened at load time
            return std::nullopt;
    }
    return std::nullopt;
}

// ============================================================================
// Action
// ============================================================================

Action Action::single(ActionStep step) {
    Action action;
    action.steps_.push_back(std::move(step));
    action.sequence_ = false;
    return action;
}

Action Action::sequence(std::vector<ActionStep> steps) {
    Action action;
    action.steps_ = std::move(steps);
    action.sequence_ = true;
    return action;
}

std::optional<Value> Action::execute(const Value& current) const {
    if (!sequence_) {
        if (steps_.empty()) return std::nullopt;
        return execute_step(steps_.front(), current);
    }

    std::optional<Value> result;
    for (const auto& step : steps_) {
        auto next = execute_step(step, result ? *result : current);
        if (next) {
            result = std::move(next);
        }
    }
    return result;
}

bool Action::apply(const Slot& slot) const {
    auto result = execute(slot.value());
    if (!result) return false;
    slot.set(std::move(*result));
    return true;
}

std::optional<Value> execute(const Action& action, const Slot& slot) {
    return action.execute(slot.value());
}

} // namespace jmutate
