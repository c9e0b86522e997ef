/**
 * @file RuleLoader.cpp
 * @brief Rule source reading and validation
 *
 * JSON sources are parsed with nlohmann::json, TOML sources with toml++
 * and converted into the same Value tree before validation.
 */

#include "jmutate/RuleLoader.hpp"
#include "jmutate/Errors.hpp"
#include "jmutate/Util.hpp"

#include <nlohmann/json.hpp>
#include <toml++/toml.hpp>

#include <cstdint>
#include <limits>
#include <set>
#include <sstream>
#include <stdexcept>

namespace jmutate {

namespace {

/**
 * @brief Convert toml++ value to a Value.
 *
 * Dates and times become their TOML text form.
 */
Value toml_value_to_json(const toml::node& node) {
    switch (node.type()) {
        case toml::node_type::string:
            return Value(node.as_string()->get());

        case toml::node_type::integer:
            return Value(node.as_integer()->get());

        case toml::node_type::floating_point:
            return Value(node.as_floating_point()->get());

        case toml::node_type::boolean:
            return Value(node.as_boolean()->get());

        case toml::node_type::date: {
            std::ostringstream ss;
            ss << node.as_date()->get();
            return Value(ss.str());
        }

        case toml::node_type::time: {
            std::ostringstream ss;
            ss << node.as_time()->get();
            return Value(ss.str());
        }

        case toml::node_type::date_time: {
            std::ostringstream ss;
            ss << node.as_date_time()->get();
            return Value(ss.str());
        }

        case toml::node_type::array: {
            Value arr = Value::array();
            for (const auto& elem : *node.as_array()) {
                arr.push_back(toml_value_to_json(elem));
            }
            return arr;
        }

        case toml::node_type::table: {
            Value obj = Value::object();
            for (const auto& [key, val] : *node.as_table()) {
                obj[std::string(key.str())] = toml_value_to_json(val);
            }
            return obj;
        }

        default:
            return Value(nullptr);
    }
}

/**
 * @brief Error reporting context for one rule record
 */
struct RecordContext {
    std::size_t index;
    std::string id;

    [[noreturn]] void fail(const std::string& field, const std::string& details) const {
        throw RuleValidationError(index, id, field, details);
    }
};

const Value& require(const RecordContext& ctx, const Value& obj,
                     const std::string& key, const std::string& prefix) {
    auto it = obj.find(key);
    if (it == obj.end()) {
        ctx.fail(prefix + key, "missing required field");
    }
    return *it;
}

std::string require_string(const RecordContext& ctx, const Value& obj,
                           const std::string& key, const std::string& prefix) {
    const Value& v = require(ctx, obj, key, prefix);
    if (!v.is_string() || v.get_ref<const std::string&>().empty()) {
        ctx.fail(prefix + key, "expected a non-empty string");
    }
    return v.get<std::string>();
}

const Value& require_number(const RecordContext& ctx, const Value& obj,
                            const std::string& key, const std::string& prefix) {
    const Value& v = require(ctx, obj, key, prefix);
    if (!v.is_number()) {
        ctx.fail(prefix + key, "expected a number, got " + type_name(v));
    }
    return v;
}

std::int64_t require_integer(const RecordContext& ctx, const Value& obj,
                             const std::string& key, const std::string& prefix) {
    const Value& v = require(ctx, obj, key, prefix);
    if (!v.is_number_integer() || (v.is_number_unsigned() &&
        v.get<std::uint64_t>() > static_cast<std::uint64_t>(
                                     std::numeric_limits<std::int64_t>::max()))) {
        ctx.fail(prefix + key, "expected an integer, got " + type_name(v));
    }
    return v.get<std::int64_t>();
}

ActionStep parse_step(const RecordContext& ctx, const Value& body, ActionOp op,
                      const std::string& prefix) {
    ActionStep step;
    step.op = op;

    switch (op) {
        case ActionOp::Replace:
        case ActionOp::Default:
            step.value = require(ctx, body, "value", prefix);
            break;

        case ActionOp::Cast: {
            std::string to = require_string(ctx, body, "to", prefix);
            auto target = parse_cast_target(to);
            if (!target) {
                ctx.fail(prefix + "to", "unknown cast target '" + to + "'");
            }
            step.cast_to = *target;
            break;
        }

        case ActionOp::Trim:
        case ActionOp::Uppercase:
        case ActionOp::Lowercase:
            break;

        case ActionOp::Add:
        case ActionOp::Sub:
        case ActionOp::Mul:
        case ActionOp::Div:
            step.by = !body.contains("by") && body.contains("value")
                ? require_number(ctx, body, "value", prefix)
                : require_number(ctx, body, "by", prefix);
            break;

        case ActionOp::Round: {
            std::int64_t digits = body.contains("digits")
                ? require_integer(ctx, body, "digits", prefix) : 0;
            if (digits < -15 || digits > 15) {
                ctx.fail(prefix + "digits", "must be between -15 and 15");
            }
            step.digits = static_cast<int>(digits);
            break;
        }

        case ActionOp::FormatDate:
            step.from = require_string(ctx, body, "from", prefix);
            step.to = require_string(ctx, body, "to", prefix);
            break;

        case ActionOp::OffsetDate: {
            step.amount = require_integer(ctx, body, "amount", prefix);
            std::string unit = require_string(ctx, body, "unit", prefix);
            auto parsed = parse_date_unit(unit);
            if (!parsed) {
                ctx.fail(prefix + "unit", "unknown date unit '" + unit + "'");
            }
            step.unit = *parsed;
            break;
        }

        case ActionOp::ConvertUnit:
            // Unknown units are not an error: the conversion simply no-ops
            step.from = require_string(ctx, body, "from", prefix);
            step.to = require_string(ctx, body, "to", prefix);
            break;

        case ActionOp::Map: {
            const Value& mappings = require(ctx, body, "mappings", prefix);
            if (!mappings.is_object()) {
                ctx.fail(prefix + "mappings", "expected an object");
            }
            step.mappings = mappings;
            auto nulls = body.find("null_values");
            if (nulls != body.end()) {
                if (!nulls->is_array()) {
                    ctx.fail(prefix + "null_values", "expected an array of strings");
                }
                for (const auto& v : *nulls) {
                    if (!v.is_string()) {
                        ctx.fail(prefix + "null_values", "expected an array of strings");
                    }
                    step.null_values.push_back(v.get<std::string>());
                }
            }
            break;
        }

        case ActionOp::Sequence:
            ctx.fail(prefix + "op", "nested sequence must be expanded by the caller");
    }
    return step;
}

ActionOp require_action_op(const RecordContext& ctx, const Value& body,
                           const std::string& prefix) {
    if (!body.is_object()) {
        ctx.fail(prefix.empty() ? "action" : prefix.substr(0, prefix.size() - 1),
                 "expected an object");
    }
    std::string name = require_string(ctx, body, "op", prefix);
    auto op = parse_action_op(name);
    if (!op) {
        ctx.fail(prefix + "op", "unknown action operator '" + name + "'");
    }
    return *op;
}

/**
 * @brief Append the steps of a sequence, flattening nested sequences
 */
void parse_steps_into(const RecordContext& ctx, const Value& body,
                      const std::string& prefix, std::vector<ActionStep>& out) {
    const Value& steps = require(ctx, body, "steps", prefix);
    if (!steps.is_array() || steps.empty()) {
        ctx.fail(prefix + "steps", "expected a non-empty array");
    }
    for (std::size_t i = 0; i < steps.size(); ++i) {
        std::string step_prefix = prefix + "steps[" + std::to_string(i) + "].";
        ActionOp op = require_action_op(ctx, steps[i], step_prefix);
        if (op == ActionOp::Sequence) {
            parse_steps_into(ctx, steps[i], step_prefix, out);
        } else {
            out.push_back(parse_step(ctx, steps[i], op, step_prefix));
        }
    }
}

Action parse_action_spec(const RecordContext& ctx, const Value& body) {
    const std::string prefix = "action.";
    ActionOp op = require_action_op(ctx, body, prefix);
    if (op == ActionOp::Sequence) {
        std::vector<ActionStep> steps;
        parse_steps_into(ctx, body, prefix, steps);
        return Action::sequence(std::move(steps));
    }
    return Action::single(parse_step(ctx, body, op, prefix));
}

Condition parse_condition(const RecordContext& ctx, const Value& body) {
    if (!body.is_object()) {
        ctx.fail("condition", "expected an object");
    }
    std::string name = require_string(ctx, body, "op", "condition.");
    auto op = parse_condition_op(name);
    if (!op) {
        ctx.fail("condition.op", "unknown condition operator '" + name + "'");
    }

    std::optional<Kind> expected;
    auto type_it = body.find("type");
    if (type_it != body.end()) {
        if (!type_it->is_string()) {
            ctx.fail("condition.type", "expected a type name");
        }
        expected = parse_kind(type_it->get<std::string>());
        if (!expected) {
            ctx.fail("condition.type", "unknown type '" + type_it->get<std::string>() + "'");
        }
    }

    Value operand;
    auto value_it = body.find("value");
    if (value_it != body.end()) {
        operand = *value_it;
    } else if (*op != ConditionOp::IsNull && *op != ConditionOp::IsEmpty) {
        ctx.fail("condition.value", "missing required field");
    }

    try {
        return Condition::make(*op, std::move(operand), expected);
    } catch (const std::invalid_argument& e) {
        ctx.fail("condition.value", e.what());
    }
}

Rule parse_rule(const Value& record, std::size_t index, std::set<std::string>& seen_ids) {
    RecordContext ctx{index, ""};
    if (!record.is_object()) {
        ctx.fail("", "expected an object, got " + type_name(record));
    }

    Rule rule;
    rule.id = require_string(ctx, record, "id", "");
    ctx.id = rule.id;
    if (!seen_ids.insert(rule.id).second) {
        ctx.fail("id", "duplicate rule id");
    }

    const std::string path_key = record.contains("when") ? "when" : "path";
    std::string path = require_string(ctx, record, path_key, "");
    try {
        rule.path = PathExpr::compile(path);
    } catch (const PathSyntaxError& e) {
        ctx.fail(path_key, e.what());
    }

    auto cond_it = record.find("condition");
    if (cond_it != record.end() && !cond_it->is_null()) {
        rule.condition = parse_condition(ctx, *cond_it);
    }

    rule.action = parse_action_spec(ctx, require(ctx, record, "action", ""));
    return rule;
}

} // anonymous namespace

// ============================================================================
// Validation
// ============================================================================

RuleSetPtr parse_rules(const Value& source) {
    const Value* list = &source;
    if (source.is_object()) {
        auto it = source.find("rules");
        if (it == source.end()) {
            throw RuleValidationError(0, "", "rules", "missing required field");
        }
        list = &(*it);
    }
    if (!list->is_array()) {
        throw RuleValidationError(0, "", "rules",
                                  "expected an array of rules, got " + type_name(*list));
    }

    std::vector<Rule> rules;
    rules.reserve(list->size());
    std::set<std::string> seen_ids;
    for (std::size_t i = 0; i < list->size(); ++i) {
        rules.push_back(parse_rule((*list)[i], i, seen_ids));
    }
    return std::make_shared<const RuleSet>(std::move(rules));
}

Action parse_action(const Value& body, std::size_t index, const std::string& rule_id) {
    return parse_action_spec(RecordContext{index, rule_id}, body);
}

// ============================================================================
// Source reading
// ============================================================================

Value parse_rule_source(const std::string& text, const std::string& format) {
    const std::string name = "<string>";
    if (format == "json") {
        try {
            return Value::parse(text);
        } catch (const Value::parse_error& e) {
            throw RuleParseError(name, 0, 0, e.what());
        }
    }
    if (format == "toml") {
        try {
            toml::table table = toml::parse(text);
            return toml_value_to_json(table);
        } catch (const toml::parse_error& e) {
            throw RuleParseError(
                name,
                static_cast<int>(e.source().begin.line),
                static_cast<int>(e.source().begin.column),
                std::string(e.description())
            );
        }
    }
    throw MutateError("Unsupported rule source format: " + format + " (expected json or toml)");
}

Value read_rule_source(const std::string& path) {
    std::string ext = file_extension(path);
    if (ext != ".json" && ext != ".toml") {
        throw MutateError(
            "Unsupported rule file type: " + ext + " (expected .json or .toml)"
        );
    }

    std::string content = read_text_file(path);
    try {
        return parse_rule_source(content, ext.substr(1));
    } catch (const RuleParseError& e) {
        throw RuleParseError(path, e.line(), e.column(), e.details());
    }
}

RuleSetPtr load_rules_file(const std::string& path) {
    return parse_rules(read_rule_source(path));
}

RuleSetPtr load_rules_string(const std::string& text, const std::string& format) {
    return parse_rules(parse_rule_source(text, format));
}

} // namespace jmutate
