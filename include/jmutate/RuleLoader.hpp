/**
 * @file RuleLoader.hpp
 * @brief Reading, validating and compiling rule sources
 *
 * A rule source is an ordered list of rule records, either a top-level
 * array or an object holding it under "rules":
 *
 * ```json
 * [
 *   {"id": "codes", "when": "$..code",
 *    "condition": {"op": "==", "value": "A"},
 *    "action": {"op": "replace", "value": "B"}},
 *   {"id": "cents", "when": "$.items[*].price",
 *    "action": {"op": "sequence", "steps": [
 *      {"op": "div", "by": 100}, {"op": "round", "digits": 2}]}}
 * ]
 * ```
 *
 * TOML sources use an array of tables:
 *
 * ```toml
 * [[rules]]
 * id = "codes"
 * when = "$..code"
 * condition = { op = "==", value = "A" }
 * action = { op = "replace", value = "B" }
 * ```
 *
 * Validation is all-or-nothing: the first problem aborts the whole
 * source and nothing is returned.
 */

#ifndef JMUTATE_RULELOADER_HPP
#define JMUTATE_RULELOADER_HPP

#include "jmutate/Rule.hpp"
#include "jmutate/Value.hpp"

#include <string>

namespace jmutate {

/**
 * @brief Validate and compile a parsed rule source
 *
 * Checks every record for:
 * - `id`: non-empty string, unique within the source
 * - `when` (alias `path`): valid path expression
 * - `condition` (optional): known `op`, operand suiting the operator,
 *   optional `type`
 * - `action`: known `op` with its required parameters; `sequence`
 *   needs a non-empty `steps` array
 *
 * @param source Parsed JSON/TOML document
 * @return The compiled, immutable rule set
 * @throws RuleValidationError on the first invalid record or field
 */
RuleSetPtr parse_rules(const Value& source);

/**
 * @brief Parse a single action object (`{op, ...params}`)
 *
 * @param body The action object
 * @param index Rule position, for error reporting
 * @param rule_id Rule id, for error reporting
 * @throws RuleValidationError if the action is invalid
 */
Action parse_action(const Value& body, std::size_t index = 0, const std::string& rule_id = "");

/**
 * @brief Read a rule source file into a Value
 *
 * The format is chosen by extension: `.json` or `.toml`.
 *
 * @throws FileNotFoundError if the file doesn't exist
 * @throws RuleParseError on syntax errors
 * @throws MutateError for unsupported extensions
 */
Value read_rule_source(const std::string& path);

/**
 * @brief Parse rule source text
 * @param text Source text
 * @param format "json" or "toml"
 * @throws RuleParseError on syntax errors
 * @throws MutateError for unknown formats
 */
Value parse_rule_source(const std::string& text, const std::string& format = "json");

/**
 * @brief Read, validate and compile a rule file
 */
RuleSetPtr load_rules_file(const std::string& path);

/**
 * @brief Parse, validate and compile rule source text
 */
RuleSetPtr load_rules_string(const std::string& text, const std::string& format = "json");

} // namespace jmutate

#endif // JMUTATE_RULELOADER_HPP
