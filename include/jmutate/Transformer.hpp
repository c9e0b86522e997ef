/**
 * @file Transformer.hpp
 * @brief Applying a rule set to a document
 *
 * For each rule, in rule set order:
 * 1. resolve the rule's path against the document as it is now,
 *    including changes made by earlier rules;
 * 2. for each matched slot, skip it if the rule's condition is false;
 * 3. otherwise run the action and store its result in the slot.
 *
 * Every matching rule runs; when rules overlap the later one wins.
 * Nothing is rolled back. Run-time mismatches are no-ops, so transform()
 * only throws for failures such as std::bad_alloc.
 *
 * Transformations are synchronous and keep no state between calls.
 * Several threads may transform different documents against the same
 * RuleSetPtr without locking.
 */

#ifndef JMUTATE_TRANSFORMER_HPP
#define JMUTATE_TRANSFORMER_HPP

#include "jmutate/Rule.hpp"
#include "jmutate/Value.hpp"

#include <cstddef>

namespace jmutate {

/**
 * @brief Apply one rule to a document in place
 *
 * When the action overwrites a slot that held an object or array, later
 * slots of the same rule lying beneath it no longer exist and are
 * skipped.
 *
 * @return Number of slots written
 */
std::size_t apply_rule(Value& document, const Rule& rule);

/**
 * @brief Apply every rule of a rule set to a document in place
 * @return The same document
 *
 * Example:
 * ```cpp
 * auto rules = load_rules_string(R"([{"id": "up", "when": "$..code",
 *     "action": {"op": "uppercase"}}])");
 * Value doc = Value::parse(R"({"code": "a", "nested": {"code": "b"}})");
 * transform(doc, *rules);   // {"code": "A", "nested": {"code": "B"}}
 * ```
 */
Value& transform(Value& document, const RuleSet& rules);

/**
 * @brief Apply a published snapshot; a null snapshot changes nothing
 */
Value& transform(Value& document, const RuleSetPtr& snapshot);

/**
 * @brief Transform a copy, leaving @p document untouched
 */
Value transform_copy(const Value& document, const RuleSetPtr& snapshot);

} // namespace jmutate

#endif // JMUTATE_TRANSFORMER_HPP
