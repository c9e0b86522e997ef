/**
 * @file Rule.hpp
 * @brief Rules and immutable rule sets
 */

#ifndef JMUTATE_RULE_HPP
#define JMUTATE_RULE_HPP

#include "jmutate/Action.hpp"
#include "jmutate/Condition.hpp"
#include "jmutate/PathExpr.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace jmutate {

/**
 * @brief A path plus an optional condition and one action
 */
struct Rule {
    std::string id;
    PathExpr path;
    std::optional<Condition> condition;
    Action action;
};

/**
 * @brief Ordered, immutable list of rules
 *
 * Built once by the loader and shared read-only between any number of
 * concurrent transformations through RuleSetPtr.
 */
class RuleSet {
public:
    RuleSet() = default;
    explicit RuleSet(std::vector<Rule> rules) : rules_(std::move(rules)) {}

    const std::vector<Rule>& rules() const noexcept { return rules_; }
    std::size_t size() const noexcept { return rules_.size(); }
    bool empty() const noexcept { return rules_.empty(); }

    std::vector<Rule>::const_iterator begin() const noexcept { return rules_.begin(); }
    std::vector<Rule>::const_iterator end() const noexcept { return rules_.end(); }

    /**
     * @brief Find a rule by id
     * @return Pointer to the rule, or nullptr if absent
     */
    const Rule* find(const std::string& id) const;

private:
    std::vector<Rule> rules_;
};

/// Shared handle to a published rule set
using RuleSetPtr = std::shared_ptr<const RuleSet>;

} // namespace jmutate

#endif // JMUTATE_RULE_HPP
