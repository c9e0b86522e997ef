/**
 * @file Rule.cpp
 * @brief Implementation of RuleSet lookups
 */

#include "jmutate/Rule.hpp"

#include <algorithm>

namespace jmutate {

const Rule* RuleSet::find(const std::string& id) const {
    auto it = std::find_if(rules_.begin(), rules_.end(),
                           [&](const Rule& rule) { return rule.id == id; });
    return it == rules_.end() ? nullptr : &(*it);
}

} // namespace jmutate
