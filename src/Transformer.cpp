/**
 * @file Transformer.cpp
 * @brief Rule engine orchestration
 */

#include "jmutate/Transformer.hpp"

#include <algorithm>
#include <vector>

namespace jmutate {

std::size_t apply_rule(Value& document, const Rule& rule) {
    std::vector<Slot> slots = rule.path.resolve(document);
    std::vector<const Slot*> replaced_containers;
    std::size_t written = 0;

    for (const auto& slot : slots) {
        bool detached = std::any_of(replaced_containers.begin(), replaced_containers.end(),
                                    [&](const Slot* gone) { return slot.is_within(*gone); });
        if (detached) continue;

        const Value& current = slot.value();
        if (rule.condition && !evaluate(*rule.condition, current)) {
            continue;
        }

        bool was_container = is_container(current);
        if (rule.action.apply(slot)) {
            ++written;
            if (was_container) replaced_containers.push_back(&slot);
        }
    }
    return written;
}

Value& transform(Value& document, const RuleSet& rules) {
    for (const auto& rule : rules) {
        apply_rule(document, rule);
    }
    return document;
}

Value& transform(Value& document, const RuleSetPtr& snapshot) {
    if (!snapshot) return document;
    return transform(document, *snapshot);
}

Value transform_copy(const Value& document, const RuleSetPtr& snapshot) {
    Value copy = document;
    transform(copy, snapshot);
    return copy;
}

} // namespace jmutate
