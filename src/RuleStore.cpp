/**
 * @file RuleStore.cpp
 * @brief Snapshot publication
 */

#include "jmutate/RuleStore.hpp"
#include "jmutate/RuleLoader.hpp"

#include <memory>
#include <stdexcept>

namespace jmutate {

RuleStore::RuleStore()
    : current_(std::make_shared<const RuleSet>())
{}

RuleStore::RuleStore(RuleSetPtr initial)
    : current_(initial ? std::move(initial) : std::make_shared<const RuleSet>())
    , version_(1)
{}

RuleSetPtr RuleStore::snapshot() const {
    return std::atomic_load_explicit(&current_, std::memory_order_acquire);
}

std::uint64_t RuleStore::version() const noexcept {
    return version_.load(std::memory_order_acquire);
}

std::uint64_t RuleStore::publish(RuleSetPtr rules) {
    if (!rules) {
        throw std::invalid_argument("cannot publish a null rule set");
    }
    // Publishers are serialized so versions follow publication order;
    // readers never take this lock.
    std::lock_guard<std::mutex> lock(publish_mutex_);
    std::atomic_store_explicit(&current_, std::move(rules), std::memory_order_release);
    return version_.fetch_add(1, std::memory_order_acq_rel) + 1;
}

std::uint64_t RuleStore::load(const Value& source) {
    // Fully build the candidate before touching the active snapshot
    RuleSetPtr candidate = parse_rules(source);
    return publish(std::move(candidate));
}

std::uint64_t RuleStore::load_file(const std::string& path) {
    RuleSetPtr candidate = load_rules_file(path);
    return publish(std::move(candidate));
}

} // namespace jmutate
