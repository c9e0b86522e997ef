/**
 * @file RuleStore.hpp
 * @brief Holder of the active rule set snapshot
 *
 * The store publishes whole RuleSet snapshots by atomic pointer swap.
 * Readers call snapshot() once per document and keep the returned
 * pointer for the whole transformation; a concurrent publish never
 * affects a snapshot already taken. Old snapshots are destroyed when the
 * last reader releases them.
 */

#ifndef JMUTATE_RULESTORE_HPP
#define JMUTATE_RULESTORE_HPP

#include "jmutate/Rule.hpp"
#include "jmutate/Value.hpp"

#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>

namespace jmutate {

class RuleStore {
public:
    /// Starts with an empty rule set at version 0
    RuleStore();

    /// Starts with @p initial at version 1
    explicit RuleStore(RuleSetPtr initial);

    RuleStore(const RuleStore&) = delete;
    RuleStore& operator=(const RuleStore&) = delete;

    /**
     * @brief Current snapshot; never null
     */
    RuleSetPtr snapshot() const;

    /**
     * @brief Number of successful publishes so far
     */
    std::uint64_t version() const noexcept;

    /**
     * @brief Replace the active snapshot
     * @return The new version number
     * @throws std::invalid_argument if @p rules is null
     */
    std::uint64_t publish(RuleSetPtr rules);

    /**
     * @brief Validate a parsed rule source and publish it
     *
     * On any error the active snapshot is left untouched and the
     * exception propagates to the caller.
     *
     * @return The new version number
     * @throws RuleValidationError if the source is invalid
     */
    std::uint64_t load(const Value& source);

    /**
     * @brief Read a rule file, validate it and publish it
     *
     * @return The new version number
     * @throws FileNotFoundError, RuleParseError, RuleValidationError,
     *         MutateError; the active snapshot is kept on failure
     */
    std::uint64_t load_file(const std::string& path);

private:
    RuleSetPtr current_;
    std::atomic<std::uint64_t> version_{0};
    std::mutex publish_mutex_;
};

} // namespace jmutate

#endif // JMUTATE_RULESTORE_HPP
