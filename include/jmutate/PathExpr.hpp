/**
 * @file PathExpr.hpp
 * @brief Path expressions and addressable document slots
 *
 * Provides a compiled JSONPath subset resolved against documents:
 *
 * - `$`                 the document root
 * - `.name`, `['name']` member access (`['a','b']` selects several)
 * - `[3]`, `[-1]`       array index (negative counts from the end)
 * - `.*`, `[*]`         every member or element
 * - `..name`, `..*`     recursive descent (matches at any depth)
 * - `[?(@.f op lit)]`   filter children by a field compared to a literal
 * - `[?(@.f)]`          filter children that have field `f`
 *
 * A path without a leading `$` is taken relative to the root, so
 * "order.items[0]" means "$.order.items[0]".
 *
 * Canonical match order: document pre-order. Object members are visited
 * in insertion order and array elements by ascending index; a node is
 * visited before its descendants. For recursive descent every node below
 * the starting point is tested in that order, so `$..*` lists the whole
 * tree depth-first. A location reached more than once is reported only
 * at its first occurrence.
 *
 * Resolution never throws and never creates missing members.
 */

#ifndef JMUTATE_PATHEXPR_HPP
#define JMUTATE_PATHEXPR_HPP

#include "jmutate/Condition.hpp"
#include "jmutate/Errors.hpp"
#include "jmutate/Value.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace jmutate {

/**
 * @brief Addressable location inside a document
 *
 * A slot is (owning container, member key or element index). The root
 * slot has no key and refers to the document itself. Reading and writing
 * go through the owner, so writing a new value never moves the slot.
 *
 * A slot stays valid while its owner exists. Overwriting an ancestor of
 * the owner destroys it; see Slot::is_within().
 */
class Slot {
public:
    /// Slot for the document itself
    static Slot root(Value& document);

    /// Slot for member @p key of object @p owner
    static Slot member(Value& owner, std::string key, const std::string& owner_pointer);

    /// Slot for element @p index of array @p owner
    static Slot element(Value& owner, std::size_t index, const std::string& owner_pointer);

    /// Current value stored in the slot
    Value& value() const;

    /// Replace the value stored in the slot
    void set(Value value) const;

    /// JSON Pointer (RFC 6901) of the slot, "" for the root
    const std::string& pointer() const noexcept { return pointer_; }

    /// True if this slot is @p other or lies beneath it
    bool is_within(const Slot& other) const;

    bool is_root() const noexcept {
        return std::holds_alternative<std::monostate>(key_);
    }

private:
    Slot(Value* owner, std::variant<std::monostate, std::string, std::size_t> key,
         std::string pointer)
        : owner_(owner), key_(std::move(key)), pointer_(std::move(pointer)) {}

    Value* owner_;
    std::variant<std::monostate, std::string, std::size_t> key_;
    std::string pointer_;
};

/**
 * @brief Escape one JSON Pointer reference token ("~" -> "~0", "/" -> "~1")
 */
std::string escape_pointer_token(const std::string& token);

/**
 * @brief Filter predicate inside `[?( ... )]`
 *
 * `field` is the member chain after `@` (empty means the child itself).
 * Without a test, the filter only requires that the field exists.
 */
struct PathFilter {
    std::vector<std::string> field;
    std::optional<Condition> test;
};

/**
 * @brief One step of a compiled path
 */
struct PathSegment {
    enum class Type {
        Name,       ///< single member
        Names,      ///< union of members
        Index,      ///< single element
        Wildcard,   ///< all members / elements
        Filter      ///< children passing a PathFilter
    };

    Type type = Type::Name;
    bool recursive = false;
    std::vector<std::string> names;
    std::int64_t index = 0;
    PathFilter filter;
};

/**
 * @brief A compiled path expression
 *
 * Compile once (at rule load time), resolve against any number of
 * documents. Immutable after compilation.
 */
class PathExpr {
public:
    /**
     * @brief Compile a path expression
     * @throws PathSyntaxError if the expression is malformed
     *
     * Examples:
     * ```cpp
     * PathExpr::compile("$..code");
     * PathExpr::compile("$.items[?(@.qty > 0)].price");
     * PathExpr::compile("user.name");      // same as "$.user.name"
     * PathExpr::compile("$.items[");       // throws PathSyntaxError
     * ```
     */
    static PathExpr compile(const std::string& text);

    /**
     * @brief Resolve against a document
     * @return Matching slots in canonical order; empty if nothing matches
     */
    std::vector<Slot> resolve(Value& document) const;

    const std::string& text() const noexcept { return text_; }
    const std::vector<PathSegment>& segments() const noexcept { return segments_; }

private:
    std::string text_;
    std::vector<PathSegment> segments_;
};

/**
 * @brief Compile and resolve in one call
 * @throws PathSyntaxError if @p path is malformed
 */
std::vector<Slot> resolve(Value& document, const std::string& path);

} // namespace jmutate

#endif // JMUTATE_PATHEXPR_HPP
