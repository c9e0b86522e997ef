/**
 * @file PathExpr.cpp
 * @brief Implementation of path compilation and resolution
 */

#include "jmutate/PathExpr.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <unordered_set>
#include <utility>

namespace jmutate {

// ============================================================================
// Slot
// ============================================================================

std::string escape_pointer_token(const std::string& token) {
    std::string out;
    out.reserve(token.size());
    for (char c : token) {
        if (c == '~') out += "~0";
        else if (c == '/') out += "~1";
        else out += c;
    }
    return out;
}

Slot Slot::root(Value& document) {
    return Slot(&document, std::monostate{}, "");
}

Slot Slot::member(Value& owner, std::string key, const std::string& owner_pointer) {
    std::string pointer = owner_pointer + "/" + escape_pointer_token(key);
    return Slot(&owner, std::move(key), std::move(pointer));
}

Slot Slot::element(Value& owner, std::size_t index, const std::string& owner_pointer) {
    return Slot(&owner, index, owner_pointer + "/" + std::to_string(index));
}

Value& Slot::value() const {
    if (const auto* key = std::get_if<std::string>(&key_)) {
        return owner_->at(*key);
    }
    if (const auto* index = std::get_if<std::size_t>(&key_)) {
        return owner_->at(*index);
    }
    return *owner_;
}

void Slot::set(Value value) const {
    this->value() = std::move(value);
}

bool Slot::is_within(const Slot& other) const {
    const std::string& prefix = other.pointer_;
    if (pointer_.compare(0, prefix.size(), prefix) != 0) return false;
    return pointer_.size() == prefix.size() || pointer_[prefix.size()] == '/';
}

namespace {

// ============================================================================
// Parser
// ============================================================================

class Parser {
public:
    explicit Parser(const std::string& text) : text_(text) {}

    std::vector<PathSegment> parse() {
        std::vector<PathSegment> segments;
        if (text_.empty()) {
            fail("empty path");
        }

        if (text_[0] == '$') {
            pos_ = 1;
        } else if (text_[0] != '[') {
            // Relative form: leading member name without '$.'
            segments.push_back(dot_member(false));
        }

        while (!at_end()) {
            char c = peek();
            if (c == '.') {
                if (pos_ + 1 < text_.size() && text_[pos_ + 1] == '.') {
                    pos_ += 2;
                    if (!at_end() && peek() == '[') {
                        segments.push_back(bracket(true));
                    } else {
                        segments.push_back(dot_member(true));
                    }
                } else {
                    ++pos_;
                    segments.push_back(dot_member(false));
                }
            } else if (c == '[') {
                segments.push_back(bracket(false));
            } else {
                fail(std::string("unexpected character '") + c + "'");
            }
        }
        return segments;
    }

private:
    const std::string& text_;
    std::size_t pos_ = 0;

    [[noreturn]] void fail(const std::string& details) const {
        throw PathSyntaxError(text_, pos_, details);
    }

    bool at_end() const { return pos_ >= text_.size(); }
    char peek() const { return text_[pos_]; }

    void skip_spaces() {
        while (!at_end() && std::isspace(static_cast<unsigned char>(peek()))) ++pos_;
    }

    void expect(char c) {
        skip_spaces();
        if (at_end() || peek() != c) {
            fail(std::string("expected '") + c + "'");
        }
        ++pos_;
    }

    PathSegment dot_member(bool recursive) {
        PathSegment seg;
        seg.recursive = recursive;
        if (!at_end() && peek() == '*') {
            ++pos_;
            seg.type = PathSegment::Type::Wildcard;
            return seg;
        }
        seg.type = PathSegment::Type::Name;
        seg.names.push_back(read_name());
        return seg;
    }

    std::string read_name() {
        std::size_t start = pos_;
        while (!at_end() && peek() != '.' && peek() != '[') {
            if (peek() == ']') fail("unexpected ']'");
            ++pos_;
        }
        if (pos_ == start) fail("expected member name");
        return text_.substr(start, pos_ - start);
    }

    std::string read_quoted() {
        char quote = peek();
        ++pos_;
        std::string out;
        while (!at_end() && peek() != quote) {
            if (peek() == '\\' && pos_ + 1 < text_.size()) ++pos_;
            out += peek();
            ++pos_;
        }
        if (at_end()) fail("unterminated string");
        ++pos_;
        return out;
    }

    PathSegment bracket(bool recursive) {
        PathSegment seg;
        seg.recursive = recursive;
        ++pos_; // '['
        skip_spaces();
        if (at_end()) fail("unterminated '['");

        char c = peek();
        if (c == '*') {
            ++pos_;
            seg.type = PathSegment::Type::Wildcard;
        } else if (c == '\'' || c == '"') {
            while (true) {
                seg.names.push_back(read_quoted());
                skip_spaces();
                if (!at_end() && peek() == ',') {
                    ++pos_;
                    skip_spaces();
                    if (at_end() || (peek() != '\'' && peek() != '"')) {
                        fail("expected quoted member name");
                    }
                    continue;
                }
                break;
            }
            seg.type = seg.names.size() == 1 ? PathSegment::Type::Name
                                             : PathSegment::Type::Names;
        } else if (c == '?') {
            ++pos_;
            expect('(');
            seg.type = PathSegment::Type::Filter;
            seg.filter = filter();
            expect(')');
        } else if (c == '-' || std::isdigit(static_cast<unsigned char>(c))) {
            seg.type = PathSegment::Type::Index;
            seg.index = read_index();
        } else {
            fail("expected index, '*', quoted name or filter");
        }
        expect(']');
        return seg;
    }

    std::int64_t read_index() {
        std::size_t start = pos_;
        if (peek() == '-') ++pos_;
        while (!at_end() && std::isdigit(static_cast<unsigned char>(peek()))) ++pos_;
        std::string digits = text_.substr(start, pos_ - start);
        if (digits.empty() || digits == "-") fail("expected array index");
        try {
            return std::stoll(digits);
        } catch (const std::out_of_range&) {
            fail("array index out of range");
        }
    }

    PathFilter filter() {
        PathFilter result;
        skip_spaces();
        if (at_end() || peek() != '@') fail("filter must start with '@'");
        ++pos_;

        while (!at_end()) {
            if (peek() == '.') {
                ++pos_;
                std::size_t start = pos_;
                while (!at_end() && (std::isalnum(static_cast<unsigned char>(peek())) ||
                                     peek() == '_' || peek() == '-' || peek() == '$')) {
                    ++pos_;
                }
                if (pos_ == start) fail("expected field name after '@.'");
                result.field.push_back(text_.substr(start, pos_ - start));
            } else if (peek() == '[') {
                ++pos_;
                skip_spaces();
                if (at_end() || (peek() != '\'' && peek() != '"')) {
                    fail("expected quoted field name");
                }
                result.field.push_back(read_quoted());
                expect(']');
            } else {
                break;
            }
        }

        skip_spaces();
        if (!at_end() && peek() == ')') {
            return result;
        }

        ConditionOp op = read_operator();
        Value literal = read_literal();
        try {
            result.test = Condition::make(op, std::move(literal));
        } catch (const std::invalid_argument& e) {
            fail(e.what());
        }
        return result;
    }

    ConditionOp read_operator() {
        static const std::pair<const char*, ConditionOp> ops[] = {
            {"==", ConditionOp::Equal},
            {"!=", ConditionOp::NotEqual},
            {"<=", ConditionOp::LessEqual},
            {">=", ConditionOp::GreaterEqual},
            {"<", ConditionOp::Less},
            {">", ConditionOp::Greater},
        };
        for (const auto& [symbol, op] : ops) {
            std::string s(symbol);
            if (text_.compare(pos_, s.size(), s) == 0) {
                pos_ += s.size();
                return op;
            }
        }
        fail("expected comparison operator");
    }

    Value read_literal() {
        skip_spaces();
        if (at_end()) fail("expected literal");
        if (peek() == '\'' || peek() == '"') {
            return Value(read_quoted());
        }

        std::size_t start = pos_;
        while (!at_end() && peek() != ')' &&
               !std::isspace(static_cast<unsigned char>(peek()))) {
            ++pos_;
        }
        std::string token = text_.substr(start, pos_ - start);
        if (token.empty()) fail("expected literal");

        Value literal;
        try {
            literal = Value::parse(token);
        } catch (const Value::parse_error&) {
            pos_ = start;
            fail("invalid literal '" + token + "'");
        }
        if (is_container(literal)) {
            pos_ = start;
            fail("filter literal must be a scalar");
        }
        return literal;
    }
};

// ============================================================================
// Resolution
// ============================================================================

bool filter_matches(const PathFilter& filter, const Value& child) {
    const Value* current = &child;
    for (const auto& field : filter.field) {
        if (!current->is_object()) return false;
        auto it = current->find(field);
        if (it == current->end()) return false;
        current = &(*it);
    }
    if (!filter.test) return true;
    return evaluate(*filter.test, *current);
}

/**
 * @brief Normalize a possibly negative index against a size
 */
std::optional<std::size_t> normalize_index(std::int64_t index, std::size_t size) {
    std::int64_t n = static_cast<std::int64_t>(size);
    if (index < 0) index += n;
    if (index < 0 || index >= n) return std::nullopt;
    return static_cast<std::size_t>(index);
}

/**
 * @brief Test a child against a segment's selector
 * @param key Member name, or nullptr for array elements
 */
bool selects(const PathSegment& seg, const std::string* key, std::size_t index,
             std::size_t size, const Value& child) {
    switch (seg.type) {
        case PathSegment::Type::Name:
        case PathSegment::Type::Names:
            return key != nullptr &&
                   std::find(seg.names.begin(), seg.names.end(), *key) != seg.names.end();
        case PathSegment::Type::Index: {
            if (key != nullptr) return false;
            auto idx = normalize_index(seg.index, size);
            return idx && *idx == index;
        }
        case PathSegment::Type::Wildcard:
            return true;
        case PathSegment::Type::Filter:
            return filter_matches(seg.filter, child);
    }
    return false;
}

/**
 * @brief Visit direct children of a slot in canonical order
 *
 * Calls fn(child_slot, child_value, key_or_null, index, size) for each
 * member of an object or element of an array. Scalars have no children.
 */
template <typename Fn>
void for_each_child(const Slot& slot, Fn&& fn) {
    Value& node = slot.value();
    if (node.is_object()) {
        std::size_t index = 0;
        for (auto it = node.begin(); it != node.end(); ++it, ++index) {
            const std::string& key = it.key();
            fn(Slot::member(node, key, slot.pointer()), it.value(), &key, index, node.size());
        }
    } else if (node.is_array()) {
        for (std::size_t i = 0; i < node.size(); ++i) {
            fn(Slot::element(node, i, slot.pointer()), node[i], nullptr, i, node.size());
        }
    }
}

void select_direct(const PathSegment& seg, const Slot& slot, std::vector<Slot>& out) {
    Value& node = slot.value();
    switch (seg.type) {
        case PathSegment::Type::Name:
        case PathSegment::Type::Names:
            if (!node.is_object()) return;
            for (const auto& name : seg.names) {
                if (node.find(name) != node.end()) {
                    out.push_back(Slot::member(node, name, slot.pointer()));
                }
            }
            return;

        case PathSegment::Type::Index: {
            if (!node.is_array()) return;
            auto idx = normalize_index(seg.index, node.size());
            if (idx) out.push_back(Slot::element(node, *idx, slot.pointer()));
            return;
        }

        case PathSegment::Type::Wildcard:
        case PathSegment::Type::Filter:
            for_each_child(slot, [&](Slot child, const Value& value, const std::string* key,
                                     std::size_t index, std::size_t size) {
                if (selects(seg, key, index, size, value)) {
                    out.push_back(std::move(child));
                }
            });
            return;
    }
}

void select_recursive(const PathSegment& seg, const Slot& slot, std::vector<Slot>& out) {
    for_each_child(slot, [&](Slot child, const Value& value, const std::string* key,
                             std::size_t index, std::size_t size) {
        if (selects(seg, key, index, size, value)) {
            out.push_back(child);
        }
        select_recursive(seg, child, out);
    });
}

void drop_duplicates(std::vector<Slot>& slots) {
    std::unordered_set<std::string> seen;
    auto last = std::remove_if(slots.begin(), slots.end(), [&](const Slot& slot) {
        return !seen.insert(slot.pointer()).second;
    });
    slots.erase(last, slots.end());
}

} // anonymous namespace

// ============================================================================
// PathExpr
// ============================================================================

PathExpr PathExpr::compile(const std::string& text) {
    PathExpr expr;
    expr.text_ = text;
    expr.segments_ = Parser(text).parse();
    return expr;
}

std::vector<Slot> PathExpr::resolve(Value& document) const {
    std::vector<Slot> current;
    current.push_back(Slot::root(document));

    for (const auto& seg : segments_) {
        std::vector<Slot> next;
        for (const auto& slot : current) {
            if (seg.recursive) {
                select_recursive(seg, slot, next);
            } else {
                select_direct(seg, slot, next);
            }
        }
        drop_duplicates(next);
        current = std::move(next);
        if (current.empty()) break;
    }
    return current;
}

std::vector<Slot> resolve(Value& document, const std::string& path) {
    return PathExpr::compile(path).resolve(document);
}

} // namespace jmutate
