/**
 * @file test_path.cpp
 * @brief Unit tests for path compilation and resolution (GoogleTest)
 *
 * Tests cover:
 * - direct member and index access
 * - wildcards over objects and arrays
 * - recursive descent and its canonical pre-order
 * - filter predicates with strict typing
 * - empty results for non-matching paths
 * - syntax errors at compile time
 * - slot read/write
 */

#include <gtest/gtest.h>
#include "jmutate/PathExpr.hpp"
#include "jmutate/Errors.hpp"

#include <string>
#include <vector>

using namespace jmutate;

namespace {

std::vector<std::string> pointers(Value& doc, const std::string& path) {
    std::vector<std::string> out;
    for (const auto& slot : resolve(doc, path)) {
        out.push_back(slot.pointer());
    }
    return out;
}

using Pointers = std::vector<std::string>;

} // namespace

// ============================================================================
// Direct access
// ============================================================================

class DirectAccessTest : public ::testing::Test {
protected:
    Value doc = Value::parse(R"({
        "name": "widget",
        "dims": {"w": 10, "h": 20},
        "tags": ["a", "b", "c"],
        "a/b": 1,
        "we~ird": 2
    })");
};

TEST_F(DirectAccessTest, RootOnly) {
    auto slots = resolve(doc, "$");
    ASSERT_EQ(slots.size(), 1u);
    EXPECT_TRUE(slots[0].is_root());
    EXPECT_EQ(slots[0].pointer(), "");
    EXPECT_EQ(&slots[0].value(), &doc);
}

TEST_F(DirectAccessTest, MemberChain) {
    EXPECT_EQ(pointers(doc, "$.dims.w"), Pointers{"/dims/w"});
}

TEST_F(DirectAccessTest, RelativePathImpliesRoot) {
    EXPECT_EQ(pointers(doc, "dims.h"), Pointers{"/dims/h"});
    EXPECT_EQ(pointers(doc, "tags[1]"), Pointers{"/tags/1"});
}

TEST_F(DirectAccessTest, BracketQuotedName) {
    EXPECT_EQ(pointers(doc, "$['dims']['w']"), Pointers{"/dims/w"});
    EXPECT_EQ(pointers(doc, "$[\"name\"]"), Pointers{"/name"});
}

TEST_F(DirectAccessTest, PointerTokensAreEscaped) {
    EXPECT_EQ(pointers(doc, "$['a/b']"), Pointers{"/a~1b"});
    EXPECT_EQ(pointers(doc, "$['we~ird']"), Pointers{"/we~0ird"});
}

TEST_F(DirectAccessTest, UnionKeepsListedOrder) {
    EXPECT_EQ(pointers(doc, "$.dims['h','w']"), (Pointers{"/dims/h", "/dims/w"}));
}

TEST_F(DirectAccessTest, ArrayIndex) {
    EXPECT_EQ(pointers(doc, "$.tags[0]"), Pointers{"/tags/0"});
    EXPECT_EQ(pointers(doc, "$.tags[-1]"), Pointers{"/tags/2"});
}

TEST_F(DirectAccessTest, IndexOutOfRangeMatchesNothing) {
    EXPECT_TRUE(pointers(doc, "$.tags[3]").empty());
    EXPECT_TRUE(pointers(doc, "$.tags[-4]").empty());
}

TEST_F(DirectAccessTest, MissingMemberMatchesNothing) {
    EXPECT_TRUE(pointers(doc, "$.missing").empty());
    EXPECT_TRUE(pointers(doc, "$.dims.depth").empty());
    EXPECT_TRUE(pointers(doc, "$.missing.deeper.still").empty());
}

TEST_F(DirectAccessTest, TraversingScalarMatchesNothing) {
    EXPECT_TRUE(pointers(doc, "$.name.first").empty());
    EXPECT_TRUE(pointers(doc, "$.name[0]").empty());
    EXPECT_TRUE(pointers(doc, "$.tags.length").empty());
}

TEST_F(DirectAccessTest, ResolutionNeverCreatesMembers) {
    Value before = doc;
    (void)resolve(doc, "$.missing.deeper");
    (void)resolve(doc, "$.tags[10]");
    EXPECT_EQ(doc, before);
}

// ============================================================================
// Wildcards
// ============================================================================

TEST(PathWildcard, ObjectMembersInInsertionOrder) {
    Value doc = Value::parse(R"({"z": 1, "a": 2, "m": 3})");
    EXPECT_EQ(pointers(doc, "$.*"), (Pointers{"/z", "/a", "/m"}));
}

TEST(PathWildcard, ArrayElementsAscending) {
    Value doc = Value::parse(R"({"items": [{"p": 1}, {"p": 2}, {"q": 3}]})");
    EXPECT_EQ(pointers(doc, "$.items[*].p"), (Pointers{"/items/0/p", "/items/1/p"}));
}

TEST(PathWildcard, ScalarHasNoChildren) {
    Value doc = Value::parse(R"({"n": 5})");
    EXPECT_TRUE(pointers(doc, "$.n.*").empty());
}

// ============================================================================
// Recursive descent
// ============================================================================

TEST(PathRecursive, FindsMatchesAtAnyDepth) {
    Value doc = Value::parse(R"({"code": "A", "nested": {"code": "A"}})");
    EXPECT_EQ(pointers(doc, "$..code"), (Pointers{"/code", "/nested/code"}));
}

TEST(PathRecursive, PreOrderAcrossObjectsAndArrays) {
    Value doc = Value::parse(R"({
        "a": {"id": 1, "kids": [{"id": 2}, {"id": 3, "kids": [{"id": 4}]}]},
        "b": [{"id": 5}],
        "id": 6
    })");
    EXPECT_EQ(pointers(doc, "$..id"), (Pointers{
        "/a/id",
        "/a/kids/0/id",
        "/a/kids/1/id",
        "/a/kids/1/kids/0/id",
        "/b/0/id",
        "/id"
    }));
}

TEST(PathRecursive, WildcardListsWholeTreeDepthFirst) {
    Value doc = Value::parse(R"({"a": {"x": 1}, "b": [2, {"y": 3}]})");
    EXPECT_EQ(pointers(doc, "$..*"), (Pointers{
        "/a", "/a/x", "/b", "/b/0", "/b/1", "/b/1/y"
    }));
}

TEST(PathRecursive, IndexSelectorPerArray) {
    Value doc = Value::parse(R"({"l": [[1, 2], [3, 4]]})");
    EXPECT_EQ(pointers(doc, "$..[0]"), (Pointers{"/l/0", "/l/0/0", "/l/1/0"}));
}

TEST(PathRecursive, DuplicateLocationsReportedOnce) {
    Value doc = Value::parse(R"({"a": {"b": {"x": 1}}})");
    // "/a/b/x" is reachable from both "/a" and "/a/b"
    EXPECT_EQ(pointers(doc, "$..*..x"), Pointers{"/a/b/x"});
}

TEST(PathRecursive, RecursiveThenMember) {
    Value doc = Value::parse(R"({"orders": [{"lines": [{"sku": "x"}]}, {"lines": []}]})");
    EXPECT_EQ(pointers(doc, "$..lines[*].sku"), Pointers{"/orders/0/lines/0/sku"});
}

TEST(PathRecursive, NoMatchIsEmpty) {
    Value doc = Value::parse(R"({"a": [1, 2, {"b": 3}]})");
    EXPECT_TRUE(pointers(doc, "$..zzz").empty());
}

// ============================================================================
// Filters
// ============================================================================

class PathFilterTest : public ::testing::Test {
protected:
    Value doc = Value::parse(R"({
        "items": [
            {"sku": "a", "qty": 0, "price": 100, "meta": {"flag": true}},
            {"sku": "b", "qty": 3, "price": 250},
            {"sku": "c", "qty": "3", "price": 75},
            {"sku": "d", "price": null}
        ]
    })");
};

TEST_F(PathFilterTest, NumericComparison) {
    EXPECT_EQ(pointers(doc, "$.items[?(@.qty > 0)].sku"), Pointers{"/items/1/sku"});
}

TEST_F(PathFilterTest, NoCoercionBetweenStringAndNumber) {
    // item "c" has qty "3" (string) and must not match the number 3
    EXPECT_EQ(pointers(doc, "$.items[?(@.qty == 3)]"), Pointers{"/items/1"});
    EXPECT_EQ(pointers(doc, "$.items[?(@.qty == '3')]"), Pointers{"/items/2"});
}

TEST_F(PathFilterTest, StringEquality) {
    EXPECT_EQ(pointers(doc, "$.items[?(@.sku == \"d\")]"), Pointers{"/items/3"});
}

TEST_F(PathFilterTest, NullLiteral) {
    EXPECT_EQ(pointers(doc, "$.items[?(@.price == null)].sku"), Pointers{"/items/3/sku"});
}

TEST_F(PathFilterTest, NestedField) {
    EXPECT_EQ(pointers(doc, "$.items[?(@.meta.flag == true)].sku"), Pointers{"/items/0/sku"});
}

TEST_F(PathFilterTest, ExistenceTest) {
    EXPECT_EQ(pointers(doc, "$.items[?(@.qty)].sku"),
              (Pointers{"/items/0/sku", "/items/1/sku", "/items/2/sku"}));
}

TEST_F(PathFilterTest, NotEqualSkipsOtherTypes) {
    // "c" (string qty) and "d" (no qty) are not selected
    EXPECT_EQ(pointers(doc, "$.items[?(@.qty != 0)].sku"), Pointers{"/items/1/sku"});
}

TEST_F(PathFilterTest, FilterOverObjectMembers) {
    Value obj = Value::parse(R"({"users": {"u1": {"age": 30}, "u2": {"age": 12}}})");
    EXPECT_EQ(pointers(obj, "$.users[?(@.age >= 18)]"), Pointers{"/users/u1"});
}

TEST_F(PathFilterTest, FilterOnChildItself) {
    Value arr = Value::parse(R"({"n": [1, 5, "7", 9]})");
    EXPECT_EQ(pointers(arr, "$.n[?(@ > 4)]"), (Pointers{"/n/1", "/n/3"}));
}

TEST_F(PathFilterTest, RecursiveFilter) {
    Value tree = Value::parse(R"({"a": [{"t": "x", "v": 1}], "b": {"c": [{"t": "x", "v": 2}]}})");
    EXPECT_EQ(pointers(tree, "$..[?(@.t == 'x')].v"), (Pointers{"/a/0/v", "/b/c/0/v"}));
}

// ============================================================================
// Syntax errors
// ============================================================================

TEST(PathSyntax, RejectsMalformedExpressions) {
    EXPECT_THROW(PathExpr::compile(""), PathSyntaxError);
    EXPECT_THROW(PathExpr::compile("$.items["), PathSyntaxError);
    EXPECT_THROW(PathExpr::compile("$.items[abc]"), PathSyntaxError);
    EXPECT_THROW(PathExpr::compile("$."), PathSyntaxError);
    EXPECT_THROW(PathExpr::compile("$x"), PathSyntaxError);
    EXPECT_THROW(PathExpr::compile("$['open"), PathSyntaxError);
    EXPECT_THROW(PathExpr::compile("$[?(@.a ~ 1)]"), PathSyntaxError);
    EXPECT_THROW(PathExpr::compile("$[?(a == 1)]"), PathSyntaxError);
    EXPECT_THROW(PathExpr::compile("$[?(@.a == [1])]"), PathSyntaxError);
    EXPECT_THROW(PathExpr::compile("$[?(@.a < true)]"), PathSyntaxError);
}

TEST(PathSyntax, ErrorCarriesPosition) {
    try {
        PathExpr::compile("$.a[zz]");
        FAIL() << "Expected PathSyntaxError";
    } catch (const PathSyntaxError& e) {
        EXPECT_EQ(e.path(), "$.a[zz]");
        EXPECT_EQ(e.position(), 4u);
    }
}

TEST(PathSyntax, CompiledExpressionKeepsText) {
    auto expr = PathExpr::compile("$..code");
    EXPECT_EQ(expr.text(), "$..code");
    ASSERT_EQ(expr.segments().size(), 1u);
    EXPECT_TRUE(expr.segments()[0].recursive);
}

// ============================================================================
// Slots
// ============================================================================

TEST(SlotAccess, WriteThroughSlot) {
    Value doc = Value::parse(R"({"a": {"b": [1, 2]}})");
    auto slots = resolve(doc, "$.a.b[1]");
    ASSERT_EQ(slots.size(), 1u);
    EXPECT_EQ(slots[0].value(), 2);
    slots[0].set("two");
    EXPECT_EQ(doc["a"]["b"][1], "two");
}

TEST(SlotAccess, AddressStableAcrossWrites) {
    Value doc = Value::parse(R"({"x": 1, "y": 2})");
    auto slots = resolve(doc, "$.x");
    ASSERT_EQ(slots.size(), 1u);
    slots[0].set(Value::array({1, 2, 3}));
    slots[0].set("again");
    EXPECT_EQ(slots[0].value(), "again");
    EXPECT_EQ(doc.dump(), R"({"x":"again","y":2})");
}

TEST(SlotAccess, IsWithin) {
    Value doc = Value::parse(R"({"a": {"b": 1}, "ab": 2})");
    auto a = resolve(doc, "$.a")[0];
    auto ab = resolve(doc, "$.a.b")[0];
    auto sibling = resolve(doc, "$.ab")[0];
    auto root = resolve(doc, "$")[0];

    EXPECT_TRUE(ab.is_within(a));
    EXPECT_TRUE(a.is_within(a));
    EXPECT_FALSE(sibling.is_within(a));
    EXPECT_TRUE(sibling.is_within(root));
    EXPECT_FALSE(a.is_within(ab));
}
