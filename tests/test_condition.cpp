/**
 * @file test_condition.cpp
 * @brief Unit tests for the condition evaluator (GoogleTest)
 */

#include <gtest/gtest.h>
#include "jmutate/Condition.hpp"

#include <stdexcept>

using namespace jmutate;

// ============================================================================
// Operator names
// ============================================================================

TEST(ConditionOpNames, SymbolicAndWordForms) {
    EXPECT_EQ(parse_condition_op("=="), ConditionOp::Equal);
    EXPECT_EQ(parse_condition_op("eq"), ConditionOp::Equal);
    EXPECT_EQ(parse_condition_op(">="), ConditionOp::GreaterEqual);
    EXPECT_EQ(parse_condition_op("regex"), ConditionOp::Matches);
    EXPECT_EQ(parse_condition_op("starts_with"), ConditionOp::StartsWith);
    EXPECT_EQ(parse_condition_op("isempty"), ConditionOp::IsEmpty);
    EXPECT_FALSE(parse_condition_op("===").has_value());
    EXPECT_FALSE(parse_condition_op("").has_value());
}

// ============================================================================
// Equality
// ============================================================================

TEST(ConditionEquality, SameTypeValues) {
    auto eq = Condition::make(ConditionOp::Equal, "A");
    EXPECT_TRUE(evaluate(eq, "A"));
    EXPECT_FALSE(evaluate(eq, "B"));
}

TEST(ConditionEquality, IntegerAndFloatCompareNumerically) {
    auto eq = Condition::make(ConditionOp::Equal, 1);
    EXPECT_TRUE(evaluate(eq, 1.0));
    EXPECT_FALSE(evaluate(eq, 1.5));
}

TEST(ConditionEquality, NoCoercion) {
    auto eq = Condition::make(ConditionOp::Equal, 5);
    EXPECT_FALSE(evaluate(eq, "5"));
    EXPECT_FALSE(evaluate(eq, true));

    auto eq_true = Condition::make(ConditionOp::Equal, true);
    EXPECT_FALSE(evaluate(eq_true, 1));
    EXPECT_FALSE(evaluate(eq_true, "true"));
}

TEST(ConditionEquality, NotEqualIsFalseOnTypeMismatch) {
    auto ne = Condition::make(ConditionOp::NotEqual, 0);
    EXPECT_TRUE(evaluate(ne, 3));
    EXPECT_FALSE(evaluate(ne, 0));
    EXPECT_FALSE(evaluate(ne, "3"));
    EXPECT_FALSE(evaluate(ne, nullptr));
}

TEST(ConditionEquality, NullOperand) {
    auto eq = Condition::make(ConditionOp::Equal, nullptr);
    EXPECT_TRUE(evaluate(eq, nullptr));
    EXPECT_FALSE(evaluate(eq, 0));
    EXPECT_FALSE(evaluate(eq, ""));
}

TEST(ConditionEquality, ContainerOperands) {
    auto eq = Condition::make(ConditionOp::Equal, Value::array({1, 2}));
    EXPECT_TRUE(evaluate(eq, Value::array({1, 2})));
    EXPECT_FALSE(evaluate(eq, Value::array({2, 1})));
}

// ============================================================================
// Ordering
// ============================================================================

TEST(ConditionOrdering, Numeric) {
    auto gt = Condition::make(ConditionOp::Greater, 0);
    EXPECT_TRUE(evaluate(gt, 5));
    EXPECT_TRUE(evaluate(gt, 0.5));
    EXPECT_FALSE(evaluate(gt, 0));
    EXPECT_FALSE(evaluate(gt, -2));

    auto le = Condition::make(ConditionOp::LessEqual, 10.5);
    EXPECT_TRUE(evaluate(le, 10));
    EXPECT_TRUE(evaluate(le, 10.5));
    EXPECT_FALSE(evaluate(le, 11));
}

TEST(ConditionOrdering, StringNeverComparesWithNumber) {
    auto gt = Condition::make(ConditionOp::Greater, 0);
    EXPECT_FALSE(evaluate(gt, "5"));
    EXPECT_FALSE(evaluate(gt, true));
    EXPECT_FALSE(evaluate(gt, nullptr));
    EXPECT_FALSE(evaluate(gt, Value::array({1})));
}

TEST(ConditionOrdering, Lexical) {
    auto lt = Condition::make(ConditionOp::Less, "m");
    EXPECT_TRUE(evaluate(lt, "apple"));
    EXPECT_FALSE(evaluate(lt, "zebra"));
    EXPECT_FALSE(evaluate(lt, 1));

    auto ge = Condition::make(ConditionOp::GreaterEqual, "2024-01-01");
    EXPECT_TRUE(evaluate(ge, "2024-06-30"));
    EXPECT_FALSE(evaluate(ge, "2023-12-31"));
}

TEST(ConditionOrdering, RejectsNonScalarOperands) {
    EXPECT_THROW(Condition::make(ConditionOp::Less, true), std::invalid_argument);
    EXPECT_THROW(Condition::make(ConditionOp::Greater, nullptr), std::invalid_argument);
    EXPECT_THROW(Condition::make(ConditionOp::Greater, Value::array()), std::invalid_argument);
}

// ============================================================================
// Membership
// ============================================================================

TEST(ConditionMembership, In) {
    auto in = Condition::make(ConditionOp::In, Value::array({"a", "b"}));
    EXPECT_TRUE(evaluate(in, "a"));
    EXPECT_FALSE(evaluate(in, "c"));
    EXPECT_FALSE(evaluate(in, 1));
}

TEST(ConditionMembership, InIsStrict) {
    auto in = Condition::make(ConditionOp::In, Value::array({1, 2, 3}));
    EXPECT_TRUE(evaluate(in, 2));
    EXPECT_TRUE(evaluate(in, 2.0));
    EXPECT_FALSE(evaluate(in, "2"));
}

TEST(ConditionMembership, MixedList) {
    auto in = Condition::make(ConditionOp::In, Value::array({1, "1"}));
    EXPECT_FALSE(in.expected.has_value());
    EXPECT_TRUE(evaluate(in, 1));
    EXPECT_TRUE(evaluate(in, "1"));
    EXPECT_FALSE(evaluate(in, true));
}

TEST(ConditionMembership, NotIn) {
    auto not_in = Condition::make(ConditionOp::NotIn, Value::array({"x", "y"}));
    EXPECT_TRUE(evaluate(not_in, "z"));
    EXPECT_FALSE(evaluate(not_in, "x"));
    // Different category: mismatch, not "absent"
    EXPECT_FALSE(evaluate(not_in, 3));
}

TEST(ConditionMembership, ExplicitTypeMustAgree) {
    EXPECT_NO_THROW(Condition::make(ConditionOp::In, Value::array({1}), Kind::Number));
    EXPECT_THROW(Condition::make(ConditionOp::In, Value::array({1}), Kind::String),
                 std::invalid_argument);
    EXPECT_THROW(Condition::make(ConditionOp::In, "abc"), std::invalid_argument);
}

// ============================================================================
// Text operators
// ============================================================================

TEST(ConditionText, Matches) {
    auto re = Condition::make(ConditionOp::Matches, "^[A-Z]{2}-\\d+$");
    EXPECT_TRUE(evaluate(re, "AB-123"));
    EXPECT_FALSE(evaluate(re, "ab-123"));
    EXPECT_FALSE(evaluate(re, 123));
}

TEST(ConditionText, MatchesSearchesAnywhere) {
    auto re = Condition::make(ConditionOp::Matches, "err");
    EXPECT_TRUE(evaluate(re, "an error occurred"));
}

TEST(ConditionText, InvalidRegexRejectedUpFront) {
    EXPECT_THROW(Condition::make(ConditionOp::Matches, "(unclosed"), std::invalid_argument);
}

TEST(ConditionText, ContainsStartsEnds) {
    EXPECT_TRUE(evaluate(Condition::make(ConditionOp::Contains, "ell"), "hello"));
    EXPECT_FALSE(evaluate(Condition::make(ConditionOp::Contains, "xyz"), "hello"));
    EXPECT_TRUE(evaluate(Condition::make(ConditionOp::StartsWith, "he"), "hello"));
    EXPECT_FALSE(evaluate(Condition::make(ConditionOp::StartsWith, "lo"), "hello"));
    EXPECT_TRUE(evaluate(Condition::make(ConditionOp::EndsWith, "lo"), "hello"));
    EXPECT_FALSE(evaluate(Condition::make(ConditionOp::EndsWith, "hello!"), "hello"));
}

TEST(ConditionText, NonStringValuesAreFalse) {
    EXPECT_FALSE(evaluate(Condition::make(ConditionOp::Contains, "1"), 123));
    EXPECT_FALSE(evaluate(Condition::make(ConditionOp::StartsWith, "t"), true));
    EXPECT_FALSE(evaluate(Condition::make(ConditionOp::Contains, "a"), Value::array({"a"})));
}

TEST(ConditionText, RequiresStringOperand) {
    EXPECT_THROW(Condition::make(ConditionOp::Contains, 1), std::invalid_argument);
    EXPECT_THROW(Condition::make(ConditionOp::Matches, nullptr), std::invalid_argument);
}

// ============================================================================
// Null and emptiness
// ============================================================================

TEST(ConditionNull, IsNull) {
    auto is_null = Condition::make(ConditionOp::IsNull, nullptr);
    EXPECT_TRUE(evaluate(is_null, nullptr));
    EXPECT_FALSE(evaluate(is_null, 0));
    EXPECT_FALSE(evaluate(is_null, ""));

    auto not_null = Condition::make(ConditionOp::IsNull, false);
    EXPECT_TRUE(evaluate(not_null, 0));
    EXPECT_FALSE(evaluate(not_null, nullptr));
}

TEST(ConditionEmpty, IsEmpty) {
    auto is_empty = Condition::make(ConditionOp::IsEmpty, true);
    EXPECT_TRUE(evaluate(is_empty, ""));
    EXPECT_TRUE(evaluate(is_empty, Value::array()));
    EXPECT_TRUE(evaluate(is_empty, Value::object()));
    EXPECT_FALSE(evaluate(is_empty, " "));
    EXPECT_FALSE(evaluate(is_empty, Value::array({0})));
    EXPECT_FALSE(evaluate(is_empty, 0));
    EXPECT_FALSE(evaluate(is_empty, nullptr));
}

TEST(ConditionEmpty, NotEmpty) {
    auto not_empty = Condition::make(ConditionOp::IsEmpty, false);
    EXPECT_TRUE(evaluate(not_empty, "x"));
    EXPECT_FALSE(evaluate(not_empty, ""));
    EXPECT_FALSE(evaluate(not_empty, 5));
}

TEST(ConditionNull, RequiresBooleanOperand) {
    EXPECT_THROW(Condition::make(ConditionOp::IsNull, "yes"), std::invalid_argument);
}

// ============================================================================
// Explicit types
// ============================================================================

TEST(ConditionTypes, ExplicitTypeMatchingOperand) {
    auto eq = Condition::make(ConditionOp::Equal, "5", Kind::String);
    EXPECT_TRUE(evaluate(eq, "5"));
    EXPECT_FALSE(evaluate(eq, 5));
}

TEST(ConditionTypes, ContradictingTypeRejected) {
    EXPECT_THROW(Condition::make(ConditionOp::Equal, "5", Kind::Number), std::invalid_argument);
}
