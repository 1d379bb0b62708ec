#include <gtest/gtest.h>

#include <limits>
#include <string>
#include <vector>

#include "bff/eval/errors.hpp"
#include "bff/eval/operators.hpp"

using bff::EvaluationError;
using bff::SourceRange;
using bff::StructMember;
using bff::Value;

namespace
{

Value strings(std::vector<std::string> items)
{
  std::vector<Value> values;
  for (auto & s : items) {
    values.push_back(Value::make_string(std::move(s)));
  }
  return Value::make_array(std::move(values));
}

std::string add_error(Value existing, const Value & rhs)
{
  try {
    bff::add_in_place(existing, rhs, SourceRange{});
  } catch (const EvaluationError & e) {
    return e.what();
  }
  return "";
}

std::string subtract_error(Value existing, const Value & rhs)
{
  try {
    bff::subtract_in_place(existing, rhs, SourceRange{});
  } catch (const EvaluationError & e) {
    return e.what();
  }
  return "";
}

}  // namespace

TEST(EvalOperators, AddsScalars)
{
  Value i = Value::make_integer(2);
  bff::add_in_place(i, Value::make_integer(3), {});
  EXPECT_EQ(i.as_integer(), 5);

  Value s = Value::make_string("ab");
  bff::add_in_place(s, Value::make_string("cd"), {});
  EXPECT_EQ(s.as_string(), "abcd");
}

TEST(EvalOperators, IntegerArithmeticWraps)
{
  Value i = Value::make_integer(std::numeric_limits<int32_t>::max());
  bff::add_in_place(i, Value::make_integer(1), {});
  EXPECT_EQ(i.as_integer(), std::numeric_limits<int32_t>::min());
}

TEST(EvalOperators, AppendsToArrays)
{
  Value a = Value::make_array();
  bff::add_in_place(a, Value::make_string("x"), {});
  bff::add_in_place(a, strings({"y", "z"}), {});
  EXPECT_EQ(a, strings({"x", "y", "z"}));
}

TEST(EvalOperators, MergesStructsWithRhsWinning)
{
  Value lhs = Value::make_struct(
    {StructMember{"A", Value::make_integer(1), {}}, StructMember{"B", Value::make_integer(2), {}}});
  const Value rhs = Value::make_struct(
    {StructMember{"B", Value::make_integer(20), {}}, StructMember{"C", Value::make_integer(3), {}}});
  bff::add_in_place(lhs, rhs, {});

  ASSERT_EQ(lhs.members().size(), 3U);
  EXPECT_EQ(lhs.find_member("A")->value.as_integer(), 1);
  EXPECT_EQ(lhs.find_member("B")->value.as_integer(), 20);
  EXPECT_EQ(lhs.find_member("C")->value.as_integer(), 3);
}

TEST(EvalOperators, SubtractsEveryOccurrence)
{
  Value s = Value::make_string("a-b-a");
  bff::subtract_in_place(s, Value::make_string("a"), {});
  EXPECT_EQ(s.as_string(), "-b-");

  Value a = strings({"x", "y", "x"});
  bff::subtract_in_place(a, Value::make_string("x"), {});
  EXPECT_EQ(a, strings({"y"}));

  Value empty = Value::make_array();
  bff::subtract_in_place(empty, Value::make_integer(1), {});
  EXPECT_TRUE(empty.as_array().empty());
}

TEST(EvalOperators, TypeErrors)
{
  EXPECT_EQ(
    add_error(Value::make_string("a"), Value::make_integer(1)),
    "Cannot add an Integer to a String. Can only add a String.");
  EXPECT_EQ(
    add_error(Value::make_integer(1), Value::make_string("a")),
    "Cannot add a String to an Integer. Can only add an Integer.");
  EXPECT_EQ(add_error(Value::make_bool(true), Value::make_bool(true)), "Cannot add to a Boolean.");
  EXPECT_EQ(
    add_error(strings({"a"}), Value::make_struct()),
    "Cannot add a Struct to an Array of Strings. Can only add a String or an Array of Strings.");
  EXPECT_EQ(
    add_error(Value::make_array(), Value::make_integer(1)),
    "Cannot add an Integer to an Array. Can only add a String, a Struct, or an Array.");
  EXPECT_EQ(
    subtract_error(Value::make_struct(), Value::make_struct()), "Cannot subtract from a Struct.");
  EXPECT_EQ(
    subtract_error(strings({"a"}), Value::make_integer(1)),
    "Cannot subtract an Integer from an Array of Strings. Can only subtract a String.");
}
