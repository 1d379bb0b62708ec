#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "bff/eval/value.hpp"

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

}  // namespace

TEST(EvalValue, TypeNamesCarryArticles)
{
  EXPECT_EQ(bff::type_name_a(Value::make_bool(true)), "a Boolean");
  EXPECT_EQ(bff::type_name_a(Value::make_integer(1)), "an Integer");
  EXPECT_EQ(bff::type_name_a(Value::make_string("x")), "a String");
  EXPECT_EQ(bff::type_name_a(Value::make_struct()), "a Struct");
  EXPECT_EQ(bff::type_name_a(strings({"a"})), "an Array");
  EXPECT_EQ(bff::type_name_a_detailed(strings({"a"})), "an Array of Strings");
  EXPECT_EQ(bff::type_name_a_detailed(Value::make_array()), "an Array");
}

TEST(EvalValue, StructEqualityIgnoresMemberOrder)
{
  const Value a = Value::make_struct(
    {StructMember{"A", Value::make_integer(1), {}}, StructMember{"B", Value::make_string("b"), {}}});
  const Value b = Value::make_struct(
    {StructMember{"B", Value::make_string("b"), {7}}, StructMember{"A", Value::make_integer(1), {}}});
  const Value c = Value::make_struct({StructMember{"A", Value::make_integer(2), {}}});

  EXPECT_EQ(a, b);
  EXPECT_NE(a, c);
}

TEST(EvalValue, ArrayEqualityIsOrdered)
{
  EXPECT_EQ(strings({"a", "b"}), strings({"a", "b"}));
  EXPECT_NE(strings({"a", "b"}), strings({"b", "a"}));
}

TEST(EvalValue, ScalarsRenderAsJson)
{
  EXPECT_EQ(bff::value_to_string(Value::make_bool(false)), "false");
  EXPECT_EQ(bff::value_to_string(Value::make_integer(-3)), "-3");
  EXPECT_EQ(bff::value_to_string(Value::make_string("say \"hi\"")), "\"say \\\"hi\\\"\"");
}

TEST(EvalValue, BackslashesAreNotDoubled)
{
  EXPECT_EQ(bff::value_to_string(Value::make_string("C:\\Tools")), "\"C:\\Tools\"");
}

TEST(EvalValue, ArraysAndStructsRenderOnePerLine)
{
  EXPECT_EQ(bff::value_to_string(Value::make_array()), "{}");
  EXPECT_EQ(bff::value_to_string(Value::make_struct()), "[]");
  EXPECT_EQ(bff::value_to_string(strings({"a", "b"})), "{\n    \"a\"\n    \"b\"\n}");

  const Value inner = Value::make_struct({StructMember{"Flag", Value::make_bool(true), {}}});
  const Value outer = Value::make_struct(
    {StructMember{"Name", Value::make_string("x"), {}}, StructMember{"Inner", inner, {}}});
  EXPECT_EQ(
    bff::value_to_string(outer),
    "[\n"
    "    .Name = \"x\"\n"
    "    .Inner = [\n"
    "        .Flag = true\n"
    "    ]\n"
    "]");
}

TEST(EvalValue, InterpolatedStrings)
{
  EXPECT_EQ(bff::to_interpolated_string(Value::make_string("x")).value_or("<none>"), "x");
  EXPECT_EQ(bff::to_interpolated_string(Value::make_integer(42)).value_or("<none>"), "42");
  EXPECT_EQ(bff::to_interpolated_string(Value::make_bool(true)).value_or("<none>"), "true");
  EXPECT_EQ(bff::to_interpolated_string(strings({"a", "b"})).value_or("<none>"), "a,b");
  EXPECT_FALSE(bff::to_interpolated_string(Value::make_struct()).has_value());

  const Value structs = Value::make_array({Value::make_struct()});
  EXPECT_FALSE(bff::to_interpolated_string(structs).has_value());
}
