#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include "bff/eval/json_dump.hpp"
#include "bff/test_support/eval_helpers.hpp"

using bff::StructMember;
using bff::Value;
using bff::test_support::evaluate;

TEST(DumpJson, Values)
{
  EXPECT_EQ(bff::to_json(Value::make_bool(true)), nlohmann::json(true));
  EXPECT_EQ(bff::to_json(Value::make_integer(-2)), nlohmann::json(-2));
  EXPECT_EQ(bff::to_json(Value::make_string("x")), nlohmann::json("x"));

  const Value s = Value::make_struct(
    {StructMember{"B", Value::make_integer(1), {}},
     StructMember{"A", Value::make_array({Value::make_string("a")}), {}}});
  EXPECT_EQ(bff::to_json(s), nlohmann::json::parse(R"({"A": ["a"], "B": 1})"));
}

TEST(DumpJson, EvaluatedData)
{
  const auto ev = evaluate(
    ".Name = 'lib'\n"
    "Alias( '$Name$-all' ) { .Targets = {} }\n");
  ASSERT_TRUE(ev->ok()) << ev->error_message();
  const nlohmann::json j = bff::to_json(ev->data());

  ASSERT_EQ(j["variableDefinitions"].size(), 2U);
  const auto & def = j["variableDefinitions"][0];
  EXPECT_EQ(def["id"], 1);
  EXPECT_EQ(def["name"], "Name");
  EXPECT_EQ(def["range"]["uri"], "file:///project/fbuild.bff");
  EXPECT_EQ(def["range"]["start"]["line"], 0);
  EXPECT_EQ(def["range"]["end"]["character"], 5);

  EXPECT_EQ(j["variableReferences"][0]["kind"], "write");
  EXPECT_EQ(j["evaluatedVariables"][0]["value"], "lib");
  EXPECT_EQ(j["targetDefinitions"][0]["name"], "lib-all");
  EXPECT_EQ(j["genericFunctionBodies"][0]["functionName"], "Alias");
  EXPECT_TRUE(j["includeDefinitions"].is_array());
}

TEST(DumpJson, ResultCarriesErrorAndWarnings)
{
  const auto ev = evaluate(
    "#define X\n"
    "#define X\n"
    ".A = .Missing\n");
  ASSERT_FALSE(ev->ok());
  const nlohmann::json j = bff::to_json(ev->result, ev->provider.sources());

  ASSERT_TRUE(j["error"].is_object());
  EXPECT_EQ(j["error"]["kind"], "eval");
  EXPECT_EQ(j["error"]["range"]["start"]["line"], 2);

  ASSERT_EQ(j["warnings"].size(), 1U);
  EXPECT_EQ(j["warnings"][0]["severity"], "warning");
  ASSERT_EQ(j["warnings"][0]["related"].size(), 1U);
  EXPECT_EQ(j["warnings"][0]["related"][0]["message"], "Defined here");
}

TEST(DumpJson, SuccessfulResultHasNullError)
{
  const auto ev = evaluate(".A = 1\n");
  const nlohmann::json j = bff::to_json(ev->result, ev->provider.sources());
  EXPECT_TRUE(j["error"].is_null());
  EXPECT_TRUE(j["warnings"].empty());
}
