#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "bff/test_support/eval_helpers.hpp"

using bff::DefinitionId;
using bff::EvaluationOptions;
using bff::FatalErrorKind;
using bff::Platform;
using bff::ReferenceKind;
using bff::Value;
using bff::test_support::evaluate;
using bff::test_support::make_range;

TEST(EvalPreprocessor, DefineRecordsADefinitionAndIfReadsIt)
{
  const auto ev = evaluate(
    "#define MY_DEFINE\n"
    "#if MY_DEFINE\n"
    ".A = 1\n"
    "#endif\n");
  ASSERT_TRUE(ev->ok()) << ev->error_message();
  const auto & data = ev->data();

  ASSERT_EQ(data.variableDefinitions.size(), 2U);
  EXPECT_EQ(data.variableDefinitions[0].name, "MY_DEFINE");
  EXPECT_EQ(data.variableDefinitions[0].range, make_range(0, 0, 0, 17));

  ASSERT_GE(data.variableReferences.size(), 2U);
  EXPECT_EQ(data.variableReferences[0].kind, ReferenceKind::Write);
  EXPECT_EQ(data.variableReferences[0].range, make_range(0, 0, 0, 17));
  EXPECT_EQ(data.variableReferences[1].kind, ReferenceKind::Read);
  EXPECT_EQ(data.variableReferences[1].range, make_range(1, 4, 1, 13));
  EXPECT_EQ(data.variableReferences[1].definitions, std::vector<DefinitionId>{1});

  EXPECT_EQ(ev->values().size(), 1U);
}

TEST(EvalPreprocessor, ElseBranchRunsWhenUndefined)
{
  const auto ev = evaluate(
    "#if MISSING\n"
    ".A = 'then'\n"
    "#else\n"
    ".A = 'else'\n"
    "#endif\n");
  ASSERT_TRUE(ev->ok()) << ev->error_message();
  ASSERT_EQ(ev->values().size(), 1U);
  EXPECT_EQ(ev->values()[0], Value::make_string("else"));
}

TEST(EvalPreprocessor, SkippedBranchesAreNotEvaluated)
{
  const auto ev = evaluate(
    "#if MISSING\n"
    ".A = .Undefined\n"
    "#endif\n");
  ASSERT_TRUE(ev->ok()) << ev->error_message();
  EXPECT_TRUE(ev->data().variableReferences.empty());
}

TEST(EvalPreprocessor, DefiningTwiceWarns)
{
  const auto ev = evaluate(
    "#define X\n"
    "#define X\n"
    "#define __LINUX__\n");
  ASSERT_TRUE(ev->ok()) << ev->error_message();
  const auto warnings = ev->warning_messages();
  ASSERT_EQ(warnings.size(), 2U);
  EXPECT_EQ(warnings[0], "Cannot #define already defined symbol \"X\".");
  EXPECT_EQ(warnings[1], "Cannot #define already defined symbol \"__LINUX__\".");

  const auto & first = ev->result.warnings.all()[0];
  ASSERT_EQ(first.labels.size(), 2U);
  EXPECT_EQ(first.labels[1].message, "Defined here");
}

TEST(EvalPreprocessor, UndefRemovesTheSymbol)
{
  const auto ev = evaluate(
    "#define X\n"
    "#undef X\n"
    "#if X\n"
    ".A = 1\n"
    "#endif\n");
  ASSERT_TRUE(ev->ok()) << ev->error_message();
  EXPECT_TRUE(ev->values().empty());
  EXPECT_EQ(ev->data().variableReferences.size(), 1U);
}

TEST(EvalPreprocessor, UndefErrors)
{
  const auto builtin = evaluate("#undef __LINUX__\n");
  ASSERT_FALSE(builtin->ok());
  EXPECT_EQ(builtin->error_message(), "Cannot #undef built-in symbol \"__LINUX__\".");
  EXPECT_EQ(builtin->error_range(), make_range(0, 0, 0, 16));

  const auto undefined = evaluate("#undef X\n");
  ASSERT_FALSE(undefined->ok());
  EXPECT_EQ(undefined->error_message(), "Cannot #undef undefined symbol \"X\".");
}

TEST(EvalPreprocessor, PlatformSymbolFollowsTheOptions)
{
  const std::string src =
    "#if __WINDOWS__\n"
    ".A = 'windows'\n"
    "#endif\n"
    "#if __LINUX__\n"
    ".A = 'linux'\n"
    "#endif\n";

  const auto linux_ev = evaluate(src);
  ASSERT_EQ(linux_ev->values().size(), 1U);
  EXPECT_EQ(linux_ev->values()[0], Value::make_string("linux"));

  const auto windows_ev = evaluate(src, {}, EvaluationOptions{Platform::Windows, {}});
  ASSERT_EQ(windows_ev->values().size(), 1U);
  EXPECT_EQ(windows_ev->values()[0], Value::make_string("windows"));
}

TEST(EvalPreprocessor, LogicalOperators)
{
  const auto ev = evaluate(
    "#define A\n"
    "#if !__LINUX__ || (A && !B)\n"
    ".Taken = true\n"
    "#endif\n");
  ASSERT_TRUE(ev->ok()) << ev->error_message();
  EXPECT_EQ(ev->values().size(), 1U);
}

TEST(EvalPreprocessor, ImportUsesAPlaceholderValue)
{
  const auto ev = evaluate(
    "#import HOME\n"
    ".A = .HOME\n",
    {}, EvaluationOptions{Platform::Linux, {{"HOME", "/home/me"}}});
  ASSERT_TRUE(ev->ok()) << ev->error_message();
  const auto & data = ev->data();

  EXPECT_EQ(ev->values().back(), Value::make_string("placeholder-HOME-value"));
  ASSERT_EQ(data.variableDefinitions.size(), 2U);
  EXPECT_EQ(data.variableDefinitions[0].range, make_range(0, 0, 0, 12));
  EXPECT_EQ(data.variableReferences[0].kind, ReferenceKind::Write);
}

TEST(EvalPreprocessor, ImportOfAMissingVariableFails)
{
  const auto ev = evaluate("#import NOPE\n");
  ASSERT_FALSE(ev->ok());
  EXPECT_EQ(
    ev->error_message(), "Cannot import environment variable \"NOPE\" because it does not exist.");
  EXPECT_EQ(ev->error_range(), make_range(0, 0, 0, 12));
}

TEST(EvalPreprocessor, ExistsChecksTheEnvironment)
{
  const std::string src =
    "#if exists( HOME )\n"
    ".A = 1\n"
    "#endif\n";

  EXPECT_TRUE(evaluate(src)->values().empty());
  EXPECT_EQ(
    evaluate(src, {}, EvaluationOptions{Platform::Linux, {{"HOME", "/h"}}})->values().size(), 1U);
}

TEST(EvalPreprocessor, FileExistsIsRelativeToTheCurrentFile)
{
  const auto ev = evaluate(
    "#if file_exists( 'sub/x.bff' )\n"
    ".A = 1\n"
    "#endif\n"
    "#if file_exists( 'missing.bff' )\n"
    ".B = 1\n"
    "#endif\n",
    {{"file:///project/sub/x.bff", ""}});
  ASSERT_TRUE(ev->ok()) << ev->error_message();
  EXPECT_EQ(ev->values().size(), 1U);
}

// ============================================================================
// Includes
// ============================================================================

TEST(EvalInclude, IncludedFilesShareTheScope)
{
  const auto ev = evaluate(
    "#include 'sub/helper.bff'\n"
    ".B = .A\n",
    {{"file:///project/sub/helper.bff", ".A = 'from helper'\n"}});
  ASSERT_TRUE(ev->ok()) << ev->error_message();
  const auto & data = ev->data();

  EXPECT_EQ(ev->values().back(), Value::make_string("from helper"));

  ASSERT_EQ(data.includeReferences.size(), 1U);
  EXPECT_EQ(data.includeReferences[0].includeUri, "file:///project/sub/helper.bff");
  EXPECT_EQ(data.includeReferences[0].range, make_range(0, 9, 0, 25));
  ASSERT_EQ(data.includeDefinitions.size(), 1U);

  ASSERT_FALSE(data.variableDefinitions.empty());
  EXPECT_EQ(data.variableDefinitions[0].range.uri, "file:///project/sub/helper.bff");
}

TEST(EvalInclude, CurrentBffDirIsRelativeToTheRoot)
{
  const auto ev = evaluate(
    "#include 'sub/helper.bff'\n"
    ".Root = ._CURRENT_BFF_DIR_\n",
    {{"file:///project/sub/helper.bff", ".Dir = ._CURRENT_BFF_DIR_\n"}});
  ASSERT_TRUE(ev->ok()) << ev->error_message();

  const auto values = ev->values();
  ASSERT_EQ(values.size(), 4U);
  EXPECT_EQ(values[1], Value::make_string("sub"));
  EXPECT_EQ(values[3], Value::make_string(""));
}

TEST(EvalInclude, NestedIncludesResolveAgainstTheIncludingFile)
{
  const auto ev = evaluate(
    "#include 'sub/a.bff'\n",
    {{"file:///project/sub/a.bff", "#include 'b.bff'\n"},
     {"file:///project/sub/b.bff", ".B = 1\n"}});
  ASSERT_TRUE(ev->ok()) << ev->error_message();
  ASSERT_EQ(ev->data().includeDefinitions.size(), 2U);
  EXPECT_EQ(ev->data().includeDefinitions[1], "file:///project/sub/b.bff");
}

TEST(EvalInclude, OnceSkipsRepeatedIncludes)
{
  const std::string root =
    ".Count = 0\n"
    "#include 'counter.bff'\n"
    "#include 'counter.bff'\n"
    ".Final = .Count\n";

  const auto once = evaluate(root, {{"file:///project/counter.bff", "#once\n.Count + 1\n"}});
  ASSERT_TRUE(once->ok()) << once->error_message();
  EXPECT_EQ(once->values().back(), Value::make_integer(1));
  EXPECT_EQ(once->data().includeReferences.size(), 2U);

  const auto twice = evaluate(root, {{"file:///project/counter.bff", ".Count + 1\n"}});
  ASSERT_TRUE(twice->ok()) << twice->error_message();
  EXPECT_EQ(twice->values().back(), Value::make_integer(2));
}

TEST(EvalInclude, MissingIncludeIsFatal)
{
  const auto ev = evaluate("#include 'missing.bff'\n");
  ASSERT_FALSE(ev->ok());
  EXPECT_EQ(
    ev->error_message(), "Unable to open include: no such file: file:///project/missing.bff");
  EXPECT_EQ(ev->error_range(), make_range(0, 9, 0, 22));
  EXPECT_EQ(ev->result.error->kind, FatalErrorKind::Evaluation);
}

TEST(EvalInclude, SyntaxErrorInAnIncludedFileIsAParseError)
{
  const auto ev = evaluate(
    ".Before = 1\n"
    "#include 'bad.bff'\n",
    {{"file:///project/bad.bff", ".A = \n"}});
  ASSERT_FALSE(ev->ok());
  EXPECT_EQ(ev->result.error->kind, FatalErrorKind::Parse);
  EXPECT_EQ(ev->error_range().uri, "file:///project/bad.bff");
  // Work done before the error is kept.
  EXPECT_EQ(ev->values().size(), 1U);
}
