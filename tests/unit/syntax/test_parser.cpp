#include <gtest/gtest.h>

#include <string>

#include "bff/ast/ast.hpp"
#include "bff/basic/casting.hpp"
#include "bff/test_support/eval_helpers.hpp"

using bff::ArrayLiteral;
using bff::AssignmentStmt;
using bff::CompareCond;
using bff::CompareOp;
using bff::ConditionalItems;
using bff::dyn_cast;
using bff::EvaluatedVar;
using bff::ForEachStmt;
using bff::GenericFunctionStmt;
using bff::IfDirective;
using bff::IfStmt;
using bff::IncludeDirective;
using bff::InCond;
using bff::IntLiteral;
using bff::LogicalCond;
using bff::NotCond;
using bff::OperatorStmt;
using bff::StringLiteral;
using bff::StringTemplate;
using bff::SumExpr;
using bff::SumOp;
using bff::UnnamedOperatorStmt;
using bff::UserFunctionCallStmt;
using bff::UserFunctionDeclStmt;
using bff::VarScope;
using bff::test_support::make_range;
using bff::test_support::parse;

TEST(SyntaxParser, Assignment)
{
  auto unit = parse(".Name = 'value'\n");
  ASSERT_TRUE(unit.diags.empty());
  ASSERT_EQ(unit.program->statements.size(), 1U);

  const auto * stmt = dyn_cast<AssignmentStmt>(unit.program->statements[0]);
  ASSERT_NE(stmt, nullptr);
  EXPECT_EQ(stmt->lhs->scope, VarScope::Current);
  EXPECT_EQ(unit.file_range(stmt->get_range()), make_range(0, 0, 0, 15));
  EXPECT_EQ(unit.slice(stmt->lhs->get_range()), ".Name");
  EXPECT_EQ(unit.slice(stmt->lhs->name->get_range()), "Name");

  const auto * rhs = dyn_cast<StringLiteral>(stmt->rhs);
  ASSERT_NE(rhs, nullptr);
  EXPECT_EQ(rhs->value, "value");
  EXPECT_EQ(unit.slice(rhs->get_range()), "'value'");
}

TEST(SyntaxParser, EscapesAndTemplates)
{
  auto unit = parse(".A = 'x^$y $Name$!'\n");
  ASSERT_TRUE(unit.diags.empty());
  const auto * stmt = dyn_cast<AssignmentStmt>(unit.program->statements[0]);
  const auto * tmpl = dyn_cast<StringTemplate>(stmt->rhs);
  ASSERT_NE(tmpl, nullptr);
  ASSERT_EQ(tmpl->parts.size(), 3U);
  EXPECT_FALSE(tmpl->parts[0].isVariable);
  EXPECT_EQ(tmpl->parts[0].text, "x$y ");
  EXPECT_TRUE(tmpl->parts[1].isVariable);
  EXPECT_EQ(tmpl->parts[1].text, "Name");
  EXPECT_EQ(unit.slice(tmpl->parts[1].range), "$Name$");
  EXPECT_EQ(tmpl->parts[2].text, "!");
}

TEST(SyntaxParser, NegativeIntegersAndParentScope)
{
  auto unit = parse("^Count = -5\n");
  ASSERT_TRUE(unit.diags.empty());
  const auto * stmt = dyn_cast<AssignmentStmt>(unit.program->statements[0]);
  EXPECT_EQ(stmt->lhs->scope, VarScope::Parent);
  const auto * value = dyn_cast<IntLiteral>(stmt->rhs);
  ASSERT_NE(value, nullptr);
  EXPECT_EQ(value->value, -5);
}

TEST(SyntaxParser, SumsStopAtALeadingOperator)
{
  auto unit = parse(
    ".A = 'a' + 'b'\n"
    "   - 'c'\n"
    ".A + 'd'\n");
  ASSERT_TRUE(unit.diags.empty());
  ASSERT_EQ(unit.program->statements.size(), 3U);

  const auto * first = dyn_cast<AssignmentStmt>(unit.program->statements[0]);
  const auto * sum = dyn_cast<SumExpr>(first->rhs);
  ASSERT_NE(sum, nullptr);
  EXPECT_EQ(sum->summands.size(), 1U);

  const auto * unnamed = dyn_cast<UnnamedOperatorStmt>(unit.program->statements[1]);
  ASSERT_NE(unnamed, nullptr);
  EXPECT_EQ(unnamed->op, SumOp::Sub);
  EXPECT_EQ(unit.file_range(unnamed->get_range()), make_range(1, 3, 1, 8));

  const auto * op = dyn_cast<OperatorStmt>(unit.program->statements[2]);
  ASSERT_NE(op, nullptr);
  EXPECT_EQ(op->op, SumOp::Add);
}

TEST(SyntaxParser, ArraysWithConditionalItems)
{
  auto unit = parse(
    ".A = { 'a', 'b'\n"
    "#if __WINDOWS__\n"
    "  'c'\n"
    "#endif\n"
    "}\n");
  ASSERT_TRUE(unit.diags.empty());
  const auto * stmt = dyn_cast<AssignmentStmt>(unit.program->statements[0]);
  const auto * array = dyn_cast<ArrayLiteral>(stmt->rhs);
  ASSERT_NE(array, nullptr);
  ASSERT_EQ(array->items.size(), 3U);
  const auto * items = dyn_cast<ConditionalItems>(array->items[2]);
  ASSERT_NE(items, nullptr);
  EXPECT_EQ(items->thenItems.size(), 1U);
  EXPECT_TRUE(items->elseItems.empty());
}

TEST(SyntaxParser, ForEachWithSeveralIterators)
{
  auto unit = parse("ForEach( .X in .A, .Y in .B )\n{\n}\n");
  ASSERT_TRUE(unit.diags.empty());
  const auto * stmt = dyn_cast<ForEachStmt>(unit.program->statements[0]);
  ASSERT_NE(stmt, nullptr);
  ASSERT_EQ(stmt->iterators.size(), 2U);
  EXPECT_EQ(unit.slice(stmt->iterators[1].loopVar->get_range()), ".Y");
  EXPECT_EQ(unit.file_range(stmt->get_range()), make_range(0, 0, 2, 1));
}

TEST(SyntaxParser, IfConditions)
{
  auto unit = parse(
    "If( .A == 'x' ) {}\n"
    "If( .A not in .B ) {}\n"
    "If( !.Flag && .Other ) {}\n");
  ASSERT_TRUE(unit.diags.empty());
  ASSERT_EQ(unit.program->statements.size(), 3U);

  const auto * compare =
    dyn_cast<CompareCond>(dyn_cast<IfStmt>(unit.program->statements[0])->condition);
  ASSERT_NE(compare, nullptr);
  EXPECT_EQ(compare->op, CompareOp::Eq);
  EXPECT_EQ(unit.slice(compare->opRange), "==");

  const auto * in = dyn_cast<InCond>(dyn_cast<IfStmt>(unit.program->statements[1])->condition);
  ASSERT_NE(in, nullptr);
  EXPECT_TRUE(in->negated);

  const auto * logical =
    dyn_cast<LogicalCond>(dyn_cast<IfStmt>(unit.program->statements[2])->condition);
  ASSERT_NE(logical, nullptr);
  EXPECT_NE(dyn_cast<NotCond>(logical->lhs), nullptr);
}

TEST(SyntaxParser, GenericFunctionRanges)
{
  auto unit = parse(
    "Library( 'Lib' )\n"
    "{\n"
    "  .X = 1\n"
    "}\n"
    "Settings {}\n");
  ASSERT_TRUE(unit.diags.empty());

  const auto * library = dyn_cast<GenericFunctionStmt>(unit.program->statements[0]);
  ASSERT_NE(library, nullptr);
  EXPECT_EQ(library->functionName, "Library");
  EXPECT_EQ(unit.slice(library->headerRange), "Library( 'Lib' )");
  EXPECT_EQ(unit.slice(library->bodyRange), "\n  .X = 1\n");
  ASSERT_NE(library->targetName, nullptr);
  EXPECT_EQ(library->body.size(), 1U);

  const auto * settings = dyn_cast<GenericFunctionStmt>(unit.program->statements[1]);
  ASSERT_NE(settings, nullptr);
  EXPECT_EQ(settings->targetName, nullptr);
  EXPECT_EQ(unit.slice(settings->headerRange), "Settings");
}

TEST(SyntaxParser, UserFunctions)
{
  auto unit = parse(
    "function Build( .Name, .Flags )\n"
    "{\n"
    "}\n"
    "Build( 'a' .B )\n");
  ASSERT_TRUE(unit.diags.empty());

  const auto * decl = dyn_cast<UserFunctionDeclStmt>(unit.program->statements[0]);
  ASSERT_NE(decl, nullptr);
  EXPECT_EQ(decl->name, "Build");
  EXPECT_EQ(unit.file_range(decl->nameRange), make_range(0, 9, 0, 14));
  ASSERT_EQ(decl->params.size(), 2U);
  EXPECT_EQ(decl->params[1].name, "Flags");
  EXPECT_EQ(unit.slice(decl->params[1].range), ".Flags");

  const auto * call = dyn_cast<UserFunctionCallStmt>(unit.program->statements[1]);
  ASSERT_NE(call, nullptr);
  EXPECT_EQ(call->args.size(), 2U);
}

TEST(SyntaxParser, Directives)
{
  auto unit = parse(
    "#include 'sub/a.bff'\n"
    "#if __LINUX__\n"
    "#define X\n"
    "#else\n"
    "#undef X\n"
    "#endif\n");
  ASSERT_TRUE(unit.diags.empty());
  ASSERT_EQ(unit.program->statements.size(), 2U);

  const auto * include = dyn_cast<IncludeDirective>(unit.program->statements[0]);
  ASSERT_NE(include, nullptr);
  EXPECT_EQ(include->path->value, "sub/a.bff");
  EXPECT_EQ(unit.file_range(include->path->get_range()), make_range(0, 9, 0, 20));

  const auto * if_directive = dyn_cast<IfDirective>(unit.program->statements[1]);
  ASSERT_NE(if_directive, nullptr);
  EXPECT_EQ(if_directive->thenBody.size(), 1U);
  EXPECT_EQ(if_directive->elseBody.size(), 1U);
}

// ============================================================================
// Errors
// ============================================================================

TEST(SyntaxParser, MissingValueIsReported)
{
  auto unit = parse(".A =\n");
  ASSERT_TRUE(unit.diags.has_errors());
  const auto * first = unit.diags.first_error();
  ASSERT_NE(first, nullptr);
  EXPECT_EQ(first->message, "expected a value, found end of file");
  EXPECT_EQ(unit.file_range(first->primary_range()), make_range(1, 0, 1, 0));
}

TEST(SyntaxParser, RecoversOnTheNextLine)
{
  auto unit = parse(
    ".A = = 1\n"
    ".B = 2\n"
    ".C = 'unterminated\n");
  EXPECT_EQ(unit.diags.errors().size(), 2U);
  ASSERT_EQ(unit.program->statements.size(), 1U);
  const auto * stmt = dyn_cast<AssignmentStmt>(unit.program->statements[0]);
  ASSERT_NE(stmt, nullptr);
  EXPECT_EQ(unit.slice(stmt->lhs->get_range()), ".B");
  EXPECT_EQ(unit.diags.errors()[1].message, "unterminated string literal");
}

TEST(SyntaxParser, IntegerOutOfRange)
{
  auto unit = parse(".A = 99999999999\n");
  ASSERT_TRUE(unit.diags.has_errors());
  EXPECT_EQ(unit.diags.first_error()->message, "integer literal is out of range");
}
