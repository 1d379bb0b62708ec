// bff/ast/json_visitor.cpp - JSON serialization implementation
//
#include "bff/ast/json_visitor.hpp"

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>
#include <string_view>

#include "bff/ast/ast.hpp"
#include "bff/ast/ast_enums.hpp"
#include "bff/ast/visitor.hpp"
#include "bff/basic/source_manager.hpp"

namespace bff
{
namespace
{

using nlohmann::json;

// ============================================================================
// Helper functions
// ============================================================================

json j_range(SourceRange r)
{
  if (r.is_invalid()) {
    return json{{"start", nullptr}, {"end", nullptr}};
  }
  return json{{"start", r.get_begin().offset()}, {"end", r.get_end().offset()}};
}

json j_node(const AstNode * n)
{
  return json{{"type", std::string(to_string(n->get_kind()))}, {"range", j_range(n->get_range())}};
}

// ============================================================================
// JsonBuilder
// ============================================================================

class JsonBuilder : public ConstAstVisitor<JsonBuilder, json>
{
public:
  template <typename T>
  json list(gsl::span<T *> nodes)
  {
    json arr = json::array();
    for (const T * n : nodes) {
      arr.push_back(visit(n));
    }
    return arr;
  }

  // --- values ---------------------------------------------------------------

  json visit_bool_literal(const BoolLiteral * n)
  {
    json j = j_node(n);
    j["value"] = n->value;
    return j;
  }

  json visit_int_literal(const IntLiteral * n)
  {
    json j = j_node(n);
    j["value"] = n->value;
    return j;
  }

  json visit_string_literal(const StringLiteral * n)
  {
    json j = j_node(n);
    j["value"] = std::string(n->value);
    return j;
  }

  json visit_string_template(const StringTemplate * n)
  {
    json j = j_node(n);
    json parts = json::array();
    for (const auto & part : n->parts) {
      parts.push_back(json{
        {part.isVariable ? "variable" : "text", std::string(part.text)},
        {"range", j_range(part.range)}});
    }
    j["parts"] = std::move(parts);
    return j;
  }

  json visit_evaluated_var(const EvaluatedVar * n)
  {
    json j = j_node(n);
    j["scope"] = std::string(to_string(n->scope));
    j["name"] = visit(n->name);
    return j;
  }

  json visit_array_literal(const ArrayLiteral * n)
  {
    json j = j_node(n);
    j["items"] = list(n->items);
    return j;
  }

  json visit_conditional_items(const ConditionalItems * n)
  {
    json j = j_node(n);
    j["condition"] = visit(n->condition);
    j["then"] = list(n->thenItems);
    j["else"] = list(n->elseItems);
    return j;
  }

  json visit_struct_literal(const StructLiteral * n)
  {
    json j = j_node(n);
    j["statements"] = list(n->statements);
    return j;
  }

  json visit_sum(const SumExpr * n)
  {
    json j = j_node(n);
    j["first"] = visit(n->first);
    json summands = json::array();
    for (const auto & s : n->summands) {
      summands.push_back(json{{"operator", std::string(to_string(s.op))}, {"value", visit(s.value)}});
    }
    j["summands"] = std::move(summands);
    return j;
  }

  // --- conditions -----------------------------------------------------------

  json visit_bool_cond(const BoolCond * n)
  {
    json j = j_node(n);
    j["value"] = visit(n->value);
    return j;
  }

  json visit_compare_cond(const CompareCond * n)
  {
    json j = j_node(n);
    j["operator"] = std::string(to_string(n->op));
    j["lhs"] = visit(n->lhs);
    j["rhs"] = visit(n->rhs);
    return j;
  }

  json visit_in_cond(const InCond * n)
  {
    json j = j_node(n);
    j["operator"] = n->negated ? "not in" : "in";
    j["lhs"] = visit(n->lhs);
    j["rhs"] = visit(n->rhs);
    return j;
  }

  json visit_not_cond(const NotCond * n)
  {
    json j = j_node(n);
    j["operand"] = visit(n->operand);
    return j;
  }

  json visit_logical_cond(const LogicalCond * n)
  {
    json j = j_node(n);
    j["operator"] = std::string(to_string(n->op));
    j["lhs"] = visit(n->lhs);
    j["rhs"] = visit(n->rhs);
    return j;
  }

  json visit_symbol_cond(const SymbolCond * n)
  {
    json j = j_node(n);
    j["symbol"] = std::string(n->symbol);
    return j;
  }

  json visit_env_exists_cond(const EnvExistsCond * n)
  {
    json j = j_node(n);
    j["variable"] = std::string(n->variable);
    return j;
  }

  json visit_file_exists_cond(const FileExistsCond * n)
  {
    json j = j_node(n);
    j["path"] = visit(n->path);
    return j;
  }

  // --- statements -----------------------------------------------------------

  json visit_assignment_stmt(const AssignmentStmt * n)
  {
    json j = j_node(n);
    j["lhs"] = visit(n->lhs);
    j["rhs"] = visit(n->rhs);
    return j;
  }

  json visit_operator_stmt(const OperatorStmt * n)
  {
    json j = j_node(n);
    j["lhs"] = visit(n->lhs);
    j["operator"] = std::string(to_string(n->op));
    j["rhs"] = visit(n->rhs);
    return j;
  }

  json visit_unnamed_operator_stmt(const UnnamedOperatorStmt * n)
  {
    json j = j_node(n);
    j["operator"] = std::string(to_string(n->op));
    j["rhs"] = visit(n->rhs);
    return j;
  }

  json visit_scoped_block_stmt(const ScopedBlockStmt * n)
  {
    json j = j_node(n);
    j["statements"] = list(n->statements);
    return j;
  }

  json visit_using_stmt(const UsingStmt * n)
  {
    json j = j_node(n);
    j["struct"] = visit(n->operand);
    return j;
  }

  json visit_for_each_stmt(const ForEachStmt * n)
  {
    json j = j_node(n);
    json iterators = json::array();
    for (const auto & it : n->iterators) {
      iterators.push_back(json{{"loopVar", visit(it.loopVar)}, {"array", visit(it.array)}});
    }
    j["iterators"] = std::move(iterators);
    j["body"] = list(n->body);
    return j;
  }

  json visit_if_stmt(const IfStmt * n)
  {
    json j = j_node(n);
    j["condition"] = visit(n->condition);
    j["body"] = list(n->body);
    return j;
  }

  json visit_generic_function_stmt(const GenericFunctionStmt * n)
  {
    json j = j_node(n);
    j["function"] = std::string(n->functionName);
    j["targetName"] = n->targetName ? visit(n->targetName) : json(nullptr);
    j["body"] = list(n->body);
    return j;
  }

  json visit_print_stmt(const PrintStmt * n)
  {
    json j = j_node(n);
    j["value"] = visit(n->value);
    return j;
  }

  json visit_error_stmt(const ErrorStmt * n)
  {
    json j = j_node(n);
    j["value"] = visit(n->value);
    return j;
  }

  json visit_user_function_decl_stmt(const UserFunctionDeclStmt * n)
  {
    json j = j_node(n);
    j["name"] = std::string(n->name);
    json params = json::array();
    for (const auto & p : n->params) {
      params.push_back(json{{"name", std::string(p.name)}, {"range", j_range(p.range)}});
    }
    j["params"] = std::move(params);
    j["body"] = list(n->body);
    return j;
  }

  json visit_user_function_call_stmt(const UserFunctionCallStmt * n)
  {
    json j = j_node(n);
    j["name"] = std::string(n->name);
    j["args"] = list(n->args);
    return j;
  }

  json visit_include_directive(const IncludeDirective * n)
  {
    json j = j_node(n);
    j["path"] = visit(n->path);
    return j;
  }

  json visit_once_directive(const OnceDirective * n) { return j_node(n); }

  json visit_if_directive(const IfDirective * n)
  {
    json j = j_node(n);
    j["condition"] = visit(n->condition);
    j["then"] = list(n->thenBody);
    j["else"] = list(n->elseBody);
    return j;
  }

  json visit_define_directive(const DefineDirective * n)
  {
    json j = j_node(n);
    j["symbol"] = std::string(n->symbol);
    return j;
  }

  json visit_undef_directive(const UndefDirective * n)
  {
    json j = j_node(n);
    j["symbol"] = std::string(n->symbol);
    return j;
  }

  json visit_import_directive(const ImportDirective * n)
  {
    json j = j_node(n);
    j["variable"] = std::string(n->variable);
    return j;
  }

  json visit_program(const Program * n)
  {
    json j = j_node(n);
    j["statements"] = list(n->statements);
    return j;
  }
};

}  // namespace

json to_json(const AstNode * node)
{
  if (node == nullptr) {
    return nullptr;
  }
  JsonBuilder builder;
  return builder.visit(node);
}

json to_json(const Program * program) { return to_json(static_cast<const AstNode *>(program)); }

}  // namespace bff
