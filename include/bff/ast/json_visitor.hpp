// bff/ast/json_visitor.hpp - JSON serialization for AST nodes
//
// Provides a visitor-based JSON serialization for the AST, returning
// nlohmann::json objects. Used by `bffc parse`.
//
#pragma once

#include <nlohmann/json.hpp>

#include "bff/ast/ast.hpp"

namespace bff
{

/**
 * Serialize an AST node (and its subtree) to JSON.
 *
 * Every object carries a "type" (the NodeKind name) and a "range" with the
 * byte offsets of the node.
 */
[[nodiscard]] nlohmann::json to_json(const AstNode * node);

/**
 * Serialize a Program node including all its statements.
 */
[[nodiscard]] nlohmann::json to_json(const Program * program);

}  // namespace bff
