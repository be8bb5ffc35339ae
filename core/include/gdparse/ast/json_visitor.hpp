// gdparse/ast/json_visitor.hpp - JSON serialization for syntax tree nodes
#pragma once

#include <nlohmann/json.hpp>

#include "gdparse/ast/ast.hpp"

namespace gdparse
{

/**
 * Serialize any syntax tree node to JSON.
 *
 * Every object carries "type" (the node class name) and "range"
 * ({"start", "end"} byte offsets), plus the node's own fields. Optional
 * children are omitted when absent.
 */
[[nodiscard]] nlohmann::json to_json(const AstNode * node);

[[nodiscard]] nlohmann::json to_json(const ScriptFile * file);

}  // namespace gdparse
