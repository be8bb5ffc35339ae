// gdparse/ast/ast_dumper.hpp - Debug tree output
//
// Renders a parsed script as an indented tree. Single-file mode of the
// driver prints this form; tests compare against it.
//
#pragma once

#include <initializer_list>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "gdparse/ast/ast.hpp"
#include "gdparse/ast/ast_enums.hpp"
#include "gdparse/ast/visitor.hpp"

namespace gdparse
{

// ============================================================================
// AstDumper - Debug tree output
// ============================================================================

/**
 * Dumps syntax tree nodes in a human-readable tree format.
 *
 * @code
 *   ScriptFile
 *   `-Block indent='0'
 *     |-ClassNameDecl name='Player'
 *     `-FunctionDecl name='_ready'
 *       `-Block indent='4'
 *         `-CallExpr callee='print'
 *           `-StringLiteralExpr "hi"
 * @endcode
 */
class AstDumper : public ConstAstVisitor<AstDumper, void>
{
public:
  explicit AstDumper(std::ostream & os) : os_(os) {}

  void dump(const AstNode * node) { visit(node); }

  // ===========================================================================
  // Generic tree printer
  // ===========================================================================

  /// Either {"key", "value"} rendered as key='value', or a bare value
  struct Prop
  {
    std::string_view key;
    std::string value;

    Prop(std::string_view k, std::string_view v) : key(k), value(v) {}
    Prop(std::string_view k, std::string v) : key(k), value(std::move(v)) {}
    Prop(std::string_view k, const char * v) : key(k), value(v) {}

    Prop(std::string_view v) : value(v) {}
    Prop(std::string v) : value(std::move(v)) {}
    Prop(const char * v) : value(v) {}

    Prop(std::string_view k, uint32_t v) : key(k), value(std::to_string(v)) {}
    Prop(std::string_view k, bool v) : key(k), value(v ? "true" : "false") {}
  };

  template <typename... Containers>
  void print_tree(
    std::string_view label, std::initializer_list<Prop> props,
    const Containers &... childContainers)
  {
    print_line(label, props.begin(), props.end());

    std::vector<const AstNode *> all_children;
    (collect_children(all_children, childContainers), ...);
    print_children(all_children);
  }

  /// Overload for conditionally built property lists
  template <typename... Containers>
  void print_tree(
    std::string_view label, const std::vector<Prop> & props, const Containers &... childContainers)
  {
    print_line(label, props.begin(), props.end());

    std::vector<const AstNode *> all_children;
    (collect_children(all_children, childContainers), ...);
    print_children(all_children);
  }

  // ===========================================================================
  // Visit methods
  // ===========================================================================

  void visit_script_file(const ScriptFile * node)
  {
    // The root has no tree marker; its children start at column 0
    os_ << "ScriptFile\n";
    if (node->body) {
      isLast_ = true;
      visit(node->body);
    }
  }

  // --- Supporting nodes ---
  void visit_block(const Block * node)
  {
    print_tree("Block", {{"indent", node->indent}}, node->lines);
  }
  void visit_condition(const Condition * node)
  {
    print_tree("Condition", {}, node->expr, node->body);
  }
  void visit_comment(const Comment * node)
  {
    print_tree("Comment", {{"\"" + std::string(node->text) + "\""}});
  }
  void visit_object_pair(const ObjectPair * node)
  {
    print_tree("ObjectPair", {}, node->key, node->value);
  }
  void visit_enum_variant(const EnumVariant * node)
  {
    print_tree("EnumVariant", {{"name", node->name}}, node->value);
  }
  void visit_function_arg(const FunctionArg * node)
  {
    print_tree("FunctionArg", {{"name", node->name}}, node->type, node->defaultValue);
  }

  // --- Declarations ---
  void visit_var_decl(const VarDecl * node)
  {
    std::vector<Prop> props;
    if (node->modifier != VarModifier::None) props.emplace_back(to_string(node->modifier));
    props.emplace_back("name", node->name);
    if (node->infer) props.emplace_back("[infer]");
    if (node->setter) props.emplace_back("setter", *node->setter);
    if (node->getter) props.emplace_back("getter", *node->getter);
    print_tree("VarDecl", props, node->type, node->initialValue);
  }
  void visit_const_decl(const ConstDecl * node)
  {
    std::vector<Prop> props = {{"name", node->name}};
    if (node->infer) props.emplace_back("[infer]");
    print_tree("ConstDecl", props, node->type, node->value);
  }
  void visit_extends_decl(const ExtendsDecl * node)
  {
    if (node->isPath) {
      print_tree("ExtendsDecl", {{"path", node->target}});
    } else {
      print_tree("ExtendsDecl", {{"name", node->target}});
    }
  }
  void visit_class_name_decl(const ClassNameDecl * node)
  {
    print_tree("ClassNameDecl", {{"name", node->name}});
  }
  void visit_enum_decl(const EnumDecl * node)
  {
    print_tree("EnumDecl", {{"name", node->name}}, node->variants);
  }
  void visit_signal_decl(const SignalDecl * node)
  {
    std::vector<Prop> props = {{"name", node->name}};
    if (!node->params.empty()) {
      std::string params;
      for (size_t i = 0; i < node->params.size(); ++i) {
        if (i > 0) params += ", ";
        params += node->params[i];
      }
      props.emplace_back("params", std::move(params));
    }
    print_tree("SignalDecl", props);
  }
  void visit_function_decl(const FunctionDecl * node)
  {
    std::vector<Prop> props;
    if (node->modifier != FunctionModifier::None) props.emplace_back(to_string(node->modifier));
    props.emplace_back("name", node->name);
    print_tree("FunctionDecl", props, node->args, node->returnType, node->body);
  }
  void visit_class_decl(const ClassDecl * node)
  {
    std::vector<Prop> props = {{"name", node->name}};
    if (node->base) props.emplace_back("extends", *node->base);
    print_tree("ClassDecl", props, node->body);
  }

  // --- Statements ---
  void visit_if_stmt(const IfStmt * node)
  {
    print_tree("IfStmt", {}, node->ifBranch, node->elifBranches, node->elseBlock);
  }
  void visit_while_stmt(const WhileStmt * node) { print_tree("WhileStmt", {}, node->cond); }
  void visit_for_stmt(const ForStmt * node) { print_tree("ForStmt", {}, node->cond); }
  void visit_match_stmt(const MatchStmt * node)
  {
    print_tree("MatchStmt", {}, node->subject, node->cases);
  }
  void visit_assign_stmt(const AssignStmt * node)
  {
    print_tree("AssignStmt", {{"op", to_string(node->op)}}, node->target, node->value);
  }
  void visit_return_stmt(const ReturnStmt * node) { print_tree("ReturnStmt", {}, node->value); }
  void visit_pass_stmt(const PassStmt * /*node*/) { print_tree("PassStmt", {}); }

  // --- Expressions ---
  void visit_null_literal_expr(const NullLiteralExpr * /*node*/) { print_tree("NullLiteralExpr", {}); }
  void visit_bool_literal_expr(const BoolLiteralExpr * node)
  {
    print_tree("BoolLiteralExpr", {Prop(node->value ? "true" : "false")});
  }
  void visit_int_literal_expr(const IntLiteralExpr * node)
  {
    print_tree("IntLiteralExpr", {Prop(std::to_string(node->value))});
  }
  void visit_float_literal_expr(const FloatLiteralExpr * node)
  {
    print_tree("FloatLiteralExpr", {Prop(node->spelling)});
  }
  void visit_string_literal_expr(const StringLiteralExpr * node)
  {
    const std::string q(1, node->quote);
    print_tree("StringLiteralExpr", {{q + std::string(node->value) + q}});
  }
  void visit_node_path_expr(const NodePathExpr * node)
  {
    print_tree("NodePathExpr", {Prop(node->path)});
  }
  void visit_array_literal_expr(const ArrayLiteralExpr * node)
  {
    print_tree("ArrayLiteralExpr", {}, node->elements);
  }
  void visit_object_literal_expr(const ObjectLiteralExpr * node)
  {
    print_tree("ObjectLiteralExpr", {}, node->pairs);
  }
  void visit_ident_expr(const IdentExpr * node) { print_tree("IdentExpr", {{"name", node->name}}); }
  void visit_call_expr(const CallExpr * node)
  {
    print_tree("CallExpr", {{"callee", node->callee}}, node->args);
  }
  void visit_binary_expr(const BinaryExpr * node)
  {
    print_tree("BinaryExpr", {{"op", to_string(node->op)}}, node->lhs, node->rhs);
  }
  void visit_unary_expr(const UnaryExpr * node)
  {
    print_tree("UnaryExpr", {{"op", to_string(node->op)}}, node->operand);
  }

  // --- Types ---
  void visit_type_ref(const TypeRef * node) { print_tree("TypeRef", {{"name", node->name}}); }

private:
  std::ostream & os_;
  std::string prefix_;
  bool isLast_ = true;

  // --- Helper: extract children based on type ---

  template <typename T>
  static void collect_children(std::vector<const AstNode *> & out, T * ptr)
  {
    if (ptr) out.push_back(ptr);
  }

  template <typename T>
  static void collect_children(std::vector<const AstNode *> & out, gsl::span<T *> span)
  {
    for (auto * ptr : span) {
      if (ptr) out.push_back(ptr);
    }
  }

  // --- Rendering ---

  template <typename It>
  void print_line(std::string_view label, It first, It last)
  {
    os_ << prefix_ << (isLast_ ? "`-" : "|-") << label;
    for (It it = first; it != last; ++it) {
      if (it->key.empty()) {
        os_ << " " << it->value;
      } else {
        os_ << " " << it->key << "='" << it->value << "'";
      }
    }
    os_ << "\n";
  }

  void print_children(const std::vector<const AstNode *> & children)
  {
    if (children.empty()) return;
    const IndentScope scope(*this);
    for (size_t i = 0; i < children.size(); ++i) {
      isLast_ = (i == children.size() - 1);
      visit(children[i]);
    }
  }

  struct IndentScope
  {
    AstDumper & d;
    std::string saved;

    explicit IndentScope(AstDumper & dumper) : d(dumper), saved(d.prefix_)
    {
      d.prefix_ += d.isLast_ ? "  " : "| ";
    }

    ~IndentScope() { d.prefix_ = saved; }
  };
};

// ============================================================================
// Convenience Functions
// ============================================================================

inline void dump(const AstNode * node, std::ostream & os)
{
  AstDumper dumper(os);
  dumper.dump(node);
}

inline std::string dump_to_string(const AstNode * node)
{
  std::ostringstream ss;
  dump(node, ss);
  return ss.str();
}

}  // namespace gdparse
