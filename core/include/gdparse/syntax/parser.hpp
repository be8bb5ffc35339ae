// gdparse/syntax/parser.hpp - Indentation-aware recursive-descent parser
#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include "gdparse/ast/ast.hpp"
#include "gdparse/ast/ast_context.hpp"
#include "gdparse/basic/source_buffer.hpp"
#include "gdparse/syntax/cursor.hpp"
#include "gdparse/syntax/parse_failure.hpp"

namespace gdparse::syntax
{

struct ParseOptions
{
  /// Deepest allowed nesting of expressions, brackets and indented blocks
  uint32_t max_nesting_depth = 256;
};

/**
 * Scannerless parser for one script buffer.
 *
 * Grammar rules take the cursor by reference. A rule that succeeds moves the
 * cursor past what it consumed; a rule that fails returns nullptr (or false)
 * and leaves the cursor where it was, after recording the failure. Of all
 * recorded failures only the furthest one is kept, together with the stack
 * of rules that were active when it happened.
 *
 * The public entry points start at the current cursor() and advance it on
 * success. Nodes are allocated in `ast` and borrow text from `source`.
 */
class Parser
{
public:
  Parser(AstContext & ast, FileId file_id, std::string_view source, ParseOptions options = {});

  /// Whole buffer as a block at indentation 0. Only blank lines and
  /// comments may follow the last line.
  [[nodiscard]] ScriptFile * parse_file();

  /// One expression; the rest of the input is left unconsumed.
  [[nodiscard]] Expr * parse_expr();

  /// One statement at indentation 0.
  [[nodiscard]] Stmt * parse_stmt();

  /// One declaration at indentation 0.
  [[nodiscard]] Decl * parse_decl();

  [[nodiscard]] const Cursor & cursor() const noexcept { return cursor_; }

  /// Set when the last entry point failed.
  [[nodiscard]] const std::optional<ParseFailure> & failure() const noexcept { return failure_; }

  /// Start offsets of lines whose leading whitespace contains a tab.
  [[nodiscard]] const std::set<uint32_t> & tab_warnings() const noexcept { return tabLines_; }

private:
  // ===========================================================================
  // Failure tracking (parser.cpp)
  // ===========================================================================

  class ContextScope
  {
  public:
    ContextScope(Parser & p, std::string_view label, const Cursor & at);
    ~ContextScope();
    ContextScope(const ContextScope &) = delete;
    ContextScope & operator=(const ContextScope &) = delete;

  private:
    Parser & parser_;
  };

  class DepthGuard
  {
  public:
    DepthGuard(Parser & p, const Cursor & at);
    ~DepthGuard();
    DepthGuard(const DepthGuard &) = delete;
    DepthGuard & operator=(const DepthGuard &) = delete;

    [[nodiscard]] bool ok() const noexcept { return ok_; }

  private:
    Parser & parser_;
    bool ok_;
  };

  /// Operators folded in a loop nest the tree without recursing, so each fold
  /// is counted here against the same limit until the chain is complete.
  class FoldDepth
  {
  public:
    explicit FoldDepth(Parser & p) : parser_(p) {}
    ~FoldDepth() { parser_.depth_ -= folds_; }
    FoldDepth(const FoldDepth &) = delete;
    FoldDepth & operator=(const FoldDepth &) = delete;

    [[nodiscard]] bool deepen(const Cursor & at);

  private:
    Parser & parser_;
    uint32_t folds_ = 0;
  };

  /// Brackets let expressions continue across lines
  class BracketScope
  {
  public:
    explicit BracketScope(Parser & p) : parser_(p) { ++parser_.bracketDepth_; }
    ~BracketScope() { --parser_.bracketDepth_; }
    BracketScope(const BracketScope &) = delete;
    BracketScope & operator=(const BracketScope &) = delete;

  private:
    Parser & parser_;
  };

  void fail(const Cursor & at, std::string_view expected);
  void fail_message(const Cursor & at, std::string message);
  void fail_nesting(const Cursor & at);
  /// A block stops at a line with another indentation; an enclosing block
  /// that accepts the line withdraws the failure through accept_indentation().
  void fail_indentation(const Cursor & at, uint32_t expected, uint32_t found);
  void accept_indentation(const Cursor & at);
  [[nodiscard]] ParseFailure & failure_at(const Cursor & at, bool & is_new);
  [[nodiscard]] std::string describe(const Cursor & at) const;

  template <typename T>
  T * finish_entry(T * node, const Cursor & c);

  [[nodiscard]] SourceRange range_from(const Cursor & start, const Cursor & end) const noexcept
  {
    return {fileId_, start.offset(), end.offset()};
  }

  void note_tabs(const Cursor & line_start);

  // ===========================================================================
  // Blocks and lines (parser.cpp)
  // ===========================================================================

  [[nodiscard]] ScriptFile * parse_file(Cursor & c);
  [[nodiscard]] Block * parse_block(Cursor & c, uint32_t indent);
  [[nodiscard]] Block * parse_indented_block(Cursor & c, uint32_t indent);
  bool parse_line(Cursor & c, uint32_t indent, std::vector<AstNode *> & lines);
  [[nodiscard]] AstNode * parse_line_item(Cursor & c, uint32_t indent);
  void skip_ignorable_lines(Cursor & c, uint32_t indent) const;

  /// Before an operator: spaces only, or any trivia inside brackets
  void skip_gap(Cursor & c) const;

  bool expect_char(Cursor & c, char ch);
  bool expect_space(Cursor & c);
  [[nodiscard]] std::optional<std::string_view> expect_identifier(Cursor & c);

  /// `item (',' item)* ','? close`, with trivia between tokens. The opening
  /// bracket must already be consumed.
  bool parse_comma_list(Cursor & c, char close, const std::function<bool(Cursor &)> & item);

  // ===========================================================================
  // Expressions (ParseExpr.cpp)
  // ===========================================================================

  enum class Precedence : uint8_t {
    Logical,
    Additive,
    Multiplicative,
  };

  [[nodiscard]] Expr * parse_expr(Cursor & c);
  [[nodiscard]] Expr * parse_binary(Cursor & c, Precedence level);
  [[nodiscard]] Expr * parse_operand(Cursor & c, Precedence level);
  [[nodiscard]] static std::optional<BinaryOp> scan_binary_op(Cursor & c, Precedence level);
  [[nodiscard]] Expr * parse_unary(Cursor & c);
  [[nodiscard]] Expr * parse_postfix(Cursor & c);
  [[nodiscard]] Expr * parse_atom(Cursor & c);
  [[nodiscard]] Expr * parse_paren_expr(Cursor & c);
  [[nodiscard]] Expr * parse_attribute_chain(Cursor & c, Expr * head);
  [[nodiscard]] Expr * parse_index_suffixes(Cursor & c, Expr * base);
  [[nodiscard]] Expr * parse_value(Cursor & c);
  [[nodiscard]] Expr * parse_number(Cursor & c);
  [[nodiscard]] ArrayLiteralExpr * parse_array(Cursor & c);
  [[nodiscard]] ObjectLiteralExpr * parse_object(Cursor & c);
  [[nodiscard]] ObjectPair * parse_pair(Cursor & c);
  [[nodiscard]] CallExpr * parse_call(Cursor & c, bool allow_reserved);
  [[nodiscard]] TypeRef * parse_type_ref(Cursor & c);

  // ===========================================================================
  // Statements (ParseStmt.cpp)
  // ===========================================================================

  [[nodiscard]] Stmt * parse_stmt(Cursor & c, uint32_t indent);
  [[nodiscard]] IfStmt * parse_if_stmt(Cursor & c, uint32_t indent);
  [[nodiscard]] WhileStmt * parse_while_stmt(Cursor & c, uint32_t indent);
  [[nodiscard]] ForStmt * parse_for_stmt(Cursor & c, uint32_t indent);
  [[nodiscard]] MatchStmt * parse_match_stmt(Cursor & c, uint32_t indent);
  [[nodiscard]] ReturnStmt * parse_return_stmt(Cursor & c);
  [[nodiscard]] AssignStmt * parse_assign_stmt(Cursor & c);
  [[nodiscard]] PassStmt * parse_pass_stmt(Cursor & c);
  [[nodiscard]] Condition * parse_condition(Cursor & c, uint32_t indent);

  /// Move to the next code line when it sits at `indent` and starts with
  /// `keyword`; blank and comment lines in between are skipped.
  bool next_clause(Cursor & c, uint32_t indent, std::string_view keyword) const;

  // ===========================================================================
  // Declarations (ParseDecl.cpp)
  // ===========================================================================

  [[nodiscard]] Decl * parse_decl(Cursor & c, uint32_t indent);
  [[nodiscard]] ClassNameDecl * parse_class_name_decl(Cursor & c);
  [[nodiscard]] ExtendsDecl * parse_extends_decl(Cursor & c);
  [[nodiscard]] SignalDecl * parse_signal_decl(Cursor & c);
  [[nodiscard]] EnumDecl * parse_enum_decl(Cursor & c);
  [[nodiscard]] EnumVariant * parse_enum_variant(Cursor & c);
  [[nodiscard]] ClassDecl * parse_class_decl(Cursor & c, uint32_t indent);
  [[nodiscard]] FunctionDecl * parse_function_decl(Cursor & c, uint32_t indent);
  [[nodiscard]] FunctionArg * parse_function_arg(Cursor & c);
  [[nodiscard]] ConstDecl * parse_const_decl(Cursor & c);
  [[nodiscard]] VarDecl * parse_var_decl(Cursor & c);
  bool parse_setget(
    Cursor & c, std::optional<std::string_view> & setter,
    std::optional<std::string_view> & getter);

  AstContext & ast_;
  FileId fileId_;
  ParseOptions options_;
  Cursor cursor_;

  std::optional<ParseFailure> failure_;
  std::optional<uint32_t> indentFailureAt_;
  bool indentFailureOwned_ = false;
  std::vector<ContextFrame> context_;
  std::set<uint32_t> tabLines_;
  uint32_t depth_ = 0;
  uint32_t bracketDepth_ = 0;
  bool fatal_ = false;
};

}  // namespace gdparse::syntax
