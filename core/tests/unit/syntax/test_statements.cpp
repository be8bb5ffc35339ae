#include <gtest/gtest.h>

#include <string>

#include "gdparse/ast/ast.hpp"
#include "gdparse/basic/casting.hpp"
#include "gdparse/test_support/parse_helpers.hpp"

using gdparse::dyn_cast;
using gdparse::test_support::parse;
using gdparse::test_support::shape;

namespace
{

template <typename T>
T * only_line(const gdparse::test_support::TestParseUnit & unit)
{
  if (!unit.ok() || unit.lines().size() != 1) return nullptr;
  return dyn_cast<T>(unit.lines()[0]);
}

std::string failure_of(const gdparse::test_support::TestParseUnit & unit)
{
  return unit.failure ? unit.failure->headline() : std::string("<no failure>");
}

}  // namespace

// ============================================================================
// if / elif / else
// ============================================================================

TEST(SyntaxStatements, IfWithIndentedBody)
{
  auto unit = parse("if 123456:\n    hello");
  auto * stmt = only_line<gdparse::IfStmt>(unit);
  ASSERT_NE(stmt, nullptr) << failure_of(unit);

  EXPECT_EQ(shape(stmt->ifBranch->expr), "123456");
  ASSERT_EQ(stmt->ifBranch->body->lines.size(), 1U);
  EXPECT_EQ(shape(stmt->ifBranch->body->lines[0]), "hello");
  EXPECT_EQ(stmt->ifBranch->body->indent, 4U);
  EXPECT_TRUE(stmt->elifBranches.empty());
  EXPECT_EQ(stmt->elseBlock, nullptr);
}

TEST(SyntaxStatements, IfBodyMustBeIndented)
{
  auto unit = parse("if 123456:\nhello");
  ASSERT_FALSE(unit.ok());
  ASSERT_TRUE(unit.failure.has_value());
  EXPECT_EQ(unit.failure->headline(), "expected an indented block");
  EXPECT_EQ(unit.failure->line, 2U);
  EXPECT_EQ(unit.failure->column, 1U);
}

TEST(SyntaxStatements, IfElifElse)
{
  const std::string src =
    "if a:\n"
    "  x()\n"
    "elif b:\n"
    "  y()\n"
    "\n"
    "# between branches\n"
    "elif c:\n"
    "  z()\n"
    "else:\n"
    "  w()\n";
  auto unit = parse(src);
  auto * stmt = only_line<gdparse::IfStmt>(unit);
  ASSERT_NE(stmt, nullptr) << failure_of(unit);

  ASSERT_EQ(stmt->elifBranches.size(), 2U);
  EXPECT_EQ(shape(stmt->elifBranches[0]->expr), "b");
  EXPECT_EQ(shape(stmt->elifBranches[1]->expr), "c");
  ASSERT_NE(stmt->elseBlock, nullptr);
  ASSERT_EQ(stmt->elseBlock->lines.size(), 1U);
  EXPECT_EQ(shape(stmt->elseBlock->lines[0]), "w()");
}

TEST(SyntaxStatements, ElifAtDeeperIndentIsNotPartOfTheIf)
{
  const std::string src =
    "if a:\n"
    "    x()\n"
    "    elif b:\n"
    "        y()\n";
  auto unit = parse(src);
  EXPECT_FALSE(unit.ok());
}

TEST(SyntaxStatements, NestedIfBlocksEndAtDedent)
{
  const std::string src =
    "if a:\n"
    "    if b:\n"
    "        inner()\n"
    "    outer()\n"
    "after()\n";
  auto unit = parse(src);
  ASSERT_TRUE(unit.ok()) << failure_of(unit);
  ASSERT_EQ(unit.lines().size(), 2U);

  auto * outer = dyn_cast<gdparse::IfStmt>(unit.lines()[0]);
  ASSERT_NE(outer, nullptr);
  ASSERT_EQ(outer->ifBranch->body->lines.size(), 2U);
  auto * inner = dyn_cast<gdparse::IfStmt>(outer->ifBranch->body->lines[0]);
  ASSERT_NE(inner, nullptr);
  EXPECT_EQ(inner->ifBranch->body->indent, 8U);
  EXPECT_EQ(shape(outer->ifBranch->body->lines[1]), "outer()");
  EXPECT_EQ(shape(unit.lines()[1]), "after()");
}

// ============================================================================
// Loops and match
// ============================================================================

TEST(SyntaxStatements, WhileLoop)
{
  auto unit = parse("while i < 10:\n\ti\n");
  // Tab indentation is never counted, so the body is missing
  EXPECT_FALSE(unit.ok());

  unit = parse("while i < 10:\n  i += 1\n");
  auto * stmt = only_line<gdparse::WhileStmt>(unit);
  ASSERT_NE(stmt, nullptr) << failure_of(unit);
  EXPECT_EQ(shape(stmt->cond->expr), "(i < 10)");
  ASSERT_EQ(stmt->cond->body->lines.size(), 1U);
  EXPECT_TRUE(gdparse::isa<gdparse::AssignStmt>(stmt->cond->body->lines[0]));
}

TEST(SyntaxStatements, ForLoopKeepsHeaderAsInExpression)
{
  auto unit = parse("for child in get_children():\n    child.queue_free()\n");
  auto * stmt = only_line<gdparse::ForStmt>(unit);
  ASSERT_NE(stmt, nullptr) << failure_of(unit);
  EXPECT_EQ(shape(stmt->cond->expr), "(child in get_children())");
  EXPECT_EQ(shape(stmt->cond->body->lines[0]), "Attr(child, queue_free())");
}

TEST(SyntaxStatements, ForNeedsSpaceAfterKeyword)
{
  auto unit = parse("for(x in xs):\n    pass\n");
  EXPECT_FALSE(unit.ok());
}

TEST(SyntaxStatements, MatchCases)
{
  const std::string src =
    "match state:\n"
    "    State.IDLE:\n"
    "        idle()\n"
    "    # comment between cases\n"
    "    [1, 2]:\n"
    "        pass\n"
    "    _:\n"
    "        other()\n";
  auto unit = parse(src);
  auto * stmt = only_line<gdparse::MatchStmt>(unit);
  ASSERT_NE(stmt, nullptr) << failure_of(unit);

  EXPECT_EQ(shape(stmt->subject), "state");
  ASSERT_EQ(stmt->cases.size(), 3U);
  EXPECT_EQ(shape(stmt->cases[0]->expr), "Attr(State, IDLE)");
  EXPECT_EQ(shape(stmt->cases[1]->expr), "[1, 2]");
  EXPECT_EQ(shape(stmt->cases[2]->expr), "_");
  EXPECT_TRUE(gdparse::isa<gdparse::PassStmt>(stmt->cases[1]->body->lines[0]));
}

TEST(SyntaxStatements, MatchWithoutCasesFails)
{
  auto unit = parse("match x:\nfoo()\n");
  ASSERT_FALSE(unit.ok());
  EXPECT_EQ(failure_of(unit), "expected an indented block");
}

// ============================================================================
// Assignment, return, pass
// ============================================================================

TEST(SyntaxStatements, AssignmentOperators)
{
  const char * ops[] = {"=", "+=", "-=", "*=", "/=", "%="};
  const gdparse::AssignOp expected[] = {
    gdparse::AssignOp::Assign,    gdparse::AssignOp::AddAssign, gdparse::AssignOp::SubAssign,
    gdparse::AssignOp::MulAssign, gdparse::AssignOp::DivAssign, gdparse::AssignOp::ModAssign,
  };
  for (size_t i = 0; i < 6; ++i) {
    auto unit = parse(std::string("x ") + ops[i] + " 2");
    auto * stmt = only_line<gdparse::AssignStmt>(unit);
    ASSERT_NE(stmt, nullptr) << ops[i] << ": " << failure_of(unit);
    EXPECT_EQ(stmt->op, expected[i]);
    EXPECT_EQ(shape(stmt->target), "x");
    EXPECT_EQ(shape(stmt->value), "2");
  }
}

TEST(SyntaxStatements, AssignToAttributeAndIndex)
{
  auto unit = parse("self.position.x = speed * delta");
  auto * attr = only_line<gdparse::AssignStmt>(unit);
  ASSERT_NE(attr, nullptr) << failure_of(unit);
  EXPECT_EQ(shape(attr->target), "Attr(self, Attr(position, x))");
  EXPECT_EQ(shape(attr->value), "(speed * delta)");

  unit = parse("cells[i][j] = null");
  auto * index = only_line<gdparse::AssignStmt>(unit);
  ASSERT_NE(index, nullptr) << failure_of(unit);
  EXPECT_EQ(shape(index->target), "Index(Index(cells, i), j)");
}

TEST(SyntaxStatements, EqualityIsAnExpressionNotAnAssignment)
{
  auto unit = parse("a == b");
  ASSERT_TRUE(unit.ok()) << failure_of(unit);
  ASSERT_EQ(unit.lines().size(), 1U);
  EXPECT_TRUE(gdparse::isa<gdparse::BinaryExpr>(unit.lines()[0]));
}

TEST(SyntaxStatements, InvalidAssignmentTarget)
{
  auto unit = parse("a + b = 3");
  ASSERT_FALSE(unit.ok());
  EXPECT_EQ(failure_of(unit), "invalid assignment target");
  EXPECT_EQ(unit.failure->column, 7U);

  EXPECT_FALSE(parse("f() = 3").ok());
}

TEST(SyntaxStatements, ReturnWithAndWithoutValue)
{
  auto unit = parse("return a + 1");
  auto * with_value = only_line<gdparse::ReturnStmt>(unit);
  ASSERT_NE(with_value, nullptr) << failure_of(unit);
  EXPECT_EQ(shape(with_value->value), "(a + 1)");

  unit = parse("return # done\n");
  auto * bare = only_line<gdparse::ReturnStmt>(unit);
  ASSERT_NE(bare, nullptr) << failure_of(unit);
  EXPECT_EQ(bare->value, nullptr);
}

TEST(SyntaxStatements, ReturnKeywordNeedsBoundary)
{
  auto unit = parse("returned = 1");
  ASSERT_NE(only_line<gdparse::AssignStmt>(unit), nullptr) << failure_of(unit);
}

TEST(SyntaxStatements, Pass)
{
  auto unit = parse("pass");
  EXPECT_NE(only_line<gdparse::PassStmt>(unit), nullptr);
}
