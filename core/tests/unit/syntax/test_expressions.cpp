#include <gtest/gtest.h>

#include <string>

#include "gdparse/ast/ast.hpp"
#include "gdparse/basic/casting.hpp"
#include "gdparse/test_support/parse_helpers.hpp"

using gdparse::test_support::parse_expr;
using gdparse::test_support::shape;

namespace
{

/// Shape of a fully consumed expression, or the failure headline.
std::string expr_shape(const std::string & src)
{
  const auto unit = parse_expr(src);
  if (!unit.ok()) {
    return "FAIL: " + (unit.failure ? unit.failure->headline() : std::string("?"));
  }
  EXPECT_TRUE(unit.rest.empty()) << "unconsumed: '" << unit.rest << "'";
  return shape(unit.expr);
}

}  // namespace

// ============================================================================
// Literals and values
// ============================================================================

TEST(SyntaxExpressions, Literals)
{
  EXPECT_EQ(expr_shape("123"), "123");
  EXPECT_EQ(expr_shape("0x0f"), "15");
  EXPECT_EQ(expr_shape("1.05"), "1.05");
  EXPECT_EQ(expr_shape("null"), "null");
  EXPECT_EQ(expr_shape("True"), "true");
  EXPECT_EQ(expr_shape("false"), "false");
  EXPECT_EQ(expr_shape(R"("Hello")"), R"("Hello")");
  EXPECT_EQ(expr_shape("'single'"), "'single'");
  EXPECT_EQ(expr_shape("$Path/To/Node"), "$Path/To/Node");
}

TEST(SyntaxExpressions, IntLiteralKeepsSpelling)
{
  const auto unit = parse_expr("0x1F");
  ASSERT_TRUE(unit.ok());
  const auto * lit = gdparse::dyn_cast<gdparse::IntLiteralExpr>(unit.expr);
  ASSERT_NE(lit, nullptr);
  EXPECT_EQ(lit->value, 31);
  EXPECT_EQ(lit->spelling, "0x1F");
}

TEST(SyntaxExpressions, BooleanPrefixIsAnIdentifier)
{
  EXPECT_EQ(expr_shape("trueish"), "trueish");
  EXPECT_EQ(expr_shape("null_value"), "null_value");
}

TEST(SyntaxExpressions, ArraysAllowTrailingCommaAndComments)
{
  EXPECT_EQ(expr_shape("[]"), "[]");
  EXPECT_EQ(expr_shape("[1, 2, 3,]"), "[1, 2, 3]");
  EXPECT_EQ(
    expr_shape("[\n"
               "    1, # one\n"
               "\n"
               "    # spacer\n"
               "    2\n"
               "]"),
    "[1, 2]");
}

TEST(SyntaxExpressions, ObjectsAcceptAnyKeyExpression)
{
  EXPECT_EQ(expr_shape("{}"), "{}");
  EXPECT_EQ(
    expr_shape("{\"a\": 1, b: [2], 3: {},\n}"), "{\"a\": 1, b: [2], 3: {}}");
  EXPECT_EQ(
    expr_shape("{\n"
               "    \"hp\": 10, # health\n"
               "    \"mp\": 5\n"
               "}"),
    "{\"hp\": 10, \"mp\": 5}");
}

TEST(SyntaxExpressions, Calls)
{
  EXPECT_EQ(expr_shape("f()"), "f()");
  EXPECT_EQ(expr_shape("print(\"x\", 1 + 2)"), "print(\"x\", (1 + 2))");
  EXPECT_EQ(expr_shape("emit_signal(\n  \"died\",\n  self,\n)"), "emit_signal(\"died\", self)");
}

// ============================================================================
// Precedence
// ============================================================================

TEST(SyntaxExpressions, ParenthesesOverridePrecedence)
{
  EXPECT_EQ(expr_shape("a * (b + c)"), "(a * (b + c))");
  EXPECT_EQ(expr_shape("a * b + c"), "((a * b) + c)");
  EXPECT_EQ(expr_shape("(a) + b"), "(a + b)");
}

TEST(SyntaxExpressions, BinaryLevelsFoldLeft)
{
  EXPECT_EQ(expr_shape("a - b - c"), "((a - b) - c)");
  EXPECT_EQ(expr_shape("a / b * c"), "((a / b) * c)");
  EXPECT_EQ(expr_shape("a == b == c"), "((a == b) == c)");
}

TEST(SyntaxExpressions, MixedOperators)
{
  EXPECT_EQ(
    expr_shape("-a * (b & 1 + c) && (5 + 10 / (2 % \"foo\"))"),
    "((-a * ((b & 1) + c)) && (5 + (10 / (2 % \"foo\"))))");
  EXPECT_EQ(expr_shape("((_rand_u8()) & 0x0f)"), "(_rand_u8() & 15)");
}

TEST(SyntaxExpressions, LogicalAndComparisonShareOneLevel)
{
  EXPECT_EQ(expr_shape("a or b and c"), "((a || b) && c)");
  EXPECT_EQ(expr_shape("a and b or c == d"), "(((a && b) || c) == d)");
  EXPECT_EQ(expr_shape("a < b and c >= d"), "(((a < b) && c) >= d)");
  EXPECT_EQ(expr_shape("x != 1 || not y"), "((x != 1) || !y)");
  EXPECT_EQ(expr_shape("a + 1 == b * 2"), "((a + 1) == (b * 2))");
}

TEST(SyntaxExpressions, MembershipAndTypeOperators)
{
  EXPECT_EQ(
    expr_shape(R"(file_name in [".", ".."])"), R"((file_name in [".", ".."]))");
  EXPECT_EQ(expr_shape("body is Bullet"), "(body is Bullet)");
  EXPECT_EQ(expr_shape("body as Bullet"), "(body as Bullet)");
}

TEST(SyntaxExpressions, UnaryOperators)
{
  EXPECT_EQ(expr_shape("-1"), "-1");
  EXPECT_EQ(expr_shape("+x"), "+x");
  EXPECT_EQ(expr_shape("!done"), "!done");
  EXPECT_EQ(expr_shape("not done"), "!done");
  EXPECT_EQ(expr_shape("-a.b"), "-Attr(a, b)");
}

TEST(SyntaxExpressions, OperatorsContinueOnNextLineOnlyAfterTheOperator)
{
  EXPECT_EQ(expr_shape("a +\n    b"), "(a + b)");

  // Without brackets a newline ends the expression before the operator
  const auto unit = parse_expr("a\n+ b");
  ASSERT_TRUE(unit.ok());
  EXPECT_EQ(shape(unit.expr), "a");
  EXPECT_EQ(unit.rest, "\n+ b");

  EXPECT_EQ(expr_shape("(a\n  + b)"), "(a + b)");
}

TEST(SyntaxExpressions, CompoundAssignmentIsNotAnOperator)
{
  const auto unit = parse_expr("a += 1");
  ASSERT_TRUE(unit.ok());
  EXPECT_EQ(shape(unit.expr), "a");
  EXPECT_EQ(unit.rest, " += 1");
}

// ============================================================================
// Attribute and index chains
// ============================================================================

TEST(SyntaxExpressions, AttributeChainNestsRight)
{
  EXPECT_EQ(expr_shape("a.b[1].c"), "Attr(a, Attr(Index(b, 1), c))");
  EXPECT_EQ(expr_shape("a.b.c()"), "Attr(a, Attr(b, c()))");
  EXPECT_EQ(expr_shape("get_node(\"x\").position.x"), "Attr(get_node(\"x\"), Attr(position, x))");
}

TEST(SyntaxExpressions, CollectionLiteralsStartChains)
{
  EXPECT_EQ(expr_shape("[1, 2].size()"), "Attr([1, 2], size())");
  EXPECT_EQ(expr_shape("{\"k\": 1}.keys()"), "Attr({\"k\": 1}, keys())");
}

TEST(SyntaxExpressions, IndexSuffixesFoldLeft)
{
  EXPECT_EQ(expr_shape("grid[x][y]"), "Index(Index(grid, x), y)");
  EXPECT_EQ(expr_shape("[1, 2][0]"), "Index([1, 2], 0)");
}

TEST(SyntaxExpressions, ChainsAfterParenthesesStringsAndNodePaths)
{
  EXPECT_EQ(expr_shape("(a + b).add()"), "Attr((a + b), add())");
  EXPECT_EQ(expr_shape("\"%d\".format(x)"), "Attr(\"%d\", format(x))");
  EXPECT_EQ(expr_shape("$Sprite.play(\"run\")"), "Attr($Sprite, play(\"run\"))");
}

TEST(SyntaxExpressions, MembersMayBeReservedWords)
{
  EXPECT_EQ(expr_shape("node.class"), "Attr(node, class)");
  EXPECT_EQ(expr_shape("obj.get(\"x\").is_valid()"), "Attr(obj, Attr(get(\"x\"), is_valid()))");
}

// ============================================================================
// Failures
// ============================================================================

TEST(SyntaxExpressions, ReservedWordsAreNotExpressions)
{
  EXPECT_FALSE(parse_expr("if").ok());
  EXPECT_FALSE(parse_expr("var").ok());
  EXPECT_FALSE(parse_expr("func(1)").ok());
}

TEST(SyntaxExpressions, UnclosedBracketReportsExpectedTokens)
{
  const auto unit = parse_expr("[1, 2");
  ASSERT_FALSE(unit.ok());
  ASSERT_TRUE(unit.failure.has_value());
  EXPECT_EQ(unit.failure->headline(), "expected ',' or ']', found end of input");
}

TEST(SyntaxExpressions, BadStringGetsItsOwnMessage)
{
  const auto unit = parse_expr("\"abc");
  ASSERT_FALSE(unit.ok());
  ASSERT_TRUE(unit.failure.has_value());
  EXPECT_EQ(unit.failure->headline(), "unterminated string literal or invalid escape sequence");
}

TEST(SyntaxExpressions, IntegerOverflowIsReported)
{
  const auto unit = parse_expr("99999999999999999999");
  ASSERT_FALSE(unit.ok());
  ASSERT_TRUE(unit.failure.has_value());
  EXPECT_EQ(unit.failure->headline(), "integer literal '99999999999999999999' is out of range");
}

TEST(SyntaxExpressions, SameInputGivesSameTree)
{
  const std::string src = "a.b(c, [1, {\"k\": -d}])[0] * 2 >= limit or not ready";
  EXPECT_EQ(expr_shape(src), expr_shape(src));
}
