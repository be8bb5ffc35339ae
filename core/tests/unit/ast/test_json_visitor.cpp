// test_json_visitor.cpp - Unit tests for syntax tree JSON serialization
//
#include <gtest/gtest.h>

#include <nlohmann/json.hpp>
#include <string>

#include "gdparse/ast/ast.hpp"
#include "gdparse/ast/json_visitor.hpp"
#include "gdparse/test_support/parse_helpers.hpp"

using nlohmann::json;

namespace gdparse
{

class JsonVisitorTest : public ::testing::Test
{
protected:
  static json parse_and_serialize(const std::string & source)
  {
    auto unit = test_support::parse(source);
    EXPECT_NE(unit.file, nullptr);
    return to_json(unit.file);
  }

  static json first_line(const std::string & source)
  {
    auto j = parse_and_serialize(source);
    EXPECT_FALSE(j["body"]["lines"].empty());
    return j["body"]["lines"][0];
  }
};

TEST_F(JsonVisitorTest, EmptyScript)
{
  auto j = parse_and_serialize("");
  EXPECT_EQ(j["type"], "ScriptFile");
  EXPECT_EQ(j["body"]["type"], "Block");
  EXPECT_EQ(j["body"]["indent"], 0);
  EXPECT_TRUE(j["body"]["lines"].is_array());
  EXPECT_EQ(j["body"]["lines"].size(), 0U);
}

TEST_F(JsonVisitorTest, RangesAreByteOffsets)
{
  auto j = parse_and_serialize("pass\nvar a = 1\n");
  auto var = j["body"]["lines"][1];
  EXPECT_EQ(var["type"], "VarDecl");
  EXPECT_EQ(var["range"]["start"], 5);
  EXPECT_EQ(var["range"]["end"], 14);
  EXPECT_EQ(var["initialValue"]["range"]["start"], 13);
}

TEST_F(JsonVisitorTest, VarDeclFields)
{
  auto var = first_line("onready var sprite: Sprite = $Sprite setget , get_sprite\n");
  EXPECT_EQ(var["type"], "VarDecl");
  EXPECT_EQ(var["name"], "sprite");
  EXPECT_EQ(var["modifier"], "onready");
  EXPECT_EQ(var["infer"], false);
  EXPECT_EQ(var["typeRef"]["name"], "Sprite");
  EXPECT_EQ(var["initialValue"]["type"], "NodePathExpr");
  EXPECT_EQ(var["initialValue"]["path"], "$Sprite");
  EXPECT_FALSE(var.contains("setter"));
  EXPECT_EQ(var["getter"], "get_sprite");
}

TEST_F(JsonVisitorTest, OptionalFieldsAreOmitted)
{
  auto var = first_line("var a\n");
  EXPECT_FALSE(var.contains("modifier"));
  EXPECT_FALSE(var.contains("typeRef"));
  EXPECT_FALSE(var.contains("initialValue"));

  auto ret = first_line("return\n");
  EXPECT_EQ(ret["type"], "ReturnStmt");
  EXPECT_FALSE(ret.contains("value"));
}

TEST_F(JsonVisitorTest, Literals)
{
  auto arr = first_line("[0x1f, 2.50, \"s\", 'q', null, false]\n");
  ASSERT_EQ(arr["type"], "ArrayLiteralExpr");
  const auto & el = arr["elements"];
  ASSERT_EQ(el.size(), 6U);

  EXPECT_EQ(el[0]["type"], "IntLiteralExpr");
  EXPECT_EQ(el[0]["value"], 31);
  EXPECT_EQ(el[0]["spelling"], "0x1f");

  EXPECT_EQ(el[1]["type"], "FloatLiteralExpr");
  EXPECT_DOUBLE_EQ(el[1]["value"].get<double>(), 2.5);
  EXPECT_EQ(el[1]["spelling"], "2.50");

  EXPECT_EQ(el[2]["value"], "s");
  EXPECT_EQ(el[2]["quote"], "\"");
  EXPECT_EQ(el[3]["quote"], "'");
  EXPECT_EQ(el[4]["type"], "NullLiteralExpr");
  EXPECT_EQ(el[5]["value"], false);
}

TEST_F(JsonVisitorTest, IfWithElifAndElse)
{
  auto stmt = first_line(
    "if a:\n"
    "    pass\n"
    "elif b:\n"
    "    pass\n"
    "else:\n"
    "    pass\n");
  EXPECT_EQ(stmt["type"], "IfStmt");
  EXPECT_EQ(stmt["if"]["type"], "Condition");
  EXPECT_EQ(stmt["if"]["expr"]["name"], "a");
  ASSERT_EQ(stmt["elif"].size(), 1U);
  EXPECT_EQ(stmt["elif"][0]["expr"]["name"], "b");
  EXPECT_EQ(stmt["else"]["indent"], 4);
  EXPECT_EQ(stmt["else"]["lines"][0]["type"], "PassStmt");
}

TEST_F(JsonVisitorTest, FunctionDecl)
{
  auto fn = first_line("remote func hit(amount: int, force := 1.0) -> void:\n    hp -= amount\n");
  EXPECT_EQ(fn["type"], "FunctionDecl");
  EXPECT_EQ(fn["name"], "hit");
  EXPECT_EQ(fn["modifier"], "remote");
  EXPECT_EQ(fn["returnType"]["name"], "void");

  ASSERT_EQ(fn["args"].size(), 2U);
  EXPECT_EQ(fn["args"][0]["typeRef"]["name"], "int");
  EXPECT_FALSE(fn["args"][0].contains("defaultValue"));
  EXPECT_EQ(fn["args"][1]["defaultValue"]["type"], "FloatLiteralExpr");

  auto assign = fn["body"]["lines"][0];
  EXPECT_EQ(assign["type"], "AssignStmt");
  EXPECT_EQ(assign["op"], "-=");
  EXPECT_EQ(assign["target"]["name"], "hp");
}

TEST_F(JsonVisitorTest, ExtendsByNameOrPath)
{
  EXPECT_EQ(first_line("extends KinematicBody2D\n")["name"], "KinematicBody2D");
  auto by_path = first_line("extends \"res://base.gd\"\n");
  EXPECT_EQ(by_path["path"], "res://base.gd");
  EXPECT_FALSE(by_path.contains("name"));
}

TEST_F(JsonVisitorTest, ChainsAndComments)
{
  auto j = parse_and_serialize("# note\nself.items[0].use()\n");
  auto comment = j["body"]["lines"][0];
  EXPECT_EQ(comment["type"], "Comment");
  EXPECT_EQ(comment["text"], "note");

  auto chain = j["body"]["lines"][1];
  EXPECT_EQ(chain["type"], "BinaryExpr");
  EXPECT_EQ(chain["op"], ".");
  EXPECT_EQ(chain["lhs"]["name"], "self");
  EXPECT_EQ(chain["rhs"]["op"], ".");
  EXPECT_EQ(chain["rhs"]["lhs"]["op"], "[]");
  EXPECT_EQ(chain["rhs"]["rhs"]["type"], "CallExpr");
  EXPECT_EQ(chain["rhs"]["rhs"]["callee"], "use");
}

TEST_F(JsonVisitorTest, NullNode)
{
  auto j = to_json(static_cast<const AstNode *>(nullptr));
  EXPECT_EQ(j["type"], "null");
  EXPECT_TRUE(j["range"]["start"].is_null());
}

}  // namespace gdparse
