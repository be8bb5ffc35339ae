// test_ast_dump.cpp - Tree dump output for parsed scripts
//
#include <gtest/gtest.h>

#include <string>

#include "gdparse/ast/ast_dumper.hpp"
#include "gdparse/test_support/parse_helpers.hpp"

namespace gdparse
{
namespace
{

std::string dump_script(const std::string & source)
{
  auto unit = test_support::parse(source);
  EXPECT_TRUE(unit.ok()) << (unit.failure ? unit.failure->render() : "");
  return dump_to_string(unit.file);
}

}  // namespace

TEST(AstDump, EmptyScript)
{
  EXPECT_EQ(dump_script(""), "ScriptFile\n`-Block indent='0'\n");
}

TEST(AstDump, HandlerFunction)
{
  const std::string source =
    "func _on_area_detector_body_entered(body: PhysicsBody2D) -> void:\n"
    "    if body is Bullet:\n"
    "        var bullet := body as Bullet\n"
    "        if bullet.hurt_player:\n"
    "            bullet.destroy()\n"
    "            kill()\n";

  const std::string expected =
    "ScriptFile\n"
    "`-Block indent='0'\n"
    "  `-FunctionDecl name='_on_area_detector_body_entered'\n"
    "    |-FunctionArg name='body'\n"
    "    | `-TypeRef name='PhysicsBody2D'\n"
    "    |-TypeRef name='void'\n"
    "    `-Block indent='4'\n"
    "      `-IfStmt\n"
    "        `-Condition\n"
    "          |-BinaryExpr op='is'\n"
    "          | |-IdentExpr name='body'\n"
    "          | `-IdentExpr name='Bullet'\n"
    "          `-Block indent='8'\n"
    "            |-VarDecl name='bullet' [infer]\n"
    "            | `-BinaryExpr op='as'\n"
    "            |   |-IdentExpr name='body'\n"
    "            |   `-IdentExpr name='Bullet'\n"
    "            `-IfStmt\n"
    "              `-Condition\n"
    "                |-BinaryExpr op='.'\n"
    "                | |-IdentExpr name='bullet'\n"
    "                | `-IdentExpr name='hurt_player'\n"
    "                `-Block indent='12'\n"
    "                  |-BinaryExpr op='.'\n"
    "                  | |-IdentExpr name='bullet'\n"
    "                  | `-CallExpr callee='destroy'\n"
    "                  `-CallExpr callee='kill'\n";

  EXPECT_EQ(dump_script(source), expected);
}

TEST(AstDump, ScriptHeaderAndMembers)
{
  const std::string source =
    "class_name Player\n"
    "extends \"res://actor.gd\"\n"
    "# stats\n"
    "signal hit(amount, source)\n"
    "export var speed: float = 1.5 setget set_speed\n"
    "const MAX := 3\n"
    "enum State {IDLE, RUN = 2}\n";

  const std::string expected =
    "ScriptFile\n"
    "`-Block indent='0'\n"
    "  |-ClassNameDecl name='Player'\n"
    "  |-ExtendsDecl path='res://actor.gd'\n"
    "  |-Comment \"stats\"\n"
    "  |-SignalDecl name='hit' params='amount, source'\n"
    "  |-VarDecl export name='speed' setter='set_speed'\n"
    "  | |-TypeRef name='float'\n"
    "  | `-FloatLiteralExpr 1.5\n"
    "  |-ConstDecl name='MAX' [infer]\n"
    "  | `-IntLiteralExpr 3\n"
    "  `-EnumDecl name='State'\n"
    "    |-EnumVariant name='IDLE'\n"
    "    `-EnumVariant name='RUN'\n"
    "      `-IntLiteralExpr 2\n";

  EXPECT_EQ(dump_script(source), expected);
}

TEST(AstDump, ControlFlow)
{
  const std::string source =
    "match state:\n"
    "    0:\n"
    "        pass\n"
    "    _:\n"
    "        hp -= 1\n"
    "while hp > 0:\n"
    "    return\n";

  const std::string expected =
    "ScriptFile\n"
    "`-Block indent='0'\n"
    "  |-MatchStmt\n"
    "  | |-IdentExpr name='state'\n"
    "  | |-Condition\n"
    "  | | |-IntLiteralExpr 0\n"
    "  | | `-Block indent='8'\n"
    "  | |   `-PassStmt\n"
    "  | `-Condition\n"
    "  |   |-IdentExpr name='_'\n"
    "  |   `-Block indent='8'\n"
    "  |     `-AssignStmt op='-='\n"
    "  |       |-IdentExpr name='hp'\n"
    "  |       `-IntLiteralExpr 1\n"
    "  `-WhileStmt\n"
    "    `-Condition\n"
    "      |-BinaryExpr op='>'\n"
    "      | |-IdentExpr name='hp'\n"
    "      | `-IntLiteralExpr 0\n"
    "      `-Block indent='4'\n"
    "        `-ReturnStmt\n";

  EXPECT_EQ(dump_script(source), expected);
}

TEST(AstDump, LiteralsAndCollections)
{
  const std::string source = "x = [null, true, 'a', $Sprite, {\"k\": -1}]\n";

  const std::string expected =
    "ScriptFile\n"
    "`-Block indent='0'\n"
    "  `-AssignStmt op='='\n"
    "    |-IdentExpr name='x'\n"
    "    `-ArrayLiteralExpr\n"
    "      |-NullLiteralExpr\n"
    "      |-BoolLiteralExpr true\n"
    "      |-StringLiteralExpr 'a'\n"
    "      |-NodePathExpr $Sprite\n"
    "      `-ObjectLiteralExpr\n"
    "        `-ObjectPair\n"
    "          |-StringLiteralExpr \"k\"\n"
    "          `-UnaryExpr op='-'\n"
    "            `-IntLiteralExpr 1\n";

  EXPECT_EQ(dump_script(source), expected);
}

TEST(AstDump, SameInputSameOutput)
{
  const std::string source =
    "class Inner extends Reference:\n"
    "    static func make(a := 1, b: int = 2):\n"
    "        return Inner.new()\n";

  const std::string first = dump_script(source);
  EXPECT_EQ(dump_script(source), first);
  EXPECT_NE(first.find("ClassDecl name='Inner' extends='Reference'"), std::string::npos) << first;
  EXPECT_NE(first.find("FunctionDecl static name='make'"), std::string::npos) << first;
}

}  // namespace gdparse
