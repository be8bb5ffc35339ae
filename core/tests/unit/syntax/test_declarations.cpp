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
  return unit.failure ? unit.failure->render() : std::string("<no failure>");
}

}  // namespace

// ============================================================================
// var
// ============================================================================

TEST(SyntaxDeclarations, VarForms)
{
  {
    auto unit = parse("var a");
    auto * v = only_line<gdparse::VarDecl>(unit);
    ASSERT_NE(v, nullptr) << failure_of(unit);
    EXPECT_EQ(v->name, "a");
    EXPECT_EQ(v->modifier, gdparse::VarModifier::None);
    EXPECT_FALSE(v->infer);
    EXPECT_EQ(v->type, nullptr);
    EXPECT_EQ(v->initialValue, nullptr);
  }
  {
    auto unit = parse("var speed: float = 10.5");
    auto * v = only_line<gdparse::VarDecl>(unit);
    ASSERT_NE(v, nullptr) << failure_of(unit);
    ASSERT_NE(v->type, nullptr);
    EXPECT_EQ(v->type->name, "float");
    EXPECT_EQ(shape(v->initialValue), "10.5");
  }
  {
    auto unit = parse("var dir := Vector2.ZERO");
    auto * v = only_line<gdparse::VarDecl>(unit);
    ASSERT_NE(v, nullptr) << failure_of(unit);
    EXPECT_TRUE(v->infer);
    EXPECT_EQ(v->type, nullptr);
    EXPECT_EQ(shape(v->initialValue), "Attr(Vector2, ZERO)");
  }
  {
    auto unit = parse("var node: Foo.Bar");
    auto * v = only_line<gdparse::VarDecl>(unit);
    ASSERT_NE(v, nullptr) << failure_of(unit);
    EXPECT_EQ(v->type->name, "Foo.Bar");
    EXPECT_EQ(v->initialValue, nullptr);
  }
}

TEST(SyntaxDeclarations, VarModifiers)
{
  auto unit = parse("onready var sprite = $Sprite");
  auto * onready = only_line<gdparse::VarDecl>(unit);
  ASSERT_NE(onready, nullptr) << failure_of(unit);
  EXPECT_EQ(onready->modifier, gdparse::VarModifier::Onready);
  EXPECT_EQ(shape(onready->initialValue), "$Sprite");

  unit = parse("export var health = 3");
  auto * exported = only_line<gdparse::VarDecl>(unit);
  ASSERT_NE(exported, nullptr) << failure_of(unit);
  EXPECT_EQ(exported->modifier, gdparse::VarModifier::Export);
}

TEST(SyntaxDeclarations, SetgetForms)
{
  {
    auto unit = parse("var hp = 3 setget set_hp");
    auto * v = only_line<gdparse::VarDecl>(unit);
    ASSERT_NE(v, nullptr) << failure_of(unit);
    EXPECT_EQ(v->setter, "set_hp");
    EXPECT_FALSE(v->getter.has_value());
  }
  {
    auto unit = parse("var hp: int setget set_hp, get_hp");
    auto * v = only_line<gdparse::VarDecl>(unit);
    ASSERT_NE(v, nullptr) << failure_of(unit);
    EXPECT_EQ(v->setter, "set_hp");
    EXPECT_EQ(v->getter, "get_hp");
  }
  {
    auto unit = parse("var hp setget ,get_hp");
    auto * v = only_line<gdparse::VarDecl>(unit);
    ASSERT_NE(v, nullptr) << failure_of(unit);
    EXPECT_FALSE(v->setter.has_value());
    EXPECT_EQ(v->getter, "get_hp");
  }
  {
    auto unit = parse("var hp setget");
    ASSERT_FALSE(unit.ok());
    EXPECT_EQ(unit.failure->headline(), "expected setter or getter name, found end of input");
  }
}

TEST(SyntaxDeclarations, VarNeedsName)
{
  auto unit = parse("var = 3");
  ASSERT_FALSE(unit.ok());
  EXPECT_EQ(unit.failure->column, 5U);
}

// ============================================================================
// const
// ============================================================================

TEST(SyntaxDeclarations, ConstForms)
{
  {
    auto unit = parse("const MAX_SPEED = 300");
    auto * c = only_line<gdparse::ConstDecl>(unit);
    ASSERT_NE(c, nullptr) << failure_of(unit);
    EXPECT_EQ(c->name, "MAX_SPEED");
    EXPECT_EQ(shape(c->value), "300");
  }
  {
    auto unit = parse("const GRAVITY: float = 9.8");
    auto * c = only_line<gdparse::ConstDecl>(unit);
    ASSERT_NE(c, nullptr) << failure_of(unit);
    EXPECT_EQ(c->type->name, "float");
  }
  {
    auto unit = parse("const Scene := preload(\"res://scene.tscn\")");
    auto * c = only_line<gdparse::ConstDecl>(unit);
    ASSERT_NE(c, nullptr) << failure_of(unit);
    EXPECT_TRUE(c->infer);
    EXPECT_EQ(shape(c->value), "preload(\"res://scene.tscn\")");
  }
}

TEST(SyntaxDeclarations, ConstNeedsInitializer)
{
  auto unit = parse("const X");
  ASSERT_FALSE(unit.ok());
  EXPECT_EQ(unit.failure->headline(), "expected '=', found end of input");

  unit = parse("const X: int");
  EXPECT_FALSE(unit.ok());
}

// ============================================================================
// extends / class_name
// ============================================================================

TEST(SyntaxDeclarations, ExtendsIdentifierOrPath)
{
  auto unit = parse("extends KinematicBody2D");
  auto * by_name = only_line<gdparse::ExtendsDecl>(unit);
  ASSERT_NE(by_name, nullptr) << failure_of(unit);
  EXPECT_EQ(by_name->target, "KinematicBody2D");
  EXPECT_FALSE(by_name->isPath);

  unit = parse("extends \"res://base/enemy.gd\"");
  auto * by_path = only_line<gdparse::ExtendsDecl>(unit);
  ASSERT_NE(by_path, nullptr) << failure_of(unit);
  EXPECT_EQ(by_path->target, "res://base/enemy.gd");
  EXPECT_TRUE(by_path->isPath);

  unit = parse("extends Base.Inner");
  auto * dotted = only_line<gdparse::ExtendsDecl>(unit);
  ASSERT_NE(dotted, nullptr) << failure_of(unit);
  EXPECT_EQ(dotted->target, "Base.Inner");
}

TEST(SyntaxDeclarations, ClassName)
{
  auto unit = parse("class_name Player");
  auto * decl = only_line<gdparse::ClassNameDecl>(unit);
  ASSERT_NE(decl, nullptr) << failure_of(unit);
  EXPECT_EQ(decl->name, "Player");

  EXPECT_FALSE(parse("class_name").ok());
  EXPECT_FALSE(parse("class_name if").ok());
}

// ============================================================================
// enum / signal
// ============================================================================

TEST(SyntaxDeclarations, EnumVariants)
{
  auto unit = parse(
    "enum State {\n"
    "    IDLE,\n"
    "    RUNNING = 5, # explicit\n"
    "    DEAD,\n"
    "}");
  auto * e = only_line<gdparse::EnumDecl>(unit);
  ASSERT_NE(e, nullptr) << failure_of(unit);
  EXPECT_EQ(e->name, "State");
  ASSERT_EQ(e->variants.size(), 3U);
  EXPECT_EQ(e->variants[0]->name, "IDLE");
  EXPECT_EQ(e->variants[0]->value, nullptr);
  EXPECT_EQ(e->variants[1]->name, "RUNNING");
  EXPECT_EQ(shape(e->variants[1]->value), "5");
  EXPECT_EQ(e->variants[2]->name, "DEAD");
}

TEST(SyntaxDeclarations, AnonymousEnum)
{
  auto unit = parse("enum {A, B}");
  auto * e = only_line<gdparse::EnumDecl>(unit);
  ASSERT_NE(e, nullptr) << failure_of(unit);
  EXPECT_TRUE(e->name.empty());
  EXPECT_EQ(e->variants.size(), 2U);
}

TEST(SyntaxDeclarations, Signals)
{
  auto unit = parse("signal died");
  auto * bare = only_line<gdparse::SignalDecl>(unit);
  ASSERT_NE(bare, nullptr) << failure_of(unit);
  EXPECT_EQ(bare->name, "died");
  EXPECT_TRUE(bare->params.empty());

  unit = parse("signal hit(damage, source)");
  auto * with_params = only_line<gdparse::SignalDecl>(unit);
  ASSERT_NE(with_params, nullptr) << failure_of(unit);
  ASSERT_EQ(with_params->params.size(), 2U);
  EXPECT_EQ(with_params->params[0], "damage");
  EXPECT_EQ(with_params->params[1], "source");

  unit = parse("signal empty()");
  auto * empty = only_line<gdparse::SignalDecl>(unit);
  ASSERT_NE(empty, nullptr) << failure_of(unit);
  EXPECT_TRUE(empty->params.empty());
}

// ============================================================================
// func
// ============================================================================

TEST(SyntaxDeclarations, FunctionWithTypedArgsAndReturnType)
{
  auto unit = parse(
    "func move(delta: float, speed = 10, dir := Vector2.UP) -> void:\n"
    "    position += dir * speed * delta\n");
  auto * fn = only_line<gdparse::FunctionDecl>(unit);
  ASSERT_NE(fn, nullptr) << failure_of(unit);

  EXPECT_EQ(fn->name, "move");
  EXPECT_EQ(fn->modifier, gdparse::FunctionModifier::None);
  ASSERT_EQ(fn->args.size(), 3U);
  EXPECT_EQ(fn->args[0]->name, "delta");
  ASSERT_NE(fn->args[0]->type, nullptr);
  EXPECT_EQ(fn->args[0]->type->name, "float");
  EXPECT_EQ(fn->args[0]->defaultValue, nullptr);
  EXPECT_EQ(fn->args[1]->type, nullptr);
  EXPECT_EQ(shape(fn->args[1]->defaultValue), "10");
  EXPECT_EQ(shape(fn->args[2]->defaultValue), "Attr(Vector2, UP)");
  ASSERT_NE(fn->returnType, nullptr);
  EXPECT_EQ(fn->returnType->name, "void");
  ASSERT_EQ(fn->body->lines.size(), 1U);
  EXPECT_TRUE(gdparse::isa<gdparse::AssignStmt>(fn->body->lines[0]));
}

TEST(SyntaxDeclarations, FunctionArgsMaySpanLines)
{
  auto unit = parse(
    "func f(\n"
    "    a, # first\n"
    "    b: int,\n"
    "):\n"
    "    pass\n");
  auto * fn = only_line<gdparse::FunctionDecl>(unit);
  ASSERT_NE(fn, nullptr) << failure_of(unit);
  EXPECT_EQ(fn->args.size(), 2U);
}

TEST(SyntaxDeclarations, FunctionModifiers)
{
  const struct
  {
    const char * src;
    gdparse::FunctionModifier modifier;
  } cases[] = {
    {"static func f():\n    pass\n", gdparse::FunctionModifier::Static},
    {"remote func f():\n    pass\n", gdparse::FunctionModifier::Remote},
    {"master func f():\n    pass\n", gdparse::FunctionModifier::Master},
    {"puppet func f():\n    pass\n", gdparse::FunctionModifier::Puppet},
    {"remotesync func f():\n    pass\n", gdparse::FunctionModifier::RemoteSync},
    {"mastersync func f():\n    pass\n", gdparse::FunctionModifier::MasterSync},
    {"puppetsync func f():\n    pass\n", gdparse::FunctionModifier::PuppetSync},
  };
  for (const auto & tc : cases) {
    auto unit = parse(tc.src);
    auto * fn = only_line<gdparse::FunctionDecl>(unit);
    ASSERT_NE(fn, nullptr) << tc.src << failure_of(unit);
    EXPECT_EQ(fn->modifier, tc.modifier) << tc.src;
  }
}

TEST(SyntaxDeclarations, ModifierWordsAreStillIdentifiers)
{
  auto unit = parse("master = 1");
  EXPECT_NE(only_line<gdparse::AssignStmt>(unit), nullptr) << failure_of(unit);
}

TEST(SyntaxDeclarations, FunctionNeedsBody)
{
  auto unit = parse("func f():\n");
  ASSERT_FALSE(unit.ok());
  EXPECT_EQ(unit.failure->headline(), "expected an indented block");

  unit = parse("func f()\n    pass\n");
  ASSERT_FALSE(unit.ok());
  EXPECT_EQ(unit.failure->headline(), "expected ':', found newline");
}

// ============================================================================
// class
// ============================================================================

TEST(SyntaxDeclarations, InnerClass)
{
  auto unit = parse(
    "class Item extends Reference:\n"
    "    var name := \"\"\n"
    "\n"
    "    func _init(n):\n"
    "        name = n\n");
  auto * cls = only_line<gdparse::ClassDecl>(unit);
  ASSERT_NE(cls, nullptr) << failure_of(unit);
  EXPECT_EQ(cls->name, "Item");
  EXPECT_EQ(cls->base, "Reference");
  ASSERT_EQ(cls->body->lines.size(), 2U);
  EXPECT_TRUE(gdparse::isa<gdparse::VarDecl>(cls->body->lines[0]));
  auto * init = dyn_cast<gdparse::FunctionDecl>(cls->body->lines[1]);
  ASSERT_NE(init, nullptr);
  EXPECT_EQ(init->body->indent, 8U);
}

TEST(SyntaxDeclarations, NestedClasses)
{
  auto unit = parse(
    "class Outer:\n"
    "  class Inner:\n"
    "    const X = 1\n");
  auto * outer = only_line<gdparse::ClassDecl>(unit);
  ASSERT_NE(outer, nullptr) << failure_of(unit);
  EXPECT_FALSE(outer->base.has_value());
  auto * inner = dyn_cast<gdparse::ClassDecl>(outer->body->lines[0]);
  ASSERT_NE(inner, nullptr);
  EXPECT_TRUE(gdparse::isa<gdparse::ConstDecl>(inner->body->lines[0]));
}
