#include <gtest/gtest.h>

#include "../src/models/location.hpp"
#include "../src/models/refs.hpp"
#include "support/program_builder.hpp"

TEST(TokenRefTest, EmptyHandle_NavigatesToEmptyHandles) {
  models::TokenRef token;

  EXPECT_FALSE(token);
  EXPECT_FALSE(token.Next());
  EXPECT_FALSE(token.Operand1());
  EXPECT_FALSE(token.Scope());
  EXPECT_FALSE(token.Variable());
  EXPECT_EQ(token.Str(), "");
  EXPECT_EQ(token.Type(), nullptr);
  EXPECT_FALSE(token.Is(""));
}

TEST(TokenRefTest, EmptyHandles_CompareEqual) {
  support::ProgramBuilder builder;
  builder.Line(1, "x ;");

  EXPECT_EQ(models::TokenRef(), builder.Tok("x").Previous());
  EXPECT_NE(builder.Tok("x"), builder.Tok(";"));
}

TEST(TokenRefTest, OutOfRangeIndex_IsInvalid) {
  support::ProgramBuilder builder;
  builder.Line(1, "x ;");

  EXPECT_FALSE(builder.Tok(5));
  EXPECT_FALSE(builder.Tok(-1));
}

TEST(TokenRefTest, Sequence_LinksAndBrackets) {
  support::ProgramBuilder builder;
  builder.Line(1, "f ( a [ 1 ] ) ;");

  auto lpar = builder.Tok("(");
  EXPECT_EQ(lpar.Previous().Str(), "f");
  EXPECT_EQ(lpar.Next().Str(), "a");
  EXPECT_EQ(lpar.Link(), builder.Tok(")"));
  EXPECT_EQ(builder.Tok("]").Link(), builder.Tok("["));
}

TEST(TokenRefTest, AstEdges_ResolveThroughModel) {
  support::ProgramBuilder builder;
  builder.Line(1, "x = y + 1 ;");
  builder.Ast(builder.Find("+"), builder.Find("y"), builder.Find("1"));
  builder.Ast(builder.Find("="), builder.Find("x"), builder.Find("+"));

  auto assign = builder.Tok("=");
  EXPECT_EQ(assign.Operand1().Str(), "x");
  EXPECT_EQ(assign.Operand2().Operand2().Str(), "1");
  EXPECT_EQ(builder.Tok("y").Parent().Parent(), assign);
  EXPECT_FALSE(assign.Parent());
}

TEST(ScopeRefTest, NestedIn_WalksToGlobal) {
  support::ProgramBuilder builder;
  builder.Line(1, "void f ( ) { if ( x ) { } }");
  int global = builder.AddScope(models::ScopeType::kGlobal, models::kNoIndex,
                                models::kNoIndex);
  int function = builder.AddScope(models::ScopeType::kFunction,
                                  builder.Find("{"), builder.Find("}", 1),
                                  global, "f");
  builder.AddScope(models::ScopeType::kIf, builder.Find("{", 1),
                   builder.Find("}"), function);

  auto scope = builder.Tok("{", 1).Scope();
  EXPECT_TRUE(scope.IsType(models::ScopeType::kIf));
  EXPECT_TRUE(scope.NestedIn().IsType(models::ScopeType::kFunction));
  EXPECT_EQ(scope.NestedIn()->class_name, "f");
  EXPECT_TRUE(scope.NestedIn().NestedIn().IsType(models::ScopeType::kGlobal));
  EXPECT_FALSE(scope.NestedIn().NestedIn().NestedIn());
  EXPECT_EQ(builder.Tok("x").Scope().BodyEnd(), builder.Tok("}", 1));
}

TEST(VariableRefTest, TypeTokens_AndFunctionArguments) {
  support::ProgramBuilder builder;
  builder.Line(1, "void f ( unsigned int n ) { n ; }");
  int scope = builder.AddScope(models::ScopeType::kFunction, builder.Find("{"),
                               builder.Find("}"));
  int var = builder.AddVariable(builder.Find("n"), builder.Find("unsigned"),
                                builder.Find("int"), scope);
  int function = builder.AddFunction("f", builder.Find("f"));
  builder.Model().functions[function].arguments[1] = var;

  auto use = builder.Tok("n", 1);
  ASSERT_TRUE(use.Variable());
  EXPECT_EQ(use.Variable().TypeStartToken().Str(), "unsigned");
  EXPECT_EQ(use.Variable().TypeEndToken().Str(), "int");
  EXPECT_EQ(use.Variable().NameToken(), builder.Tok("n"));
  EXPECT_EQ(builder.Tok("f").Function().Argument(1), use.Variable());
  EXPECT_FALSE(builder.Tok("f").Function().Argument(2));
}

TEST(LocationTest, Of_Token_And_EmptyHandle) {
  support::ProgramBuilder builder("dir/a.c");
  builder.Line(7, "int   x ;");

  auto location = models::Location::Of(builder.Tok("x"));
  EXPECT_EQ(location.file, "dir/a.c");
  EXPECT_EQ(location.line, 7);
  EXPECT_EQ(location.column, 7);

  auto empty = models::Location::Of(models::TokenRef());
  EXPECT_EQ(empty.file, "");
  EXPECT_EQ(empty.line, 0);
}
