#include <gtest/gtest.h>

#include "../src/rules/checks.hpp"
#include "support/program_builder.hpp"

using Reports = std::vector<std::string>;

class DeclarationsTest : public ::testing::Test {
protected:
  support::ProgramBuilder builder;

  Reports Run(rules::FunctionRule::CheckFunction check, std::string_view id) {
    return support::Run(check, rules::RuleId::Parse(id),
                        support::MakeUnit(builder.Model()));
  }

  void SetValue(int token, long long value, int type_scope) {
    auto &tok = builder.Model().tokens[token];
    models::Value known;
    known.int_value = value;
    known.known = true;
    tok.values.push_back(known);
    builder.Type(token, models::TypeKind::kInt, models::Sign::kSigned);
    tok.value_type->type_scope = type_scope;
  }
};

TEST_F(DeclarationsTest, ExternArraySize) {
  builder.Line(1, "extern int a [ ] ;");
  builder.Line(2, "extern int b [ 4 ] ;");
  int global = builder.AddScope(models::ScopeType::kGlobal, models::kNoIndex,
                                models::kNoIndex);
  for (auto &token : builder.Model().tokens) {
    token.scope = global;
  }
  int a = builder.AddVariable(builder.Find("a"), builder.Find("int"), builder.Find("int"));
  int b = builder.AddVariable(builder.Find("b"), builder.Find("int", 1),
                              builder.Find("int", 1));
  builder.Model().variables[a].is_extern = true;
  builder.Model().variables[b].is_extern = true;

  EXPECT_EQ(Run(rules::checks::ExternArraySize, "8.11"), Reports{"1:8.11"});
}

TEST_F(DeclarationsTest, DuplicateEnumValue_ImplicitCollision) {
  builder.Line(1, "enum e { a = 2 , b = 1 , c } ;");
  int scope = builder.AddScope(models::ScopeType::kEnum, builder.Find("{"),
                               builder.Find("}"), models::kNoIndex, "e");
  SetValue(builder.Find("a"), 2, scope);
  SetValue(builder.Find("b"), 1, scope);
  SetValue(builder.Find("c"), 2, scope);

  EXPECT_EQ(Run(rules::checks::DuplicateEnumValue, "8.12"), Reports{"1:8.12"});
}

TEST_F(DeclarationsTest, DuplicateEnumValue_ExplicitDuplicatesAllowed) {
  builder.Line(1, "enum e { a = 1 , b = 1 , c } ;");
  int scope = builder.AddScope(models::ScopeType::kEnum, builder.Find("{"),
                               builder.Find("}"), models::kNoIndex, "e");
  SetValue(builder.Find("a"), 1, scope);
  SetValue(builder.Find("b"), 1, scope);
  SetValue(builder.Find("c"), 2, scope);

  EXPECT_TRUE(Run(rules::checks::DuplicateEnumValue, "8.12").empty());
}

TEST_F(DeclarationsTest, PointerNesting_MoreThanTwoLevels) {
  builder.Line(1, "int * * * p ;");
  builder.Line(2, "int * * q ;");
  int p = builder.AddVariable(builder.Find("p"), builder.Find("int"), builder.Find("*", 2));
  int q = builder.AddVariable(builder.Find("q"), builder.Find("int", 1),
                              builder.Find("*", 4));
  builder.Model().variables[p].is_pointer = true;
  builder.Model().variables[q].is_pointer = true;

  EXPECT_EQ(Run(rules::checks::PointerNesting, "18.5"), Reports{"1:18.5"});
}

TEST_F(DeclarationsTest, FlexibleArrayMember) {
  builder.Line(1, "struct s {");
  builder.Line(2, "int n ;");
  builder.Line(3, "int data [ ] ;");
  builder.Line(4, "} ;");
  builder.AddScope(models::ScopeType::kStruct, builder.Find("{"), builder.Find("}"),
                   models::kNoIndex, "s");

  EXPECT_EQ(Run(rules::checks::FlexibleArrayMember, "18.7"), Reports{"3:18.7"});
}

TEST_F(DeclarationsTest, VariableLengthArray) {
  builder.Line(1, "int a [ n ] ;");
  builder.Line(2, "int b [ 4 + 1 ] ;");
  builder.Ast(builder.Find("["), builder.Find("a"), builder.Find("n"));
  builder.Ast(builder.Find("+"), builder.Find("4"), builder.Find("1"));
  builder.Ast(builder.Find("[", 1), builder.Find("b"), builder.Find("+"));
  for (auto name : {"a", "b"}) {
    int index = builder.Find(name);
    int var = builder.AddVariable(index, index - 1, index - 1);
    builder.Model().variables[var].is_array = true;
    builder.Model().variables[var].is_local = true;
  }

  EXPECT_EQ(Run(rules::checks::VariableLengthArray, "18.8"), Reports{"1:18.8"});
}

TEST_F(DeclarationsTest, UnionKeyword) {
  builder.Line(1, "union u { int i ; float f ; } ;");

  EXPECT_EQ(Run(rules::checks::UnionKeyword, "19.2"), Reports{"1:19.2"});
}
