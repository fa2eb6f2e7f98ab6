#include <gtest/gtest.h>

#include "../src/rules/checks.hpp"
#include "support/program_builder.hpp"

using models::TypeKind;
using Reports = std::vector<std::string>;

class PointersTest : public ::testing::Test {
protected:
  support::ProgramBuilder builder;

  /* a line starting with a cast; the operand follows the closing paren */
  int Cast(int line, std::string_view text) {
    int cast = builder.Line(line, text);
    builder.Ast(cast, builder.Model().tokens[cast].link + 1);
    return cast;
  }

  void SetType(int token, TypeKind kind, int pointer, int constness = 0) {
    builder.Type(token, kind, std::nullopt, pointer);
    builder.Model().tokens[token].value_type->constness = constness;
  }

  Reports Run(rules::FunctionRule::CheckFunction check, std::string_view id) {
    return support::Run(check, rules::RuleId::Parse(id),
                        support::MakeUnit(builder.Model()));
  }
};

TEST_F(PointersTest, IncompatibleObjectPointerCast) {
  int c1 = Cast(1, "( int * ) fp ;");
  int c2 = Cast(2, "( char * ) fp ;");
  int c3 = Cast(3, "( int * ) ip ;");
  SetType(c1, TypeKind::kInt, 1);
  SetType(c2, TypeKind::kChar, 1);
  SetType(c3, TypeKind::kInt, 1);
  SetType(builder.Find("fp"), TypeKind::kFloat, 1);
  SetType(builder.Find("fp", 1), TypeKind::kFloat, 1);
  SetType(builder.Find("ip"), TypeKind::kInt, 1);

  EXPECT_EQ(Run(rules::checks::IncompatibleObjectPointerCast, "11.3"),
            Reports{"1:11.3"});
}

TEST_F(PointersTest, PointerIntegerCast_BothDirections) {
  int c1 = Cast(1, "( long ) p ;");
  int c2 = Cast(2, "( int * ) n ;");
  int c3 = Cast(3, "( long ) vp ;");
  SetType(c1, TypeKind::kLong, 0);
  SetType(builder.Find("p"), TypeKind::kInt, 1);
  SetType(c2, TypeKind::kInt, 1);
  SetType(builder.Find("n"), TypeKind::kInt, 0);
  SetType(c3, TypeKind::kLong, 0);
  SetType(builder.Find("vp"), TypeKind::kVoid, 1);

  EXPECT_EQ(Run(rules::checks::PointerIntegerCast, "11.4"),
            (Reports{"1:11.4", "2:11.4"}));
}

TEST_F(PointersTest, VoidPointerConversion_AssignmentAndCast) {
  builder.Line(1, "ip = vp ;");
  builder.Ast(builder.Find("="), builder.Find("ip"), builder.Find("vp"));
  SetType(builder.Find("ip"), TypeKind::kInt, 1);
  SetType(builder.Find("vp"), TypeKind::kVoid, 1);

  int c2 = Cast(2, "( int * ) vp ;");
  SetType(c2, TypeKind::kInt, 1);
  SetType(builder.Find("vp", 1), TypeKind::kVoid, 1);

  int c3 = builder.Line(3, "( int * ) malloc ( 4 ) ;");
  int call = builder.Find("(", 2);
  builder.Ast(call, builder.Find("malloc"), builder.Find("4"));
  builder.Ast(c3, call);
  SetType(c3, TypeKind::kInt, 1);
  SetType(call, TypeKind::kVoid, 1);

  EXPECT_EQ(Run(rules::checks::VoidPointerConversion, "11.5"),
            (Reports{"1:11.5", "2:11.5"}));
}

TEST_F(PointersTest, VoidPointerArithmeticCast_NullConstantAllowed) {
  int c1 = Cast(1, "( void * ) n ;");
  int c2 = Cast(2, "( void * ) 0 ;");
  int c3 = Cast(3, "( long ) vp ;");
  SetType(c1, TypeKind::kVoid, 1);
  SetType(builder.Find("n"), TypeKind::kInt, 0);
  SetType(c2, TypeKind::kVoid, 1);
  SetType(builder.Find("0"), TypeKind::kInt, 0);
  SetType(c3, TypeKind::kLong, 0);
  SetType(builder.Find("vp"), TypeKind::kVoid, 1);

  EXPECT_EQ(Run(rules::checks::VoidPointerArithmeticCast, "11.6"),
            (Reports{"1:11.6", "3:11.6"}));
}

TEST_F(PointersTest, PointerNonIntegerCast) {
  int c1 = Cast(1, "( float ) p ;");
  int c2 = Cast(2, "( long ) q ;");
  SetType(c1, TypeKind::kFloat, 0);
  SetType(builder.Find("p"), TypeKind::kInt, 1);
  SetType(c2, TypeKind::kLong, 0);
  SetType(builder.Find("q"), TypeKind::kInt, 1);

  EXPECT_EQ(Run(rules::checks::PointerNonIntegerCast, "11.7"), Reports{"1:11.7"});
}

TEST_F(PointersTest, CastAwayConst) {
  int c1 = Cast(1, "( int * ) cp ;");
  int c2 = Cast(2, "( const int * ) cp ;");
  SetType(c1, TypeKind::kInt, 1, 0);
  SetType(c2, TypeKind::kInt, 1, 1);
  SetType(builder.Find("cp"), TypeKind::kInt, 1, 1);
  SetType(builder.Find("cp", 1), TypeKind::kInt, 1, 1);

  EXPECT_EQ(Run(rules::checks::CastAwayConst, "11.8"), Reports{"1:11.8"});
}

TEST_F(PointersTest, CastAwayConst_ConstArgumentToMutableParameter) {
  builder.Line(1, "void f ( int * p ) ;");
  builder.Line(2, "f ( cp ) ;");
  int p = builder.AddVariable(builder.Find("p"), builder.Find("int"),
                              builder.Find("*"));
  builder.Model().variables[p].is_pointer = true;
  int f = builder.AddFunction("f", builder.Find("f"));
  builder.Model().functions[f].arguments = {{1, p}};
  int call = builder.Find("(", 1);
  builder.Ast(call, builder.Find("f", 1), builder.Find("cp"));
  SetType(builder.Find("cp"), TypeKind::kInt, 1, 1);

  EXPECT_EQ(Run(rules::checks::CastAwayConst, "11.8"), Reports{"2:11.8"});
}

TEST_F(PointersTest, IntegerNullPointer) {
  builder.Line(1, "p = 0 ;");
  builder.Line(2, "p = NULL ;");
  for (int i = 0; i < 2; ++i) {
    int assign = builder.Find("=", i);
    builder.Ast(assign, assign - 1, assign + 1);
    SetType(assign - 1, TypeKind::kInt, 1);
    SetType(assign + 1, TypeKind::kInt, 0);
    models::Value zero;
    zero.int_value = 0;
    zero.known = true;
    builder.Model().tokens[assign + 1].values.push_back(zero);
  }

  EXPECT_EQ(Run(rules::checks::IntegerNullPointer, "11.9"), Reports{"1:11.9"});
}

TEST_F(PointersTest, PointerArithmetic) {
  builder.Line(1, "p + 1 ;");
  builder.Line(2, "i + 1 ;");
  for (int i = 0; i < 2; ++i) {
    int plus = builder.Find("+", i);
    builder.Ast(plus, plus - 1, plus + 1);
    SetType(plus + 1, TypeKind::kInt, 0);
  }
  SetType(builder.Find("p"), TypeKind::kInt, 1);
  SetType(builder.Find("i"), TypeKind::kInt, 0);

  EXPECT_EQ(Run(rules::checks::PointerArithmetic, "18.4"), Reports{"1:18.4"});
}
