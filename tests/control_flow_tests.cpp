#include <gtest/gtest.h>

#include "../src/rules/checks.hpp"
#include "support/program_builder.hpp"

using Reports = std::vector<std::string>;

class ControlFlowTest : public ::testing::Test {
protected:
  support::ProgramBuilder builder;

  /* wires "for ( init ; cond ; step )" the way the analyzer does */
  void ForLoop(int occurrence, int init, int cond, int step) {
    int for_token = builder.Find("for", occurrence);
    int lpar = for_token + 1;
    int first = builder.Find(";", 2 * occurrence);
    int second = builder.Find(";", 2 * occurrence + 1);
    builder.Ast(lpar, for_token, first);
    builder.Ast(first, init, second);
    builder.Ast(second, cond, step);
  }

  Reports Run(rules::FunctionRule::CheckFunction check, std::string_view id) {
    return support::Run(check, rules::RuleId::Parse(id),
                        support::MakeUnit(builder.Model()));
  }
};

TEST_F(ControlFlowTest, FloatLoopCounter_ForCondition) {
  builder.Line(1, "for ( ; f < 10.0 ; f ++ ) { }");
  builder.Line(2, "for ( ; i < 10 ; i ++ ) { }");
  for (int i = 0; i < 2; ++i) {
    int less = builder.Find("<", i);
    builder.Ast(less, less - 1, less + 1);
    int inc = builder.Find("++", i);
    builder.Ast(inc, inc - 1);
    ForLoop(i, models::kNoIndex, less, inc);
  }
  builder.Type(builder.Find("f", 0), models::TypeKind::kFloat);
  builder.Type(builder.Find("i", 0), models::TypeKind::kInt, models::Sign::kSigned);

  EXPECT_EQ(Run(rules::checks::FloatLoopCounter, "14.1"), Reports{"1:14.1"});
}

TEST_F(ControlFlowTest, FloatLoopCounter_WhileBodyModifiesCounter) {
  builder.Line(1, "while ( f < 1.0 ) { f += 0.1 ; }");
  int less = builder.Find("<");
  builder.Ast(less, less - 1, less + 1);
  builder.Ast(builder.Find("("), builder.Find("while"), less);
  builder.Ast(builder.Find("+="), builder.Find("f", 1), builder.Find("0.1"));
  builder.Type(builder.Find("f"), models::TypeKind::kFloat);

  EXPECT_EQ(Run(rules::checks::FloatLoopCounter, "14.1"), Reports{"1:14.1"});
}

TEST_F(ControlFlowTest, MalformedForLoop_InitAndConditionSideEffects) {
  builder.Line(1, "for ( i ++ ; i < 10 ; i ++ ) { }");
  builder.Line(2, "for ( i = 0 ; i < 10 ; i ++ ) { }");
  builder.Line(3, "for ( i = 0 ; i ++ < 10 ; ) { }");

  int increment = builder.Find("++");
  builder.Ast(increment, increment - 1);
  ForLoop(0, increment, models::kNoIndex, models::kNoIndex);

  int assign = builder.Find("=");
  builder.Ast(assign, assign - 1, assign + 1);
  ForLoop(1, assign, models::kNoIndex, models::kNoIndex);

  assign = builder.Find("=", 1);
  builder.Ast(assign, assign - 1, assign + 1);
  increment = builder.Find("++", 3);
  builder.Ast(increment, increment - 1);
  int less = builder.Find("<", 2);
  builder.Ast(less, increment, less + 1);
  ForLoop(2, assign, less, models::kNoIndex);

  EXPECT_EQ(Run(rules::checks::MalformedForLoop, "14.2"),
            (Reports{"1:14.2", "3:14.2"}));
}

TEST_F(ControlFlowTest, NonBooleanCondition) {
  builder.Line(1, "if ( x ) { }");
  builder.Line(2, "if ( x == 1 ) { }");
  builder.Ast(builder.Find("("), builder.Find("if"), builder.Find("x"));
  int equal = builder.Find("==");
  builder.Ast(equal, equal - 1, equal + 1);
  builder.Ast(builder.Find("(", 1), builder.Find("if", 1), equal);

  EXPECT_EQ(Run(rules::checks::NonBooleanCondition, "14.4"), Reports{"1:14.4"});
}

TEST_F(ControlFlowTest, Goto) {
  builder.Line(3, "goto end ;");

  EXPECT_EQ(Run(rules::checks::Goto, "15.1"), Reports{"3:15.1"});
}

TEST_F(ControlFlowTest, BackwardGoto) {
  builder.Line(1, "void f ( ) { again : x ; goto again ; }");
  builder.Line(2, "void g ( ) { goto done ; done : ; }");
  builder.AddScope(models::ScopeType::kFunction, builder.Find("{"), builder.Find("}"));
  builder.AddScope(models::ScopeType::kFunction, builder.Find("{", 1),
                   builder.Find("}", 1));

  EXPECT_EQ(Run(rules::checks::BackwardGoto, "15.2"), Reports{"1:15.2"});
}

TEST_F(ControlFlowTest, GotoIntoBlock) {
  builder.Line(1, "void f ( ) { goto inner ; if ( x ) { inner : ; } }");
  builder.Line(2, "void g ( ) { if ( x ) { goto out ; } out : ; }");
  int f = builder.AddScope(models::ScopeType::kFunction, builder.Find("{"),
                           builder.Find("}", 1));
  builder.AddScope(models::ScopeType::kIf, builder.Find("{", 1), builder.Find("}"), f);
  int g = builder.AddScope(models::ScopeType::kFunction, builder.Find("{", 2),
                           builder.Find("}", 3));
  builder.AddScope(models::ScopeType::kIf, builder.Find("{", 3), builder.Find("}", 2), g);

  EXPECT_EQ(Run(rules::checks::GotoIntoBlock, "15.3"), Reports{"1:15.3"});
}

TEST_F(ControlFlowTest, MultipleExits_ReturnInsideBlock) {
  builder.Line(1, "void f ( ) {");
  builder.Line(2, "if ( x ) { return ; }");
  builder.Line(3, "return ;");
  builder.Line(4, "}");
  int f = builder.AddScope(models::ScopeType::kFunction, builder.Find("{"),
                           builder.Find("}", 1));
  builder.AddScope(models::ScopeType::kIf, builder.Find("{", 1), builder.Find("}"), f);

  EXPECT_EQ(Run(rules::checks::MultipleExits, "15.5"), Reports{"2:15.5"});
}

TEST_F(ControlFlowTest, UnterminatedElseIf) {
  builder.Line(1, "if ( a ) { } else { if ( b ) { } }");
  builder.Line(2, "if ( a ) { } else { if ( b ) { } else { } }");
  // the analyzer inserts the braces of "else if" at column 0
  builder.Model().tokens[builder.Find("{", 1)].column = 0;
  builder.Model().tokens[builder.Find("{", 4)].column = 0;
  builder.AddScope(models::ScopeType::kElse, builder.Find("{", 1), builder.Find("}", 2));
  builder.AddScope(models::ScopeType::kElse, builder.Find("{", 4), builder.Find("}", 6));

  EXPECT_EQ(Run(rules::checks::UnterminatedElseIf, "15.7"), Reports{"1:15.7"});
}

TEST_F(ControlFlowTest, MisplacedCase_NestedInIf) {
  builder.Line(1, "switch ( x ) {");
  builder.Line(2, "case 1 : if ( y ) { case 2 : ; }");
  builder.Line(3, "}");
  int body = builder.AddScope(models::ScopeType::kSwitch, builder.Find("{"),
                              builder.Find("}", 1));
  builder.AddScope(models::ScopeType::kIf, builder.Find("{", 1), builder.Find("}"), body);

  EXPECT_EQ(Run(rules::checks::MisplacedCase, "16.2"), Reports{"2:16.2"});
}

TEST_F(ControlFlowTest, MissingDefault) {
  builder.Line(1, "switch ( x ) { case 1 : break ; }");
  builder.Line(2, "switch ( y ) { default : break ; }");

  EXPECT_EQ(Run(rules::checks::MissingDefault, "16.4"), Reports{"1:16.4"});
}

TEST_F(ControlFlowTest, MisplacedDefault) {
  builder.Line(1, "switch ( x ) { case 1 : break ; default : break ; case 2 : break ; }");
  builder.Line(2, "switch ( y ) { case 1 : break ; default : break ; }");
  builder.Line(3, "switch ( z ) { default : break ; case 1 : break ; }");

  EXPECT_EQ(Run(rules::checks::MisplacedDefault, "16.5"), Reports{"1:16.5"});
}

TEST_F(ControlFlowTest, SingleClauseSwitch) {
  builder.Line(1, "switch ( x ) { default : break ; }");
  builder.Line(2, "switch ( y ) { case 1 : break ; default : break ; }");
  builder.Line(3, "switch ( z ) { case 1 : { return ; } default : break ; }");

  EXPECT_EQ(Run(rules::checks::SingleClauseSwitch, "16.6"), Reports{"1:16.6"});
}

TEST_F(ControlFlowTest, BooleanSwitch) {
  builder.Line(1, "switch ( x == 1 ) { }");
  builder.Line(2, "switch ( x ) { }");
  int equal = builder.Find("==");
  builder.Ast(equal, equal - 1, equal + 1);
  builder.Ast(builder.Find("("), builder.Find("switch"), equal);
  builder.Ast(builder.Find("(", 1), builder.Find("switch", 1), builder.Find("x", 1));

  EXPECT_EQ(Run(rules::checks::BooleanSwitch, "16.7"), Reports{"1:16.7"});
}
