#include <gtest/gtest.h>

#include "../src/rules/checks.hpp"
#include "support/program_builder.hpp"

using Reports = std::vector<std::string>;

class LexicalTest : public ::testing::Test {
protected:
  support::ProgramBuilder builder;

  Reports Run(rules::FunctionRule::CheckFunction check, std::string_view id) {
    rules::FunctionRule rule(rules::RuleId::Parse(id),
                             rules::RuleScope::kRawTokens, check);
    return support::Run(rule, support::MakeUnit(builder.Model()));
  }
};

TEST_F(LexicalTest, NestedCommentMarker) {
  builder.Line(1, "/* outer /* inner */");
  builder.Line(2, "// see http://example.com");
  builder.Line(3, "// start /* here");
  builder.Line(4, "/* url // inside */");

  EXPECT_EQ(Run(rules::checks::NestedCommentMarker, "3.1"),
            (Reports{"1:3.1", "3:3.1", "4:3.1"}));
}

TEST_F(LexicalTest, LineSplicingComment_TrigraphBackslash) {
  builder.Line(1, "x ; // ends with ?\?/");
  builder.Line(2, "y ; // fine");

  EXPECT_EQ(Run(rules::checks::LineSplicingComment, "3.2"), Reports{"1:3.2"});
}

TEST_F(LexicalTest, UnterminatedEscape) {
  builder.Line(1, "a = \"\\x41g\" ;");
  builder.Line(2, "b = \"\\x41\" \"\\x41\\n\" ;");
  builder.Line(3, "c = '\\0' ;");

  EXPECT_EQ(Run(rules::checks::UnterminatedEscape, "4.1"), Reports{"1:4.1"});
}

TEST_F(LexicalTest, Trigraph_InStringLiteral) {
  builder.Line(1, "s = \"?\?=\" ;");
  builder.Line(2, "t = \"?=\" ;");

  EXPECT_EQ(Run(rules::checks::Trigraph, "4.2"), Reports{"1:4.2"});
}

TEST_F(LexicalTest, OctalConstant) {
  builder.Line(1, "a = 017 ;");
  builder.Line(2, "b = 0 ;");
  builder.Line(3, "c = 0x17 ;");

  EXPECT_EQ(Run(rules::checks::OctalConstant, "7.1"), Reports{"1:7.1"});
}

TEST_F(LexicalTest, LowercaseLongSuffix) {
  builder.Line(1, "a = 10l ;");
  builder.Line(2, "b = 10L ;");
  builder.Line(3, "c = 10ul ;");

  EXPECT_EQ(Run(rules::checks::LowercaseLongSuffix, "7.3"),
            (Reports{"1:7.3", "3:7.3"}));
}

TEST_F(LexicalTest, RestrictAndStaticArrayParameter) {
  builder.Line(1, "void f ( int * restrict p , int a [ static 4 ] ) ;");

  EXPECT_EQ(Run(rules::checks::RestrictQualifier, "8.14"), Reports{"1:8.14"});
  EXPECT_EQ(Run(rules::checks::StaticArrayParameter, "17.6"), Reports{"1:17.6"});
}

TEST_F(LexicalTest, DesignatedArraySize) {
  builder.Line(1, "int a [ ] = { [ 0 ] = 1 } ;");
  builder.Line(2, "int b [ 2 ] = { [ 0 ] = 1 } ;");

  EXPECT_EQ(Run(rules::checks::DesignatedArraySize, "9.5"), Reports{"1:9.5"});
}

TEST_F(LexicalTest, SizeofArithmetic) {
  builder.Line(1, "a = sizeof x + 1 ;");
  builder.Line(2, "b = sizeof ( x ) + 1 ;");

  EXPECT_EQ(Run(rules::checks::SizeofArithmetic, "12.1"), Reports{"1:12.1"});
}

TEST_F(LexicalTest, CompoundBody) {
  builder.Line(1, "if ( x ) y ;");
  builder.Line(2, "if ( x ) { y ; } else z ;");
  builder.Line(3, "while ( f ( x ) ) { }");
  builder.Line(4, "for ( ; ; ) /* body */ { }");

  EXPECT_EQ(Run(rules::checks::CompoundBody, "15.6"), (Reports{"1:15.6", "2:15.6"}));
}

TEST_F(LexicalTest, CompoundBody_DoWhileIsNotALoopHeader) {
  builder.Line(1, "do { x ; } while ( y ) ;");

  EXPECT_TRUE(Run(rules::checks::CompoundBody, "15.6").empty());
}

TEST_F(LexicalTest, IncludeSyntax) {
  builder.Line(1, "# include <a.h>");
  builder.Line(2, "# include <b.h> junk");
  builder.Line(3, "# include \"c.h\" // comment");

  EXPECT_EQ(Run(rules::checks::IncludeSyntax, "20.3"), Reports{"2:20.3"});
}
