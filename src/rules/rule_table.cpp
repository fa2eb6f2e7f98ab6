#include "rule_table.hpp"

#include "checks.hpp"
#include "switch_fallthrough.hpp"

#include <algorithm>

namespace rules {

namespace {

struct TableEntry {
  int major;
  int minor;
  RuleScope scope;
  FunctionRule::CheckFunction check;
};

constexpr auto kAst = RuleScope::kConfiguration;
constexpr auto kRaw = RuleScope::kRawTokens;

// 16.3 is a class of its own and is inserted after 16.2
const TableEntry kEntries[] = {
    {2, 7, kAst, checks::UnusedParameter},
    {3, 1, kRaw, checks::NestedCommentMarker},
    {3, 2, kRaw, checks::LineSplicingComment},
    {4, 1, kRaw, checks::UnterminatedEscape},
    {4, 2, kRaw, checks::Trigraph},
    {5, 1, kAst, checks::ExternalIdentifierClash},
    {5, 2, kAst, checks::ScopeIdentifierClash},
    {5, 3, kAst, checks::IdentifierHiding},
    {5, 4, kAst, checks::MacroNameClash},
    {5, 5, kAst, checks::IdentifierMacroClash},
    {7, 1, kRaw, checks::OctalConstant},
    {7, 3, kRaw, checks::LowercaseLongSuffix},
    {8, 11, kAst, checks::ExternArraySize},
    {8, 12, kAst, checks::DuplicateEnumValue},
    {8, 14, kRaw, checks::RestrictQualifier},
    {9, 5, kRaw, checks::DesignatedArraySize},
    {10, 1, kAst, checks::ShiftOperandCategory},
    {10, 3, kAst, checks::NarrowingAssignment},
    {10, 4, kAst, checks::MixedCategories},
    {10, 6, kAst, checks::CompositeWidening},
    {10, 8, kAst, checks::CompositeCast},
    {11, 3, kAst, checks::IncompatibleObjectPointerCast},
    {11, 4, kAst, checks::PointerIntegerCast},
    {11, 5, kAst, checks::VoidPointerConversion},
    {11, 6, kAst, checks::VoidPointerArithmeticCast},
    {11, 7, kAst, checks::PointerNonIntegerCast},
    {11, 8, kAst, checks::CastAwayConst},
    {11, 9, kAst, checks::IntegerNullPointer},
    {12, 1, kRaw, checks::SizeofArithmetic},
    {12, 1, kAst, checks::ImplicitPrecedence},
    {12, 2, kAst, checks::ShiftWidth},
    {12, 3, kAst, checks::CommaOperator},
    {12, 4, kAst, checks::UnsignedWrap},
    {13, 1, kAst, checks::InitializerSideEffect},
    {13, 3, kAst, checks::IncrementWithSideEffects},
    {13, 4, kAst, checks::AssignmentResultUsed},
    {13, 5, kAst, checks::LogicalOperandSideEffect},
    {13, 6, kAst, checks::SizeofSideEffect},
    {14, 1, kAst, checks::FloatLoopCounter},
    {14, 2, kAst, checks::MalformedForLoop},
    {14, 4, kAst, checks::NonBooleanCondition},
    {15, 1, kAst, checks::Goto},
    {15, 2, kAst, checks::BackwardGoto},
    {15, 3, kAst, checks::GotoIntoBlock},
    {15, 5, kAst, checks::MultipleExits},
    {15, 6, kRaw, checks::CompoundBody},
    {15, 7, kAst, checks::UnterminatedElseIf},
    {16, 2, kAst, checks::MisplacedCase},
    {16, 4, kAst, checks::MissingDefault},
    {16, 5, kAst, checks::MisplacedDefault},
    {16, 6, kAst, checks::SingleClauseSwitch},
    {16, 7, kAst, checks::BooleanSwitch},
    {17, 1, kAst, checks::VariadicArguments},
    {17, 2, kAst, checks::Recursion},
    {17, 6, kRaw, checks::StaticArrayParameter},
    {17, 7, kAst, checks::UnusedReturnValue},
    {17, 8, kAst, checks::ParameterModified},
    {18, 4, kAst, checks::PointerArithmetic},
    {18, 5, kAst, checks::PointerNesting},
    {18, 7, kAst, checks::FlexibleArrayMember},
    {18, 8, kAst, checks::VariableLengthArray},
    {19, 2, kAst, checks::UnionKeyword},
    {20, 1, kAst, checks::LateInclude},
    {20, 2, kAst, checks::IncludeHeaderName},
    {20, 3, kRaw, checks::IncludeSyntax},
    {20, 4, kAst, checks::KeywordMacro},
    {20, 5, kAst, checks::Undef},
    {20, 7, kAst, checks::UnparenthesizedMacroParameter},
    {20, 10, kAst, checks::StringifyOperator},
    {20, 13, kAst, checks::UnknownDirective},
    {20, 14, kAst, checks::ConditionalAcrossFiles},
    {21, 1, kAst, checks::ReservedIdentifier},
    {21, 3, kAst, checks::DynamicMemory},
    {21, 4, kAst, checks::Setjmp},
    {21, 5, kAst, checks::Signal},
    {21, 6, kAst, checks::StandardIo},
    {21, 7, kAst, checks::StringConversion},
    {21, 8, kAst, checks::ProcessControl},
    {21, 9, kAst, checks::SearchAndSort},
    {21, 10, kAst, checks::TimeFunctions},
    {21, 11, kAst, checks::TypeGenericMath},
    {21, 12, kAst, checks::FloatingExceptions},
};

std::vector<std::unique_ptr<Rule>> BuildTable() {
  std::vector<std::unique_ptr<Rule>> table;
  for (const auto &entry : kEntries) {
    table.push_back(std::make_unique<FunctionRule>(
        RuleId{entry.major, entry.minor}, entry.scope, entry.check));
    if (entry.major == 16 && entry.minor == 2) {
      table.push_back(std::make_unique<SwitchFallthroughRule>());
    }
  }
  return table;
}

} // namespace

const std::vector<std::unique_ptr<Rule>> &RuleTable() {
  static const std::vector<std::unique_ptr<Rule>> table = BuildTable();
  return table;
}

std::vector<RuleId> SupportedRules() {
  std::vector<RuleId> ids;
  for (const auto &rule : RuleTable()) {
    ids.push_back(rule->Id());
  }
  std::sort(ids.begin(), ids.end());
  ids.erase(std::unique(ids.begin(), ids.end()), ids.end());
  return ids;
}

const std::vector<RuleId> &AnalyzerRules() {
  static const std::vector<RuleId> kRules{
      {1, 3},  {2, 1},  {2, 2},  {2, 4},  {2, 6},  {8, 3},  {12, 2},
      {13, 2}, {13, 6}, {14, 3}, {17, 5}, {18, 1}, {18, 2}, {18, 3},
      {18, 6}, {20, 6}, {22, 1}, {22, 2}, {22, 4}, {22, 6}};
  return kRules;
}

} // namespace rules
