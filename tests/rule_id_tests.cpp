#include <gtest/gtest.h>

#include "../src/rules/rule_id.hpp"
#include "../src/rules/rule_table.hpp"

#include <algorithm>
#include <iterator>
#include <set>
#include <stdexcept>

TEST(RuleIdTest, Parse_AndFormat) {
  auto id = rules::RuleId::Parse("15.1");

  EXPECT_EQ(id.major, 15);
  EXPECT_EQ(id.minor, 1);
  EXPECT_EQ(id.Number(), 1501);
  EXPECT_EQ(id.ToString(), "15.1");
  EXPECT_EQ(rules::RuleId::FromNumber(2014).ToString(), "20.14");
}

TEST(RuleIdTest, Parse_RejectsMalformedIds) {
  EXPECT_THROW(rules::RuleId::Parse("15"), std::invalid_argument);
  EXPECT_THROW(rules::RuleId::Parse("a.1"), std::invalid_argument);
  EXPECT_THROW(rules::RuleId::Parse("15."), std::invalid_argument);
  EXPECT_THROW(rules::RuleId::Parse("1.100"), std::invalid_argument);
}

TEST(RuleTableTest, ContainsEachRuleOnceExcept121) {
  std::multiset<int> numbers;
  for (const auto &rule : rules::RuleTable()) {
    numbers.insert(rule->Id().Number());
  }

  EXPECT_EQ(numbers.count(1201), 2u);
  EXPECT_EQ(numbers.count(1603), 1u);
  EXPECT_EQ(numbers.count(2007), 1u);
  EXPECT_EQ(numbers.count(1003), 1u);
  EXPECT_EQ(rules::SupportedRules().size() + 1, rules::RuleTable().size());
}

TEST(RuleTableTest, RawTokenRules_AreMarked) {
  std::set<int> raw;
  for (const auto &rule : rules::RuleTable()) {
    if (rule->Scope() == rules::RuleScope::kRawTokens) {
      raw.insert(rule->Id().Number());
    }
  }

  std::set<int> expected{301, 302, 401, 402, 701, 703, 814, 905,
                         1201, 1506, 1603, 1706, 2003};
  EXPECT_EQ(raw, expected);
}

TEST(RuleTableTest, SizeofCheckRunsBeforePrecedenceCheck) {
  const auto &table = rules::RuleTable();
  auto first = std::find_if(table.begin(), table.end(), [](const auto &rule) {
    return rule->Id().Number() == 1201;
  });

  ASSERT_NE(first, table.end());
  EXPECT_EQ((*first)->Scope(), rules::RuleScope::kRawTokens);
  EXPECT_EQ((*std::next(first))->Scope(), rules::RuleScope::kConfiguration);
}
