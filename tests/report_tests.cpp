#include <gtest/gtest.h>

#include "../src/report/aggregator.hpp"
#include "../src/report/reporting_sink.hpp"
#include "../src/report/rule_texts.hpp"
#include "../src/report/verify_sink.hpp"
#include "support/program_builder.hpp"

#include <algorithm>

using rules::RuleId;

namespace {

struct CollectingWriter : report::ViolationWriter {
  void Write(const report::Violation &violation) override {
    violations.push_back(violation);
  }

  std::vector<report::Violation> violations;
};

} // namespace

class ReportingSinkTest : public ::testing::Test {
protected:
  suppress::SuppressionRegistry registry;
  report::RuleTexts texts;
  report::Aggregator aggregator;
  CollectingWriter writer;

  void Report(const std::string &file, int line, std::string_view rule) {
    report::ReportingSink sink(registry, texts, aggregator, writer);
    sink.Report(models::Location{file, line, 5}, RuleId::Parse(rule));
  }
};

TEST_F(ReportingSinkTest, WithoutText_UsesGenericMessage) {
  Report("a.c", 3, "15.1");

  ASSERT_EQ(writer.violations.size(), 1u);
  const auto &violation = writer.violations.front();
  EXPECT_EQ(violation.file, "a.c");
  EXPECT_EQ(violation.line, 3);
  EXPECT_EQ(violation.column, 5);
  EXPECT_EQ(violation.severity, "style");
  EXPECT_EQ(violation.addon, "misra");
  EXPECT_EQ(violation.error_id, "c2012-15.1");
  EXPECT_EQ(violation.misra_severity, "Undefined");
  EXPECT_EQ(violation.message, report::kGenericMessage);
  EXPECT_EQ(aggregator.Buckets().at("Undefined"),
            std::vector<std::string>{"misra-c2012-15.1"});
}

TEST_F(ReportingSinkTest, WithText_UsesCatalogTextAndSeverity) {
  texts.Add(RuleId::Parse("15.1"), "The goto statement should not be used",
            "Advisory");
  Report("a.c", 3, "15.1");

  ASSERT_EQ(writer.violations.size(), 1u);
  EXPECT_EQ(writer.violations.front().message,
            "The goto statement should not be used");
  EXPECT_EQ(writer.violations.front().misra_severity, "Advisory");
  EXPECT_EQ(aggregator.Buckets().count("Advisory"), 1u);
}

TEST_F(ReportingSinkTest, UnknownSeverityInCatalog_IsUndefined) {
  texts.Add(RuleId::Parse("15.1"), "The goto statement should not be used",
            "Sometimes");
  Report("a.c", 3, "15.1");

  ASSERT_EQ(writer.violations.size(), 1u);
  EXPECT_EQ(writer.violations.front().misra_severity, "Undefined");
}

TEST_F(ReportingSinkTest, Suppressed_CountsHitWithoutReporting) {
  registry.Add(1501, "a.c", 3);
  Report("src/a.c", 3, "15.1");
  Report("src/a.c", 4, "15.1");

  EXPECT_EQ(registry.Hits(1501), 1);
  ASSERT_EQ(writer.violations.size(), 1u);
  EXPECT_EQ(writer.violations.front().line, 4);
  EXPECT_EQ(aggregator.Total(), 1u);
}

TEST(AggregatorTest, SummaryLines_BucketsThenRules) {
  report::RuleTexts texts;
  texts.Add(RuleId::Parse("15.1"), "The goto statement should not be used",
            "Advisory");
  report::Aggregator aggregator;
  aggregator.Add("Required", "misra-c2012-10.1", 1001);
  aggregator.Add("Advisory", "misra-c2012-15.1", 1501);
  aggregator.Add("Required", "misra-c2012-10.1", 1001);
  aggregator.Add("Undefined", "misra-c2012-2.7", 207);

  EXPECT_EQ(aggregator.Total(), 4u);
  auto totals = aggregator.RuleTotals();
  ASSERT_EQ(totals.size(), 3u);
  EXPECT_EQ(totals[0].rule_number, 207);
  EXPECT_EQ(totals[1].count, 2);

  std::vector<std::string> expected{
      "MISRA rules violations found:",
      "\tAdvisory: 1",
      "\tRequired: 2",
      "\tUndefined: 1",
      "MISRA rules violated:",
      "\tmisra-c2012-2.7 (-): 1",
      "\tmisra-c2012-10.1 (-): 2",
      "\tmisra-c2012-15.1 (style): 1",
  };
  EXPECT_EQ(aggregator.SummaryLines(texts), expected);
}

TEST(AggregatorTest, SummaryLines_EmptyWithoutViolations) {
  report::Aggregator aggregator;

  EXPECT_TRUE(aggregator.Empty());
  EXPECT_TRUE(aggregator.SummaryLines(report::RuleTexts{}).empty());
}

TEST(RuleTextsTest, MissingRules_ListsRulesWithoutText) {
  report::RuleTexts texts;
  EXPECT_TRUE(texts.Empty());
  auto missing = texts.MissingRules();
  EXPECT_NE(std::find(missing.begin(), missing.end(), RuleId::Parse("15.1")),
            missing.end());

  texts.Add(RuleId::Parse("15.1"), "The goto statement should not be used",
            "Advisory");
  EXPECT_EQ(texts.Size(), 1u);
  ASSERT_NE(texts.Find(1501), nullptr);
  EXPECT_EQ(texts.Find(1501)->misra_severity, "Advisory");
  EXPECT_EQ(texts.Find(1502), nullptr);

  auto remaining = texts.MissingRules();
  EXPECT_EQ(remaining.size(), missing.size() - 1);
  EXPECT_EQ(std::find(remaining.begin(), remaining.end(), RuleId::Parse("15.1")),
            remaining.end());
  EXPECT_TRUE(std::is_sorted(remaining.begin(), remaining.end()));
}

TEST(VerifyTest, ExpectedTags_FromLineComments) {
  support::ProgramBuilder builder;
  builder.Line(3, "x ; // 15.1 17.7");
  builder.Line(4, "y ; // TODO 15.1");
  builder.Line(5, "z ; /* 15.1 */");

  EXPECT_EQ(report::ExpectedTags(builder.Model()),
            (std::vector<std::string>{"3:15.1", "3:17.7"}));
}

TEST(VerifyTest, CompareTags_ReportsBothDirections) {
  std::vector<std::string> expected{"3:15.1", "4:17.7"};
  std::vector<std::string> actual{"3:15.1", "5:2.7"};

  EXPECT_EQ(report::CompareTags(expected, actual),
            (std::vector<std::string>{"Expected but not seen: 4:17.7",
                                      "Not expected: 5:2.7"}));
  EXPECT_TRUE(report::CompareTags(expected, expected).empty());
}

TEST(VerifyTest, VerifySink_RecordsLineAndRule) {
  report::VerifySink sink;
  sink.Report(models::Location{"a.c", 12, 1}, RuleId::Parse("20.14"));

  EXPECT_EQ(sink.Actual(), std::vector<std::string>{"12:20.14"});
}
