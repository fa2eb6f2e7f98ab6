#pragma once

#include "aggregator.hpp"
#include "reporter.hpp"
#include "rule_texts.hpp"
#include "violation.hpp"
#include "../suppress/suppression_registry.hpp"

#include <string_view>

namespace report {

/* message used when the catalog has no text for a rule */
inline constexpr std::string_view kGenericMessage =
    "misra violation (use --rule-texts=<file> to get proper output)";

/**
 * @class ReportingSink
 * @brief Normal mode sink: applies suppressions, formats the violation
 * and records it in the severity buckets.
 */
class ReportingSink : public Reporter {
public:
  ReportingSink(suppress::SuppressionRegistry &suppressions,
                const RuleTexts &texts, Aggregator &aggregator,
                ViolationWriter &writer)
      : suppressions_(suppressions), texts_(texts), aggregator_(aggregator),
        writer_(writer) {}

  void Report(const models::Location &location, rules::RuleId rule) override;

private:
  suppress::SuppressionRegistry &suppressions_;
  const RuleTexts &texts_;
  Aggregator &aggregator_;
  ViolationWriter &writer_;
};

} // namespace report
