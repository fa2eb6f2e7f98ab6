#include "aggregator.hpp"

#include "rule_texts.hpp"

#include <fmt/core.h>

namespace report {

void Aggregator::Add(const std::string &misra_severity,
                     const std::string &misra_id, int rule_number) {
  buckets_[misra_severity].push_back(misra_id);
  auto &total = totals_[rule_number];
  total.misra_id = misra_id;
  total.rule_number = rule_number;
  total.count++;
}

std::size_t Aggregator::Total() const {
  std::size_t total = 0;
  for (const auto &[severity, ids] : buckets_) {
    total += ids.size();
  }
  return total;
}

std::vector<RuleTotal> Aggregator::RuleTotals() const {
  std::vector<RuleTotal> totals;
  totals.reserve(totals_.size());
  for (const auto &[number, total] : totals_) {
    totals.push_back(total);
  }
  return totals;
}

std::vector<std::string> Aggregator::SummaryLines(const RuleTexts &texts) const {
  std::vector<std::string> lines;
  if (buckets_.empty()) {
    return lines;
  }
  lines.push_back("MISRA rules violations found:");
  for (const auto &[severity, ids] : buckets_) {
    lines.push_back(fmt::format("\t{}: {}", severity, ids.size()));
  }
  lines.push_back("MISRA rules violated:");
  for (const auto &total : RuleTotals()) {
    const auto *text = texts.Find(total.rule_number);
    lines.push_back(fmt::format("\t{:>15} ({}): {}", total.misra_id,
                                text ? "style" : "-", total.count));
  }
  return lines;
}

} // namespace report
