#include "rule_texts.hpp"

#include "../rules/rule_table.hpp"

#include <algorithm>
#include <string_view>
#include <unordered_set>
#include <utility>

namespace report {

namespace {

const std::unordered_set<std::string_view> kSeverityLevels{
    "Required", "Mandatory", "Advisory"};

} // namespace

void RuleTexts::Add(rules::RuleId id, std::string text,
                    const std::string &misra_severity) {
  RuleText entry{id, std::move(text), ""};
  if (kSeverityLevels.count(misra_severity) != 0) {
    entry.misra_severity = misra_severity;
  }
  texts_[id.Number()] = std::move(entry);
}

const RuleText *RuleTexts::Find(int rule_number) const {
  auto it = texts_.find(rule_number);
  return it == texts_.end() ? nullptr : &it->second;
}

std::vector<rules::RuleId> RuleTexts::MissingRules() const {
  auto all = rules::SupportedRules();
  const auto &analyzer = rules::AnalyzerRules();
  all.insert(all.end(), analyzer.begin(), analyzer.end());
  std::sort(all.begin(), all.end());
  all.erase(std::unique(all.begin(), all.end()), all.end());

  std::vector<rules::RuleId> missing;
  for (const auto &id : all) {
    if (texts_.count(id.Number()) == 0) {
      missing.push_back(id);
    }
  }
  return missing;
}

} // namespace report
