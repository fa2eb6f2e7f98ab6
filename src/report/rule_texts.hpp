#pragma once

#include "../rules/rule_id.hpp"

#include <map>
#include <string>
#include <vector>

namespace report {

/**
 * @struct RuleText
 * Human readable text and severity of one rule.
 */
struct RuleText {
    rules::RuleId id;
    std::string text;
    std::string misra_severity; /**< Empty when the level is not known. */
};

/**
 * @class RuleTexts
 * @brief Rule-text catalog keyed by rule number.
 *
 * Filled by the embedding application. An empty catalog only degrades the
 * messages; detection never depends on it.
 */
class RuleTexts {
public:
  /**
   * @brief Adds or replaces the text of a rule.
   * @param id The rule.
   * @param text The rule headline.
   * @param misra_severity "Required", "Mandatory" or "Advisory"; any other
   * value is stored as empty.
   */
  void Add(rules::RuleId id, std::string text, const std::string &misra_severity);

  /**
   * @brief Looks up the text of a rule.
   * @return The entry, nullptr when the rule has no text.
   */
  const RuleText *Find(int rule_number) const;

  bool Empty() const { return texts_.empty(); }
  std::size_t Size() const { return texts_.size(); }

  /**
   * @brief Lists the rules of the engine and the analyzer that have no
   * text.
   * @return Missing rule ids in ascending order.
   */
  std::vector<rules::RuleId> MissingRules() const;

private:
  std::map<int, RuleText> texts_;
};

} // namespace report
