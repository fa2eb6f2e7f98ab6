#pragma once

#include "rule.hpp"

#include <memory>
#include <string>
#include <vector>

namespace rules {

/**
 * @brief The rule catalog in execution order.
 *
 * Rule 12.1 appears twice: the raw sizeof check followed by the
 * precedence check.
 *
 * @return Rule objects, built on first use.
 */
const std::vector<std::unique_ptr<Rule>> &RuleTable();

/**
 * @brief Ids of all rules in the catalog, without duplicates.
 * @return Sorted rule ids.
 */
std::vector<RuleId> SupportedRules();

/**
 * @brief Rules covered by the analyzer itself rather than by this engine.
 * @return Rule ids the analyzer reports.
 */
const std::vector<RuleId> &AnalyzerRules();

} // namespace rules
