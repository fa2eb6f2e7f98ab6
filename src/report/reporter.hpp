#pragma once

#include "../models/location.hpp"
#include "../rules/rule_id.hpp"

namespace report {

/**
 * @class Reporter
 * @brief Diagnostics sink handed to every rule.
 *
 * The normal sink applies suppressions and formats violations, the verify
 * sink records them for comparison with expected tags. The checker picks
 * one per run.
 */
class Reporter {
public:
  virtual ~Reporter() = default;

  /**
   * @brief Receives one violation.
   * @param location Where the violation was found.
   * @param rule The violated rule.
   */
  virtual void Report(const models::Location &location, rules::RuleId rule) = 0;
};

} // namespace report
