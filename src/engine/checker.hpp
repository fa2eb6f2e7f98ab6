#pragma once

#include "check_settings.hpp"
#include "../models/model_provider.hpp"
#include "../report/aggregator.hpp"
#include "../report/rule_texts.hpp"
#include "../report/violation.hpp"
#include "../suppress/suppression_registry.hpp"

#include <string>
#include <vector>

namespace engine {

/**
 * @class Checker
 * @brief Runs the rule catalog over translation units.
 *
 * For every unit the checker acquires the model, registers its inline
 * suppressions and runs each configuration. Raw token rules only run for
 * the first configuration. In verify mode violations are compared with
 * the rule tags found in comments instead of being reported.
 */
class Checker {
public:
  /**
   * @brief Creates a checker.
   * @param provider Source of the program models.
   * @param settings Run options; the suppression list and file prefix are
   * applied here.
   * @param texts Rule-text catalog, may be empty.
   */
  Checker(models::ModelProvider &provider, CheckSettings settings,
          report::RuleTexts texts = {});

  /**
   * @brief Forwards every reported violation to a writer as well.
   * @param writer The writer, nullptr to stop forwarding.
   */
  void SetWriter(report::ViolationWriter *writer) { collector_.forward = writer; }

  /**
   * @brief Checks one unit.
   * @param unit Name passed to the model provider.
   * @return False when the model could not be acquired.
   */
  bool Check(const std::string &unit);

  /**
   * @brief Checks units in order. A failed unit does not stop the run.
   * @return Number of units that failed.
   */
  std::size_t CheckAll(const std::vector<std::string> &units);

  /**
   * @brief Verify mode differences of all checked units.
   */
  const std::vector<std::string> &Mismatches() const { return mismatches_; }

  /**
   * @brief Summary lines of the normal mode run, empty when the summary is
   * disabled or nothing was found.
   */
  std::vector<std::string> Summary() const;

  /**
   * @brief True when a violation was reported (normal mode) or a tag did
   * not match (verify mode).
   */
  bool HasFindings() const;

  std::size_t Failed() const { return failed_; }

  const std::vector<report::Violation> &Violations() const {
    return collector_.violations;
  }

  const report::Aggregator &Results() const { return aggregator_; }

  const suppress::SuppressionRegistry &Suppressions() const {
    return suppressions_;
  }

private:
  struct Collector : report::ViolationWriter {
    void Write(const report::Violation &violation) override;

    std::vector<report::Violation> violations;
    report::ViolationWriter *forward = nullptr;
  };

  void CheckUnit(const models::TranslationUnit &unit);

  models::ModelProvider &provider_;
  CheckSettings settings_;
  report::RuleTexts texts_;
  suppress::SuppressionRegistry suppressions_;
  report::Aggregator aggregator_;
  Collector collector_;
  std::vector<std::string> mismatches_;
  std::size_t failed_ = 0;
};

} // namespace engine
