#pragma once

#include "reporter.hpp"
#include "../models/program.hpp"

#include <string>
#include <vector>

namespace report {

/**
 * @class VerifySink
 * @brief Self-test sink: records "line:major.minor" for every violation,
 * with no suppression.
 */
class VerifySink : public Reporter {
public:
  void Report(const models::Location &location, rules::RuleId rule) override;

  const std::vector<std::string> &Actual() const { return actual_; }

private:
  std::vector<std::string> actual_;
};

/**
 * @brief Extracts the expected violations from "//" comments of the raw
 * stream. Comments containing TODO are skipped.
 * @param raw Raw tokens of the unit.
 * @return "line:major.minor" for every rule tag.
 */
std::vector<std::string> ExpectedTags(const models::Model &raw);

/**
 * @brief Compares expected and actual tags.
 * @return "Expected but not seen: ..." lines followed by
 * "Not expected: ..." lines; empty when both sets agree.
 */
std::vector<std::string> CompareTags(const std::vector<std::string> &expected,
                                     const std::vector<std::string> &actual);

} // namespace report
