#pragma once

#include <map>
#include <string>
#include <vector>

namespace report {

class RuleTexts;

/**
 * @struct RuleTotal
 * Number of violations of one rule over the whole run.
 */
struct RuleTotal {
    std::string misra_id; /**< e.g. "misra-c2012-15.1". */
    int rule_number = 0;
    int count = 0;
};

/**
 * @class Aggregator
 * @brief Collects violation ids into per-severity buckets.
 */
class Aggregator {
public:
  /**
   * @brief Records one violation.
   * @param misra_severity Bucket name, e.g. "Required" or "Undefined".
   * @param misra_id Rule id, e.g. "misra-c2012-15.1".
   * @param rule_number major * 100 + minor.
   */
  void Add(const std::string &misra_severity, const std::string &misra_id,
           int rule_number);

  /**
   * @brief Violations per severity bucket.
   */
  const std::map<std::string, std::vector<std::string>> &Buckets() const {
    return buckets_;
  }

  /**
   * @brief Number of violations in all buckets.
   */
  std::size_t Total() const;

  bool Empty() const { return buckets_.empty(); }

  /**
   * @brief Violations per rule, ordered by rule number.
   */
  std::vector<RuleTotal> RuleTotals() const;

  /**
   * @brief Formats the end-of-run summary.
   * @param texts Catalog used for the analyzer severity column.
   * @return Summary lines, empty when there are no violations.
   */
  std::vector<std::string> SummaryLines(const RuleTexts &texts) const;

private:
  std::map<std::string, std::vector<std::string>> buckets_;
  std::map<int, RuleTotal> totals_;
};

} // namespace report
