#include "reporting_sink.hpp"

namespace report {

void ReportingSink::Report(const models::Location &location,
                           rules::RuleId rule) {
  const int number = rule.Number();
  if (suppressions_.IsSuppressed(location.file, location.line, number)) {
    suppressions_.CountHit(number);
    return;
  }

  Violation violation;
  violation.file = location.file;
  violation.line = location.line;
  violation.column = location.column;
  violation.severity = "style";
  violation.addon = "misra";
  violation.error_id = "c2012-" + rule.ToString();
  violation.misra_severity = "Undefined";
  if (const auto *text = texts_.Find(number)) {
    violation.message = text->text;
    if (!text->misra_severity.empty()) {
      violation.misra_severity = text->misra_severity;
    }
  } else {
    violation.message = std::string(kGenericMessage);
  }

  writer_.Write(violation);
  aggregator_.Add(violation.misra_severity, "misra-" + violation.error_id,
                  number);
}

} // namespace report
