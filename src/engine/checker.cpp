#include "checker.hpp"

#include "../fatal/fatal.hpp"
#include "../report/reporting_sink.hpp"
#include "../report/verify_sink.hpp"
#include "../rules/rule_table.hpp"

#include <fmt/core.h>
#include <memory>
#include <stdexcept>
#include <utility>

namespace engine {

void Checker::Collector::Write(const report::Violation &violation) {
  violations.push_back(violation);
  if (forward != nullptr) {
    forward->Write(violation);
  }
}

Checker::Checker(models::ModelProvider &provider, CheckSettings settings,
                 report::RuleTexts texts)
    : provider_(provider), settings_(std::move(settings)),
      texts_(std::move(texts)) {
  if (!settings_.suppress_rules.empty()) {
    suppressions_.AddRuleList(settings_.suppress_rules);
  }
  if (settings_.file_prefix) {
    suppressions_.SetFilePrefix(*settings_.file_prefix);
  }
}

bool Checker::Check(const std::string &unit) {
  std::unique_ptr<models::TranslationUnit> model;
  try {
    model = provider_.Acquire(unit);
  } catch (const std::runtime_error &e) {
    loger::non_fatal(fmt::format("cannot load '{}'", unit), e.what());
    failed_++;
    return false;
  }
  if (!model) {
    loger::non_fatal(fmt::format("cannot load '{}'", unit));
    failed_++;
    return false;
  }
  CheckUnit(*model);
  return true;
}

std::size_t Checker::CheckAll(const std::vector<std::string> &units) {
  const auto failed_before = failed_;
  for (const auto &unit : units) {
    Check(unit);
  }
  return failed_ - failed_before;
}

void Checker::CheckUnit(const models::TranslationUnit &unit) {
  suppressions_.AddFromDirectives(unit.suppressions);

  std::vector<std::string> expected;
  report::VerifySink verify_sink;
  report::ReportingSink reporting_sink(suppressions_, texts_, aggregator_,
                                       collector_);
  report::Reporter *sink = &reporting_sink;
  if (settings_.verify) {
    expected = report::ExpectedTags(unit.raw);
    sink = &verify_sink;
  } else if (!settings_.quiet) {
    loger::status(fmt::format("Checking {}...", unit.path));
  }

  bool first_configuration = true;
  for (const auto &configuration : unit.configurations) {
    if (unit.configurations.size() > 1 && !settings_.quiet) {
      loger::status(fmt::format("Checking {}, config \"{}\"...", unit.path,
                                configuration.name));
    }
    for (const auto &rule : rules::RuleTable()) {
      if (rule->Scope() == rules::RuleScope::kRawTokens &&
          !first_configuration) {
        continue;
      }
      if (!settings_.verify &&
          suppressions_.IsGloballySuppressed(rule->Id().Number())) {
        if (settings_.verbose) {
          loger::verbose(fmt::format("skipping {}", rule->Id().ToString()));
        }
        continue;
      }
      rules::CheckContext context(unit, configuration, rule->Id(), *sink);
      rule->Check(context);
    }
    first_configuration = false;
  }

  if (settings_.verify) {
    auto mismatches = report::CompareTags(expected, verify_sink.Actual());
    mismatches_.insert(mismatches_.end(), mismatches.begin(), mismatches.end());
  }
}

std::vector<std::string> Checker::Summary() const {
  if (settings_.verify || !settings_.show_summary) {
    return {};
  }
  return aggregator_.SummaryLines(texts_);
}

bool Checker::HasFindings() const {
  if (settings_.verify) {
    return !mismatches_.empty();
  }
  return !aggregator_.Empty();
}

} // namespace engine
