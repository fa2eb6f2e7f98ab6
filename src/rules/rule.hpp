#pragma once

#include "../models/program.hpp"
#include "../models/refs.hpp"
#include "../report/reporter.hpp"
#include "rule_id.hpp"

#include <vector>

namespace rules {

/* where a rule reads its tokens from */
enum class RuleScope {
  kConfiguration, /**< decorated tokens, run once per configuration */
  kRawTokens      /**< raw tokens, run once per file */
};

/**
 * @class CheckContext
 * @brief Everything a rule may read during one check, plus the sink.
 */
class CheckContext {
public:
  CheckContext(const models::TranslationUnit &unit,
               const models::Configuration &configuration, RuleId rule,
               report::Reporter &reporter)
      : unit_(unit), configuration_(configuration), rule_(rule),
        reporter_(reporter) {}

  const models::TranslationUnit &Unit() const { return unit_; }
  const models::Configuration &Config() const { return configuration_; }
  const models::Model &Model() const { return configuration_.model; }
  const models::Model &Raw() const { return unit_.raw; }
  const models::Platform &Platform() const { return unit_.platform; }
  RuleId Id() const { return rule_; }

  /**
   * @brief Decorated tokens of the configuration in stream order.
   */
  std::vector<models::TokenRef> Tokens() const;

  /**
   * @brief Raw tokens of the unit in stream order.
   */
  std::vector<models::TokenRef> RawTokens() const;

  /**
   * @brief Significant identifier length: 63 for C99, 31 otherwise.
   */
  std::size_t SignificantChars() const;

  void Report(const models::TokenRef &token) const;
  void Report(const models::Directive &directive) const;

private:
  const models::TranslationUnit &unit_;
  const models::Configuration &configuration_;
  RuleId rule_;
  report::Reporter &reporter_;
};

/**
 * @class Rule
 * @brief A single check of the catalog.
 *
 * Rules hold no state between checks; Check may run any number of times
 * over the same model and reports the same violations each time.
 */
class Rule {
public:
  virtual ~Rule() = default;

  virtual RuleId Id() const = 0;
  virtual RuleScope Scope() const = 0;

  /**
   * @brief Runs the check and reports through the context.
   * @param context Model access and sink.
   */
  virtual void Check(const CheckContext &context) const = 0;
};

/**
 * @class FunctionRule
 * @brief Rule whose check is a free function.
 */
class FunctionRule : public Rule {
public:
  using CheckFunction = void (*)(const CheckContext &);

  FunctionRule(RuleId id, RuleScope scope, CheckFunction check)
      : id_(id), scope_(scope), check_(check) {}

  RuleId Id() const override { return id_; }
  RuleScope Scope() const override { return scope_; }
  void Check(const CheckContext &context) const override { check_(context); }

private:
  RuleId id_;
  RuleScope scope_;
  CheckFunction check_;
};

} // namespace rules
