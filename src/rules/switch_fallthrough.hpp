#pragma once

#include "rule.hpp"

namespace rules {

/**
 * @class SwitchFallthroughRule
 * @brief Requires every switch clause to end in break, return, throw, a
 * fallthrough attribute or a fallthrough comment.
 *
 * Walks the raw token stream, so comments are visible.
 */
class SwitchFallthroughRule : public Rule {
public:
  RuleId Id() const override { return RuleId{16, 3}; }
  RuleScope Scope() const override { return RuleScope::kRawTokens; }
  void Check(const CheckContext &context) const override;
};

} // namespace rules
