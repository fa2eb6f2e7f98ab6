#include "checks.hpp"

#include "../essential/essential_type.hpp"
#include "../matching/expressions.hpp"
#include "../matching/pattern.hpp"
#include "../matching/precedence.hpp"

namespace rules::checks {

namespace {

/* a * b + c groups as written by every reader */
bool IsArithmeticGrouping(int parent, int child) {
  return parent == matching::kAdditivePrecedence &&
         child == matching::kMultiplicativePrecedence;
}

bool NeedsParentheses(int parent, int child) {
  return parent < child && child <= matching::kMultiplicativePrecedence &&
         !IsArithmeticGrouping(parent, child);
}

} // namespace

void ImplicitPrecedence(const CheckContext &ctx) {
  for (const auto &token : ctx.Tokens()) {
    const int p = matching::Precedence(token);
    if (p < matching::kConditionalPrecedence || p > matching::kMultiplicativePrecedence) {
      continue;
    }
    const int p1 = matching::Precedence(token.Operand1());
    if (NeedsParentheses(p, p1) && matching::HasNoParentheses(token.Operand1(), token)) {
      ctx.Report(token);
      continue;
    }
    const int p2 = matching::Precedence(token.Operand2());
    if (NeedsParentheses(p, p2) && matching::HasNoParentheses(token, token.Operand2())) {
      ctx.Report(token);
    }
  }
}

void ShiftWidth(const CheckContext &ctx) {
  for (const auto &token : ctx.Tokens()) {
    if (!token.Is("<<") && !token.Is(">>")) {
      continue;
    }
    auto amount = token.Operand2();
    if (!amount || amount->values.empty()) {
      continue;
    }
    long long max_value = 0;
    for (const auto &value : amount->values) {
      if (value.int_value.has_value() && *value.int_value > max_value) {
        max_value = *value.int_value;
      }
    }
    if (max_value == 0) {
      continue;
    }
    const int width = essential::BitsOfEssentialType(token.Operand1(), ctx.Platform());
    if (width > 0 && max_value >= width) {
      ctx.Report(token);
    }
  }
}

void CommaOperator(const CheckContext &ctx) {
  for (const auto &token : ctx.Tokens()) {
    if (!token.Is(",")) {
      continue;
    }
    auto scope = token.Scope();
    if (!scope || scope.IsType(models::ScopeType::kEnum) ||
        scope.IsType(models::ScopeType::kClass) ||
        scope.IsType(models::ScopeType::kGlobal)) {
      continue;
    }
    auto parent = token.Parent();
    if (parent.Is("(") || parent.Is(",") || parent.Is("{")) {
      continue;
    }
    ctx.Report(token);
  }
}

void UnsignedWrap(const CheckContext &ctx) {
  long long max_uint = 0;
  if (ctx.Platform().int_bit == 16) {
    max_uint = 0xffff;
  } else if (ctx.Platform().int_bit == 32) {
    max_uint = 0xffffffffLL;
  } else {
    return;
  }

  for (const auto &token : ctx.Tokens()) {
    if (token->values.empty()) {
      continue;
    }
    if (!matching::IsConstantExpression(token) || !matching::IsUnsignedInt(token)) {
      continue;
    }
    for (const auto &value : token->values) {
      if (!value.int_value.has_value()) {
        continue;
      }
      if (*value.int_value < 0 || *value.int_value > max_uint) {
        ctx.Report(token);
        break;
      }
    }
  }
}

void InitializerSideEffect(const CheckContext &ctx) {
  for (const auto &token : ctx.Tokens()) {
    if (!matching::SimpleMatch(token, "= {")) {
      continue;
    }
    auto init = token.Next();
    if (matching::HasSideEffectsRecursive(init)) {
      ctx.Report(init);
    }
  }
}

void IncrementWithSideEffects(const CheckContext &ctx) {
  for (const auto &token : ctx.Tokens()) {
    if (!token.Is("++") && !token.Is("--")) {
      continue;
    }
    auto top = token;
    while (top.Parent() && !top.Parent().Is(",") && !top.Parent().Is(";")) {
      top = top.Parent();
    }
    if (matching::CountSideEffects(top) >= 2) {
      ctx.Report(top);
    }
  }
}

void AssignmentResultUsed(const CheckContext &ctx) {
  for (const auto &token : ctx.Tokens()) {
    if (!token.Is("=") || !token.Parent()) {
      continue;
    }
    auto target = token.Operand1();
    if (target.Is("[") && (target.Previous().Is("{") || target.Previous().Is(","))) {
      continue;
    }
    auto parent = token.Parent();
    if (!parent.Is(",") && !parent.Is(";") && !parent.Is("{")) {
      ctx.Report(token);
    }
  }
}

void LogicalOperandSideEffect(const CheckContext &ctx) {
  for (const auto &token : ctx.Tokens()) {
    if (token->is_logical_op && matching::HasSideEffectsRecursive(token.Operand2())) {
      ctx.Report(token);
    }
  }
}

void SizeofSideEffect(const CheckContext &ctx) {
  for (const auto &token : ctx.Tokens()) {
    if (token.Is("sizeof") && matching::HasSideEffectsRecursive(token.Next())) {
      ctx.Report(token);
    }
  }
}

} // namespace rules::checks
