#include "checks.hpp"

#include "../essential/essential_type.hpp"
#include "../matching/expressions.hpp"

#include <optional>
#include <string_view>
#include <unordered_set>

namespace rules::checks {

namespace {

const std::unordered_set<std::string_view> kCompositeOperators{
    "+", "-", "*", "/", "%", "&", "|", "^", ">>", "<<", "?", ":", "~"};

const std::unordered_set<std::string_view> kArithmeticOperators{
    "+", "-", "*", "/", "%", "&", "|", "^", "+=", "-=", ":"};

bool IsNonPointer(const models::ValueType *type) {
  return type != nullptr && type->pointer == 0;
}

bool IsArithmeticOrComparison(const models::TokenRef &token) {
  return kArithmeticOperators.count(token.Str()) != 0 || token->is_comparison_op;
}

/* integer rank of an assigned or cast expression */
std::optional<essential::Rank> ExpressionRank(const models::TokenRef &expr) {
  std::optional<essential::Rank> rank;
  if (matching::IsCast(expr)) {
    rank = essential::IntegerRankOf(expr.Type()->type);
  } else {
    rank = essential::EssentialRankOf(expr);
  }
  if (!rank || !essential::IsIntegerRank(*rank)) {
    return std::nullopt;
  }
  return rank;
}

} // namespace

void ShiftOperandCategory(const CheckContext &ctx) {
  for (const auto &token : ctx.Tokens()) {
    if (!token->is_op || (!token.Is("<<") && !token.Is(">>"))) {
      continue;
    }
    auto e1 = essential::EssentialCategoryOf(token.Operand1());
    auto e2 = essential::EssentialCategoryOf(token.Operand2());
    if (!e1 || !e2) {
      continue;
    }
    if (e1->kind != essential::Category::kUnsigned) {
      ctx.Report(token);
    } else if (e2->kind != essential::Category::kUnsigned &&
               !token.Operand2()->is_number) {
      ctx.Report(token);
    }
  }
}

void NarrowingAssignment(const CheckContext &ctx) {
  for (const auto &token : ctx.Tokens()) {
    if (!token.Is("=") || !token.Operand1() || !token.Operand2()) {
      continue;
    }
    const auto *target = token.Operand1().Type();
    if (!IsNonPointer(target) || !IsNonPointer(token.Operand2().Type())) {
      continue;
    }
    auto target_rank = essential::IntegerRankOf(target->type);
    auto value_rank = ExpressionRank(token.Operand2());
    if (target_rank && value_rank && *value_rank > *target_rank) {
      ctx.Report(token);
    }
  }
}

void MixedCategories(const CheckContext &ctx) {
  for (const auto &token : ctx.Tokens()) {
    if (!IsArithmeticOrComparison(token)) {
      continue;
    }
    auto op1 = token.Operand1();
    auto op2 = token.Operand2();
    if (!op1.Type() || !op2.Type()) {
      continue;
    }
    // in a chain compare the operands next to this operator
    auto lhs = IsArithmeticOrComparison(op1) ? op1.Operand2() : op1;
    auto rhs = IsArithmeticOrComparison(op2) ? op2.Operand1() : op2;
    auto [e1, e2] = essential::EssentialCategories(lhs, rhs);
    if (!e1 || !e2) {
      continue;
    }
    if (e1->IsAnonymousEnum() && e2->IsSignedOrUnsigned()) {
      continue;
    }
    if (e2->IsAnonymousEnum() && e1->IsSignedOrUnsigned()) {
      continue;
    }
    if (*e1 != *e2) {
      ctx.Report(token);
    }
  }
}

void CompositeWidening(const CheckContext &ctx) {
  for (const auto &token : ctx.Tokens()) {
    if (!token.Is("=") || !token.Operand1() || !token.Operand2()) {
      continue;
    }
    auto value = token.Operand2();
    if (kCompositeOperators.count(value.Str()) == 0 && !matching::IsCast(value)) {
      continue;
    }
    const auto *target = token.Operand1().Type();
    if (!IsNonPointer(target) || !IsNonPointer(value.Type())) {
      continue;
    }
    auto target_rank = essential::IntegerRankOf(target->type);
    auto value_rank = ExpressionRank(value);
    if (target_rank && value_rank && *target_rank > *value_rank) {
      ctx.Report(token);
    }
  }
}

void CompositeCast(const CheckContext &ctx) {
  for (const auto &token : ctx.Tokens()) {
    if (!matching::IsCast(token)) {
      continue;
    }
    auto operand = token.Operand1();
    if (!IsNonPointer(token.Type()) || !IsNonPointer(operand.Type())) {
      continue;
    }
    if (!operand.Operand1() || kCompositeOperators.count(operand.Str()) == 0) {
      continue;
    }
    if (!operand.Is("~") && !operand.Operand2()) {
      continue;
    }

    essential::MaybeCategory e2;
    if (operand.Is("~")) {
      e2 = essential::EssentialCategoryOf(operand.Operand1());
    } else {
      auto [left, right] =
          essential::EssentialCategories(operand.Operand1(), operand.Operand2());
      if (left != right) {
        continue;
      }
      e2 = left;
    }

    if (essential::EssentialCategoryOf(token) != e2) {
      ctx.Report(token);
      continue;
    }
    auto cast_rank = essential::IntegerRankOf(token.Type()->type);
    auto operand_rank = essential::EssentialRankOf(operand);
    if (cast_rank && operand_rank && essential::IsIntegerRank(*operand_rank) &&
        *cast_rank > *operand_rank) {
      ctx.Report(token);
    }
  }
}

} // namespace rules::checks
