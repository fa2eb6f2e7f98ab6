#include "checks.hpp"

#include "../essential/essential_type.hpp"
#include "../matching/expressions.hpp"

#include <optional>

namespace rules::checks {

namespace {

using models::TypeKind;

struct CastTypes {
  const models::ValueType *target = nullptr;
  const models::ValueType *source = nullptr;
};

/* types on both sides of a C-style cast, unset when either is unknown */
std::optional<CastTypes> TypesOfCast(const models::TokenRef &cast) {
  const auto *target = cast.Type();
  const auto *source = cast.Operand1().Type();
  if (target == nullptr || source == nullptr) {
    return std::nullopt;
  }
  return CastTypes{target, source};
}

bool IsIntegralOrEnum(const models::ValueType &type, const models::TokenRef &expr) {
  return type.IsIntegral() || essential::IsEnumTyped(expr);
}

bool IsVoidPointerToObject(const models::ValueType &to, const models::ValueType &from) {
  return to.pointer > 0 && to.type != TypeKind::kVoid &&
         from.pointer == to.pointer && from.type == TypeKind::kVoid;
}

} // namespace

void IncompatibleObjectPointerCast(const CheckContext &ctx) {
  for (const auto &token : ctx.Tokens()) {
    if (!matching::IsCast(token)) {
      continue;
    }
    auto types = TypesOfCast(token);
    if (!types) {
      continue;
    }
    const auto &to = *types->target;
    const auto &from = *types->source;
    if (to.type == TypeKind::kVoid || from.type == TypeKind::kVoid) {
      continue;
    }
    if (to.pointer > 0 && to.type == TypeKind::kRecord && from.pointer > 0 &&
        from.type == TypeKind::kRecord && to.type_scope != from.type_scope) {
      ctx.Report(token);
    } else if (to.pointer == from.pointer && to.pointer > 0 &&
               to.type != from.type && to.type != TypeKind::kChar) {
      ctx.Report(token);
    }
  }
}

void PointerIntegerCast(const CheckContext &ctx) {
  for (const auto &token : ctx.Tokens()) {
    if (!matching::IsCast(token)) {
      continue;
    }
    auto types = TypesOfCast(token);
    if (!types) {
      continue;
    }
    const auto &to = *types->target;
    const auto &from = *types->source;
    if (from.pointer > 0 && to.pointer == 0 && IsIntegralOrEnum(to, token) &&
        from.type != TypeKind::kVoid) {
      ctx.Report(token);
    } else if (to.pointer > 0 && from.pointer == 0 &&
               IsIntegralOrEnum(from, token.Operand1()) && to.type != TypeKind::kVoid) {
      ctx.Report(token);
    }
  }
}

void VoidPointerConversion(const CheckContext &ctx) {
  for (const auto &token : ctx.Tokens()) {
    if (!matching::IsCast(token)) {
      // implicit conversion by assignment
      if (token.Is("=") && token.Operand1() && token.Operand2() &&
          !token.Next().Is("(")) {
        const auto *to = token.Operand1().Type();
        const auto *from = token.Operand2().Type();
        if (to != nullptr && from != nullptr && IsVoidPointerToObject(*to, *from)) {
          ctx.Report(token);
        }
      }
      continue;
    }
    auto callee = token.Operand1().Operand1();
    if (callee.Is("malloc") || callee.Is("calloc") || callee.Is("realloc") ||
        callee.Is("free")) {
      continue;
    }
    auto types = TypesOfCast(token);
    if (types && IsVoidPointerToObject(*types->target, *types->source)) {
      ctx.Report(token);
    }
  }
}

void VoidPointerArithmeticCast(const CheckContext &ctx) {
  for (const auto &token : ctx.Tokens()) {
    if (!matching::IsCast(token) || token.Operand1().Operand1()) {
      continue;
    }
    auto types = TypesOfCast(token);
    if (!types) {
      continue;
    }
    const auto &to = *types->target;
    const auto &from = *types->source;
    if (to.pointer == 1 && to.type == TypeKind::kVoid && from.pointer == 0 &&
        !token.Operand1().Is("0")) {
      ctx.Report(token);
    } else if (to.pointer == 0 && to.type != TypeKind::kVoid && from.pointer == 1 &&
               from.type == TypeKind::kVoid) {
      ctx.Report(token);
    }
  }
}

void PointerNonIntegerCast(const CheckContext &ctx) {
  for (const auto &token : ctx.Tokens()) {
    if (!matching::IsCast(token)) {
      continue;
    }
    auto types = TypesOfCast(token);
    if (!types || token.Operand1().Operand1()) {
      continue;
    }
    const auto &to = *types->target;
    const auto &from = *types->source;
    if (from.pointer > 0 && to.pointer == 0 && !IsIntegralOrEnum(to, token) &&
        to.type != TypeKind::kVoid) {
      ctx.Report(token);
    } else if (to.pointer > 0 && from.pointer == 0 &&
               !IsIntegralOrEnum(from, token.Operand1()) &&
               to.type != TypeKind::kVoid) {
      ctx.Report(token);
    }
  }
}

void CastAwayConst(const CheckContext &ctx) {
  for (const auto &token : ctx.Tokens()) {
    if (matching::IsCast(token)) {
      auto types = TypesOfCast(token);
      if (!types || types->target->pointer == 0 || types->source->pointer == 0) {
        continue;
      }
      if ((types->target->constness & 1) < (types->source->constness & 1)) {
        ctx.Report(token);
      }
    } else if (token.Is("(") && token.Operand1() && token.Operand2() &&
               token.Operand1().Function()) {
      // arguments passed to non-const pointer parameters
      auto function = token.Operand1().Function();
      auto arguments = matching::FunctionArguments(token);
      for (const auto &[position, variable] : function->arguments) {
        if (position < 1 || position > static_cast<int>(arguments.size())) {
          continue;
        }
        auto parameter = function.Argument(position);
        if (!parameter->is_pointer) {
          continue;
        }
        const auto *argument = arguments[position - 1].Type();
        if (argument == nullptr || argument->pointer == 0) {
          continue;
        }
        if ((parameter->constness & 1) < (argument->constness & 1)) {
          ctx.Report(token);
        }
      }
    }
  }
}

void IntegerNullPointer(const CheckContext &ctx) {
  for (const auto &token : ctx.Tokens()) {
    if (!token.Operand1() || !token.Operand2()) {
      continue;
    }
    if (!token.Is("=") && !token.Is("==") && !token.Is("!=") && !token.Is("?") &&
        !token.Is(":")) {
      continue;
    }
    const auto *to = token.Operand1().Type();
    const auto *from = token.Operand2().Type();
    if (to == nullptr || from == nullptr) {
      continue;
    }
    if (to->pointer == 0 || from->pointer != 0 || token.Operand2().Is("NULL")) {
      continue;
    }
    for (const auto &value : token.Operand2()->values) {
      if (value.int_value == 0) {
        ctx.Report(token);
      }
    }
  }
}

void PointerArithmetic(const CheckContext &ctx) {
  for (const auto &token : ctx.Tokens()) {
    if (!token.Is("+") && !token.Is("-") && !token.Is("+=") && !token.Is("-=")) {
      continue;
    }
    if (!token.Operand1() || !token.Operand2()) {
      continue;
    }
    const auto *left = token.Operand1().Type();
    const auto *right = token.Operand2().Type();
    if ((left != nullptr && left->pointer > 0) ||
        (right != nullptr && right->pointer > 0)) {
      ctx.Report(token);
    }
  }
}

} // namespace rules::checks
