#include "checks.hpp"

#include "../matching/directives.hpp"
#include "../matching/expressions.hpp"

#include <initializer_list>
#include <string_view>

namespace rules::checks {

namespace {

bool CallsOneOf(models::TokenRef token,
                std::initializer_list<std::string_view> names) {
  if (!matching::IsFunctionCall(token)) {
    return false;
  }
  for (auto name : names) {
    if (token.Operand1().Is(name)) {
      return true;
    }
  }
  return false;
}

bool IsCallTo(models::TokenRef token, std::string_view name) {
  return token.Is(name) && token.Next().Is("(");
}

void ReportInclude(const CheckContext &ctx, std::string_view header) {
  if (const auto *directive =
          matching::FindInclude(ctx.Model().directives, header)) {
    ctx.Report(*directive);
  }
}

} // namespace

void DynamicMemory(const CheckContext &ctx) {
  for (const auto &token : ctx.Tokens()) {
    if (CallsOneOf(token, {"malloc", "calloc", "realloc", "free"})) {
      ctx.Report(token);
    }
  }
}

void Setjmp(const CheckContext &ctx) { ReportInclude(ctx, "<setjmp.h>"); }

void Signal(const CheckContext &ctx) { ReportInclude(ctx, "<signal.h>"); }

void StandardIo(const CheckContext &ctx) {
  ReportInclude(ctx, "<stdio.h>");
  ReportInclude(ctx, "<wchar.h>");
}

void StringConversion(const CheckContext &ctx) {
  for (const auto &token : ctx.Tokens()) {
    if (CallsOneOf(token, {"atof", "atoi", "atol", "atoll"})) {
      ctx.Report(token);
    }
  }
}

void ProcessControl(const CheckContext &ctx) {
  for (const auto &token : ctx.Tokens()) {
    if (CallsOneOf(token, {"abort", "exit", "getenv", "system"})) {
      ctx.Report(token);
    }
  }
}

void SearchAndSort(const CheckContext &ctx) {
  for (const auto &token : ctx.Tokens()) {
    if (IsCallTo(token, "bsearch") || IsCallTo(token, "qsort")) {
      ctx.Report(token);
    }
  }
}

void TimeFunctions(const CheckContext &ctx) {
  ReportInclude(ctx, "<time.h>");
  for (const auto &token : ctx.Tokens()) {
    if (IsCallTo(token, "wcsftime")) {
      ctx.Report(token);
    }
  }
}

void TypeGenericMath(const CheckContext &ctx) {
  ReportInclude(ctx, "<tgmath.h>");
}

void FloatingExceptions(const CheckContext &ctx) {
  if (matching::FindInclude(ctx.Model().directives, "<fenv.h>") == nullptr) {
    return;
  }
  for (const auto &token : ctx.Tokens()) {
    if (token.Is("fexcept_t") && token->is_name) {
      ctx.Report(token);
    }
    if (CallsOneOf(token, {"feclearexcept", "fegetexceptflag", "feraiseexcept",
                           "fesetexceptflag", "fetestexcept"})) {
      ctx.Report(token);
    }
  }
}

} // namespace rules::checks
