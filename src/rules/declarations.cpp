#include "checks.hpp"

#include "../matching/expressions.hpp"
#include "../matching/pattern.hpp"

#include <algorithm>
#include <optional>
#include <vector>

namespace rules::checks {

void ExternArraySize(const CheckContext &ctx) {
  const auto &model = ctx.Model();
  for (std::size_t i = 0; i < model.variables.size(); ++i) {
    models::VariableRef var(&model, static_cast<int>(i));
    auto name = var.NameToken();
    if (var->is_extern && matching::SimpleMatch(name.Next(), "[ ]") &&
        name.Scope().IsType(models::ScopeType::kGlobal)) {
      ctx.Report(name);
    }
  }
}

void DuplicateEnumValue(const CheckContext &ctx) {
  const auto &model = ctx.Model();
  for (std::size_t i = 0; i < model.scopes.size(); ++i) {
    models::ScopeRef scope(&model, static_cast<int>(i));
    if (!scope.IsType(models::ScopeType::kEnum)) {
      continue;
    }
    std::vector<std::optional<long long>> values;
    std::vector<std::optional<long long>> implicit_values;

    auto token = scope.BodyStart().Next();
    while (token && token != scope.BodyEnd()) {
      if (token.Is("(")) {
        token = matching::Link(token);
        continue;
      }
      // only enumerator names follow "{" or ","
      if (!token.Previous().Is(",") && !token.Previous().Is("{")) {
        token = token.Next();
        continue;
      }
      const auto *type = token.Type();
      if (token->is_name && !token->values.empty() && type != nullptr &&
          type->type_scope == scope.Index()) {
        for (const auto &value : token->values) {
          values.push_back(value.int_value);
          if (!token.Next().Is("=")) {
            implicit_values.push_back(value.int_value);
          }
        }
      }
      token = token.Next();
    }

    for (const auto &value : implicit_values) {
      if (std::count(values.begin(), values.end(), value) != 1) {
        ctx.Report(scope.BodyStart());
      }
    }
  }
}

void PointerNesting(const CheckContext &ctx) {
  const auto &model = ctx.Model();
  for (std::size_t i = 0; i < model.variables.size(); ++i) {
    models::VariableRef var(&model, static_cast<int>(i));
    if (!var->is_pointer) {
      continue;
    }
    int stars = 0;
    for (auto tok = var.NameToken(); tok; tok = tok.Previous()) {
      if (tok.Is("*")) {
        stars++;
      } else if (!tok->is_name) {
        break;
      }
    }
    if (stars > 2) {
      ctx.Report(var.NameToken());
    }
  }
}

void FlexibleArrayMember(const CheckContext &ctx) {
  const auto &model = ctx.Model();
  for (std::size_t i = 0; i < model.scopes.size(); ++i) {
    models::ScopeRef scope(&model, static_cast<int>(i));
    if (!scope.IsType(models::ScopeType::kStruct)) {
      continue;
    }
    auto token = scope.BodyStart().Next();
    while (token && token != scope.BodyEnd()) {
      // nested structs report on their own
      if (token.Is("{")) {
        token = matching::Link(token);
      }
      if (matching::SimpleMatch(token, "[ ]")) {
        ctx.Report(token);
        break;
      }
      token = token.Next();
    }
  }
}

void VariableLengthArray(const CheckContext &ctx) {
  const auto &model = ctx.Model();
  for (std::size_t i = 0; i < model.variables.size(); ++i) {
    models::VariableRef var(&model, static_cast<int>(i));
    if (!var->is_array || !var->is_local) {
      continue;
    }
    auto bracket = var.NameToken().Next();
    if (!bracket.Is("[") || !bracket.Operand2()) {
      continue;
    }
    if (!matching::IsConstantExpression(bracket.Operand2())) {
      ctx.Report(var.NameToken());
    }
  }
}

void UnionKeyword(const CheckContext &ctx) {
  for (const auto &token : ctx.Tokens()) {
    if (token.Is("union")) {
      ctx.Report(token);
    }
  }
}

} // namespace rules::checks
