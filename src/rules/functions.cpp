#include "checks.hpp"

#include "../matching/expressions.hpp"

#include <algorithm>
#include <map>
#include <set>
#include <vector>

namespace rules::checks {

namespace {

using CallGraph = std::map<int, std::vector<int>>;

bool ReachesFunction(int target, int callee, const CallGraph &calls,
                     std::set<int> &visited) {
  if (callee == target) {
    return true;
  }
  auto it = calls.find(callee);
  if (it == calls.end()) {
    return false;
  }
  for (int next : it->second) {
    if (next == target) {
      return true;
    }
    if (!visited.insert(next).second) {
      continue;
    }
    if (ReachesFunction(target, next, calls, visited)) {
      return true;
    }
  }
  return false;
}

} // namespace

void VariadicArguments(const CheckContext &ctx) {
  for (const auto &token : ctx.Tokens()) {
    if (matching::IsFunctionCall(token)) {
      const auto &callee = token.Operand1().Str();
      if (callee == "va_list" || callee == "va_arg" || callee == "va_start" ||
          callee == "va_end" || callee == "va_copy") {
        ctx.Report(token);
      }
    } else if (token.Is("va_list")) {
      ctx.Report(token);
    }
  }
}

void Recursion(const CheckContext &ctx) {
  const auto &model = ctx.Model();
  std::vector<models::ScopeRef> bodies;
  for (std::size_t i = 0; i < model.scopes.size(); ++i) {
    models::ScopeRef scope(&model, static_cast<int>(i));
    if (scope.IsType(models::ScopeType::kFunction)) {
      bodies.push_back(scope);
    }
  }

  CallGraph calls;
  for (const auto &scope : bodies) {
    std::vector<int> callees;
    auto tok = scope.BodyStart();
    while (tok && tok != scope.BodyEnd()) {
      tok = tok.Next();
      if (!matching::IsFunctionCall(tok)) {
        continue;
      }
      auto callee = tok.Operand1().Function();
      if (callee && std::find(callees.begin(), callees.end(), callee.Index()) ==
                        callees.end()) {
        callees.push_back(callee.Index());
      }
    }
    calls[scope->function] = callees;
  }

  for (const auto &[function, callees] : calls) {
    for (int callee : callees) {
      std::set<int> visited;
      if (!ReachesFunction(function, callee, calls, visited)) {
        continue;
      }
      // report every call of the recursive callee in the caller
      for (const auto &scope : bodies) {
        if (scope->function != function) {
          continue;
        }
        for (auto tok = scope.BodyStart(); tok && tok != scope.BodyEnd();
             tok = tok.Next()) {
          if (tok->function != models::kNoIndex && tok->function == callee) {
            ctx.Report(tok);
          }
        }
      }
    }
  }
}

void UnusedReturnValue(const CheckContext &ctx) {
  for (const auto &token : ctx.Tokens()) {
    if (!token.Scope() || !token.Scope()->IsExecutable()) {
      continue;
    }
    if (!token.Is("(") || token.Parent()) {
      continue;
    }
    auto callee = token.Previous();
    if (!callee->is_name || callee->var_id != 0) {
      continue;
    }
    const auto *type = token.Type();
    if (type == nullptr) {
      continue;
    }
    if (type->type == models::TypeKind::kVoid && type->pointer == 0) {
      continue;
    }
    ctx.Report(token);
  }
}

void ParameterModified(const CheckContext &ctx) {
  for (const auto &token : ctx.Tokens()) {
    if (!token->is_assignment_op && !token.Is("++") && !token.Is("--")) {
      continue;
    }
    auto var = token.Operand1().Variable();
    if (var && var->is_argument) {
      ctx.Report(token);
    }
  }
}

} // namespace rules::checks
