#include "checks.hpp"

#include "../matching/expressions.hpp"
#include "../matching/pattern.hpp"

namespace rules::checks {

namespace {

bool IsFloatTyped(const models::TokenRef &token) {
  const auto *type = token.Type();
  return type != nullptr && type->IsFloat();
}

/* the "{" opening the body of a "switch ( ... )", empty when malformed */
models::TokenRef SwitchBody(const models::TokenRef &token) {
  if (!matching::SimpleMatch(token, "switch (")) {
    return {};
  }
  auto rpar = matching::Link(token.Next());
  if (!matching::SimpleMatch(rpar, ") {")) {
    return {};
  }
  return rpar.Next();
}

} // namespace

void FloatLoopCounter(const CheckContext &ctx) {
  for (const auto &token : ctx.Tokens()) {
    if (token.Is("for")) {
      auto clauses = matching::ForLoopExpressions(token);
      if (!clauses) {
        continue;
      }
      for (const auto &counter : matching::FindCounterTokens((*clauses)[1])) {
        if (IsFloatTyped(counter)) {
          ctx.Report(token);
        }
      }
    } else if (token.Is("while") && matching::IsFloatCounterInWhileLoop(token)) {
      ctx.Report(token);
    }
  }
}

void MalformedForLoop(const CheckContext &ctx) {
  for (const auto &token : ctx.Tokens()) {
    auto clauses = matching::ForLoopExpressions(token);
    if (!clauses) {
      continue;
    }
    const auto &init = (*clauses)[0];
    if (init && !init->is_assignment_op) {
      ctx.Report(token);
    } else if (matching::HasSideEffectsRecursive((*clauses)[1])) {
      ctx.Report(token);
    }
  }
}

void NonBooleanCondition(const CheckContext &ctx) {
  for (const auto &token : ctx.Tokens()) {
    if (!token.Is("(")) {
      continue;
    }
    auto keyword = token.Operand1();
    if (!keyword.Is("if") && !keyword.Is("while")) {
      continue;
    }
    if (!matching::IsBoolExpression(token.Operand2())) {
      ctx.Report(token);
    }
  }
}

void Goto(const CheckContext &ctx) {
  for (const auto &token : ctx.Tokens()) {
    if (token.Is("goto")) {
      ctx.Report(token);
    }
  }
}

void BackwardGoto(const CheckContext &ctx) {
  for (const auto &token : ctx.Tokens()) {
    if (!token.Is("goto") || !token.Next()->is_name) {
      continue;
    }
    if (!matching::FindGotoLabel(token)) {
      ctx.Report(token);
    }
  }
}

void GotoIntoBlock(const CheckContext &ctx) {
  for (const auto &token : ctx.Tokens()) {
    if (!token.Is("goto") || !token.Next()->is_name) {
      continue;
    }
    auto label = matching::FindGotoLabel(token);
    if (!label) {
      continue;
    }
    // the label must be in the goto's block or an enclosing one
    auto scope = token.Scope();
    while (scope && scope != label.Scope()) {
      scope = scope.NestedIn();
    }
    if (!scope) {
      ctx.Report(token);
    }
  }
}

void MultipleExits(const CheckContext &ctx) {
  for (const auto &token : ctx.Tokens()) {
    if (token.Is("return") && token.Scope() &&
        !token.Scope().IsType(models::ScopeType::kFunction)) {
      ctx.Report(token);
    }
  }
}

void UnterminatedElseIf(const CheckContext &ctx) {
  const auto &model = ctx.Model();
  for (std::size_t i = 0; i < model.scopes.size(); ++i) {
    models::ScopeRef scope(&model, static_cast<int>(i));
    if (!scope.IsType(models::ScopeType::kElse)) {
      continue;
    }
    // "else if" is modelled as an else scope with a synthesized brace
    auto start = scope.BodyStart();
    if (!matching::SimpleMatch(start, "{ if (") || start->column > 0) {
      continue;
    }
    auto tok = matching::Link(start.Next().Next());
    if (!matching::SimpleMatch(tok, ") {")) {
      continue;
    }
    tok = matching::Link(tok.Next());
    if (!matching::SimpleMatch(tok, "} else")) {
      ctx.Report(tok);
    }
  }
}

void MisplacedCase(const CheckContext &ctx) {
  for (const auto &token : ctx.Tokens()) {
    if (token.Is("case") && token.Scope() &&
        !token.Scope().IsType(models::ScopeType::kSwitch)) {
      ctx.Report(token);
    }
  }
}

void MissingDefault(const CheckContext &ctx) {
  for (const auto &token : ctx.Tokens()) {
    auto body = SwitchBody(token);
    if (!body) {
      continue;
    }
    auto tok = body.Next();
    while (tok && !tok.Is("}")) {
      if (tok.Is("{")) {
        tok = matching::Link(tok);
      } else if (tok.Is("default")) {
        break;
      }
      tok = tok.Next();
    }
    if (tok && !tok.Is("default")) {
      ctx.Report(token);
    }
  }
}

void MisplacedDefault(const CheckContext &ctx) {
  for (const auto &token : ctx.Tokens()) {
    if (!token.Is("default") || token.Previous().Is("{")) {
      continue;
    }
    auto tok = token;
    while (tok && !tok.Is("}") && !tok.Is("case")) {
      if (tok.Is("{")) {
        tok = matching::Link(tok);
      }
      tok = tok.Next();
    }
    if (tok.Is("case")) {
      ctx.Report(token);
    }
  }
}

void SingleClauseSwitch(const CheckContext &ctx) {
  for (const auto &token : ctx.Tokens()) {
    auto body = SwitchBody(token);
    if (!body) {
      continue;
    }
    int clauses = 0;
    for (auto tok = body.Next(); tok; tok = tok.Next()) {
      if (tok.Is("break") || tok.Is("return") || tok.Is("throw")) {
        clauses++;
      } else if (tok.Is("{")) {
        tok = matching::Link(tok);
        if (matching::IsNoReturnScope(tok)) {
          clauses++;
        }
      } else if (tok.Is("}")) {
        break;
      }
    }
    if (clauses < 2) {
      ctx.Report(token);
    }
  }
}

void BooleanSwitch(const CheckContext &ctx) {
  for (const auto &token : ctx.Tokens()) {
    if (matching::SimpleMatch(token, "switch (") &&
        matching::IsBoolExpression(token.Next().Operand2())) {
      ctx.Report(token);
    }
  }
}

} // namespace rules::checks
