#include "expressions.hpp"

#include "pattern.hpp"

#include <unordered_set>

namespace matching {

const std::unordered_set<std::string_view> kKeywords{
    "auto",     "break",  "case",    "char",   "const",    "continue",
    "default",  "do",     "double",  "else",   "enum",     "extern",
    "float",    "for",    "goto",    "if",     "int",      "long",
    "register", "return", "short",   "signed", "sizeof",   "static",
    "struct",   "switch", "typedef", "union",  "unsigned", "void",
    "volatile", "while",
};

bool IsKeyword(std::string_view name) { return kKeywords.count(name) != 0; }

bool IsCast(models::TokenRef expr) {
  if (!expr.Is("(") || !expr.Operand1() || expr.Operand2()) {
    return false;
  }
  return !SimpleMatch(expr, "( )");
}

bool IsFunctionCall(models::TokenRef expr) {
  if (!expr.Is("(") || !expr.Operand1()) {
    return false;
  }
  if (expr.Operand1() != expr.Previous()) {
    return false;
  }
  return !IsKeyword(expr.Operand1().Str());
}

bool HasExternalLinkage(const models::VariableRef &var) {
  return var && var->is_global && !var->is_static;
}

int CountSideEffects(models::TokenRef expr) {
  if (!expr || expr.Is(",") || expr.Is(";")) {
    return 0;
  }
  int ret = (expr.Is("++") || expr.Is("--") || expr.Is("=")) ? 1 : 0;
  return ret + CountSideEffects(expr.Operand1()) +
         CountSideEffects(expr.Operand2());
}

bool HasSideEffectsRecursive(models::TokenRef expr) {
  if (!expr) {
    return false;
  }
  if (expr.Is("=") && expr.Operand1().Is("[")) {
    // designated array initializer: { [0] = x }
    if (expr.Operand1().Previous().Is("{")) {
      return HasSideEffectsRecursive(expr.Operand2());
    }
  }
  if (expr.Is("=") && expr.Operand1().Is(".")) {
    auto e = expr.Operand1();
    while (e.Is(".") && e.Operand2()) {
      e = e.Operand1();
    }
    if (e.Is(".")) {
      return false;
    }
  }
  if (expr.Is("++") || expr.Is("--") || expr.Is("=")) {
    return true;
  }
  return HasSideEffectsRecursive(expr.Operand1()) ||
         HasSideEffectsRecursive(expr.Operand2());
}

std::optional<std::array<models::TokenRef, 3>>
ForLoopExpressions(models::TokenRef for_token) {
  if (!for_token.Is("for")) {
    return std::nullopt;
  }
  auto lpar = for_token.Next();
  if (!lpar.Is("(")) {
    return std::nullopt;
  }
  auto first = lpar.Operand2();
  if (!first.Is(";")) {
    return std::nullopt;
  }
  auto second = first.Operand2();
  if (!second.Is(";")) {
    return std::nullopt;
  }
  return std::array<models::TokenRef, 3>{first.Operand1(), second.Operand1(),
                                         second.Operand2()};
}

std::vector<models::TokenRef> FindCounterTokens(models::TokenRef cond) {
  std::vector<models::TokenRef> ret;
  if (!cond) {
    return ret;
  }
  if (cond.Is("&&") || cond.Is("||")) {
    ret = FindCounterTokens(cond.Operand1());
    auto rhs = FindCounterTokens(cond.Operand2());
    ret.insert(ret.end(), rhs.begin(), rhs.end());
    return ret;
  }
  auto op1 = cond.Operand1();
  auto op2 = cond.Operand2();
  if ((cond->is_arithmetical_op || cond->is_comparison_op) && op1 && op2) {
    if (op1->is_name) {
      ret.push_back(op1);
    }
    if (op2->is_name) {
      ret.push_back(op2);
    }
    if (op1->is_op) {
      auto nested = FindCounterTokens(op1);
      ret.insert(ret.end(), nested.begin(), nested.end());
    }
    if (op2->is_op) {
      auto nested = FindCounterTokens(op2);
      ret.insert(ret.end(), nested.begin(), nested.end());
    }
  }
  return ret;
}

bool IsFloatCounterInWhileLoop(models::TokenRef while_token) {
  if (!SimpleMatch(while_token, "while (")) {
    return false;
  }
  auto lpar = while_token.Next();
  auto rpar = Link(lpar);
  auto counters = FindCounterTokens(lpar.Operand2());

  models::TokenRef body_start;
  if (SimpleMatch(rpar, ") {")) {
    body_start = rpar.Next();
  } else if (SimpleMatch(while_token.Previous(), "} while") &&
             SimpleMatch(Link(while_token.Previous()).Previous(), "do {")) {
    body_start = Link(while_token.Previous());
  } else {
    return false;
  }

  auto body_end = Link(body_start);
  auto token = body_start;
  while (token && token != body_end) {
    token = token.Next();
    for (const auto &counter : counters) {
      const auto *type = counter.Type();
      if (type == nullptr || !type->IsFloat()) {
        continue;
      }
      if (token && token->is_assignment_op &&
          token.Operand1().Str() == counter.Str()) {
        return true;
      }
      if (token.Str() == counter.Str() &&
          (token.Parent().Is("++") || token.Parent().Is("--"))) {
        return true;
      }
    }
  }
  return false;
}

bool IsBoolExpression(models::TokenRef expr) {
  if (!expr) {
    return false;
  }
  if (const auto *type = expr.Type()) {
    if (type->type == models::TypeKind::kBool || type->bits == 1) {
      return true;
    }
  }
  static const std::unordered_set<std::string_view> kBoolTokens{
      "!", "==", "!=", "<", "<=", ">", ">=", "&&", "||", "0", "1", "true",
      "false"};
  return kBoolTokens.count(expr.Str()) != 0;
}

bool IsConstantExpression(models::TokenRef expr) {
  if (!expr) {
    return false;
  }
  if (expr->is_number) {
    return true;
  }
  if (expr->is_name) {
    return false;
  }
  if (SimpleMatch(expr.Previous(), "sizeof (")) {
    return true;
  }
  if (expr.Operand1() && !IsConstantExpression(expr.Operand1())) {
    return false;
  }
  if (expr.Operand2() && !IsConstantExpression(expr.Operand2())) {
    return false;
  }
  return true;
}

bool IsUnsignedInt(models::TokenRef expr) {
  if (!expr) {
    return false;
  }
  if (expr->is_number) {
    return expr.Str().find_first_of("uU") != std::string::npos;
  }
  if (expr.Is("+") || expr.Is("-") || expr.Is("*") || expr.Is("/") ||
      expr.Is("%")) {
    return IsUnsignedInt(expr.Operand1()) || IsUnsignedInt(expr.Operand2());
  }
  return false;
}

models::TokenRef FindGotoLabel(models::TokenRef goto_token) {
  const auto &label = goto_token.Next().Str();
  if (label.empty()) {
    return {};
  }
  for (auto tok = goto_token.Next().Next(); tok; tok = tok.Next()) {
    if (tok.Is("}") && tok.Scope().IsType(models::ScopeType::kFunction)) {
      break;
    }
    if (tok.Is(label) && tok.Next().Is(":")) {
      return tok;
    }
  }
  return {};
}

namespace {

void CollectArguments(models::TokenRef tok,
                      std::vector<models::TokenRef> &arguments) {
  if (!tok) {
    return;
  }
  if (tok.Is(",")) {
    CollectArguments(tok.Operand1(), arguments);
    CollectArguments(tok.Operand2(), arguments);
  } else {
    arguments.push_back(tok);
  }
}

} // namespace

std::vector<models::TokenRef> FunctionArguments(models::TokenRef call) {
  std::vector<models::TokenRef> arguments;
  CollectArguments(call.Operand2(), arguments);
  return arguments;
}

bool IsNoReturnScope(models::TokenRef token) {
  if (!token.Is("}") || !token.Previous().Is(";")) {
    return false;
  }
  if (SimpleMatch(token.Previous().Previous(), "break ;")) {
    return true;
  }
  auto prev = token.Previous().Previous();
  while (prev && !prev.Is(";") && !prev.Is("{") && !prev.Is("}")) {
    if (prev.Is("]") || prev.Is(")")) {
      prev = Link(prev);
    }
    prev = prev.Previous();
  }
  return prev && (prev.Next().Is("throw") || prev.Next().Is("return"));
}

} // namespace matching
