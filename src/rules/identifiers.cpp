#include "checks.hpp"

#include "../matching/expressions.hpp"

#include <algorithm>
#include <cctype>
#include <map>
#include <regex>
#include <set>
#include <string>
#include <vector>

namespace rules::checks {

namespace {

/* significant length of external and same-scope identifiers */
constexpr std::size_t kExternalChars = 31;

std::string Prefix(const std::string &name, std::size_t length) {
  return name.substr(0, length);
}

int LineOf(const models::TokenRef &token) { return token->line; }

std::vector<models::VariableRef> Variables(const models::Model &model) {
  std::vector<models::VariableRef> variables;
  for (std::size_t i = 0; i < model.variables.size(); ++i) {
    variables.emplace_back(&model, static_cast<int>(i));
  }
  return variables;
}

std::vector<models::ScopeRef> Scopes(const models::Model &model) {
  std::vector<models::ScopeRef> scopes;
  for (std::size_t i = 0; i < model.scopes.size(); ++i) {
    scopes.emplace_back(&model, static_cast<int>(i));
  }
  return scopes;
}

/* reports the later of two declarations */
void ReportLater(const CheckContext &ctx, const models::TokenRef &first,
                 const models::TokenRef &second) {
  ctx.Report(LineOf(first) > LineOf(second) ? first : second);
}

} // namespace

void UnusedParameter(const CheckContext &ctx) {
  const auto &model = ctx.Model();
  for (std::size_t f = 0; f < model.functions.size(); ++f) {
    models::FunctionRef func(&model, static_cast<int>(f));
    if (func->arguments.empty()) {
      continue;
    }
    for (const auto &scope : Scopes(model)) {
      if (!scope.IsType(models::ScopeType::kFunction) || scope.Function() != func) {
        continue;
      }
      std::set<int> unused;
      for (const auto &[position, variable] : func->arguments) {
        unused.insert(variable);
      }
      auto token = scope.BodyStart();
      while (token.Next() && token != scope.BodyEnd() && !unused.empty()) {
        unused.erase(token->variable);
        token = token.Next();
      }
      if (!unused.empty()) {
        ctx.Report(func.TokenDef());
      }
    }
  }
}

void ExternalIdentifierClash(const CheckContext &ctx) {
  std::map<std::string, std::vector<models::TokenRef>> long_names;
  for (const auto &var : Variables(ctx.Model())) {
    auto name = var.NameToken();
    if (!name || name.Str().size() <= kExternalChars ||
        !matching::HasExternalLinkage(var)) {
      continue;
    }
    long_names[Prefix(name.Str(), kExternalChars)].push_back(name);
  }
  for (auto &[prefix, tokens] : long_names) {
    if (tokens.size() < 2) {
      continue;
    }
    std::sort(tokens.begin(), tokens.end(),
              [](const models::TokenRef &a, const models::TokenRef &b) {
                return std::make_pair(a->line, a->column) <
                       std::make_pair(b->line, b->column);
              });
    for (auto it = tokens.begin() + 1; it != tokens.end(); ++it) {
      ctx.Report(*it);
    }
  }
}

void ScopeIdentifierClash(const CheckContext &ctx) {
  struct ScopeMembers {
    std::vector<models::VariableRef> variables;
    std::vector<models::ScopeRef> scopes;
  };
  std::map<int, ScopeMembers> members;

  for (const auto &var : Variables(ctx.Model())) {
    auto name = var.NameToken();
    if (!name || name.Str().size() <= kExternalChars) {
      continue;
    }
    members[name->scope].variables.push_back(var);
  }
  for (const auto &scope : Scopes(ctx.Model())) {
    if (scope.NestedIn() && !scope->class_name.empty()) {
      members[scope.NestedIn().Index()].scopes.push_back(scope);
    }
  }

  for (const auto &[scope_index, member] : members) {
    const auto &vars = member.variables;
    if (vars.size() <= 1) {
      continue;
    }
    for (std::size_t i = 0; i < vars.size(); ++i) {
      const auto &var1 = vars[i];
      auto name1 = var1.NameToken();
      for (std::size_t j = i + 1; j < vars.size(); ++j) {
        const auto &var2 = vars[j];
        if (var1->is_argument && var2->is_argument) {
          continue;
        }
        if (matching::HasExternalLinkage(var1) || matching::HasExternalLinkage(var2)) {
          continue;
        }
        auto name2 = var2.NameToken();
        if (Prefix(name1.Str(), kExternalChars) == Prefix(name2.Str(), kExternalChars) &&
            var1 != var2) {
          ReportLater(ctx, name1, name2);
        }
      }
      for (const auto &inner : member.scopes) {
        if (Prefix(name1.Str(), kExternalChars) ==
            Prefix(inner->class_name, kExternalChars)) {
          ReportLater(ctx, name1, inner.BodyStart());
        }
      }
    }

    const auto &scopes = member.scopes;
    if (scopes.size() <= 1) {
      continue;
    }
    for (std::size_t i = 0; i < scopes.size(); ++i) {
      for (std::size_t j = i + 1; j < scopes.size(); ++j) {
        if (Prefix(scopes[i]->class_name, kExternalChars) ==
            Prefix(scopes[j]->class_name, kExternalChars)) {
          ReportLater(ctx, scopes[i].BodyStart(), scopes[j].BodyStart());
        }
      }
    }
  }
}

void IdentifierHiding(const CheckContext &ctx) {
  const auto significant = ctx.SignificantChars();
  const auto &model = ctx.Model();

  std::map<int, std::vector<models::VariableRef>> scope_vars;
  for (const auto &var : Variables(model)) {
    if (auto name = var.NameToken()) {
      scope_vars[name->scope].push_back(var);
    }
  }

  std::map<std::string, std::vector<models::ScopeRef>> named_scopes;
  std::set<std::string> enumerators;
  for (const auto &scope : Scopes(model)) {
    if (!scope->class_name.empty()) {
      named_scopes[Prefix(scope->class_name, significant)].push_back(scope);
    }
    if (scope.IsType(models::ScopeType::kEnum)) {
      for (auto tok = scope.BodyStart().Next(); tok && tok != scope.BodyEnd();
           tok = tok.Next()) {
        if (!tok->values.empty() && tok->is_name) {
          enumerators.insert(Prefix(tok.Str(), significant));
        }
      }
    }
  }

  for (const auto &inner_scope : Scopes(model)) {
    if (inner_scope.IsType(models::ScopeType::kEnum) ||
        inner_scope.IsType(models::ScopeType::kGlobal)) {
      continue;
    }
    auto inner_vars = scope_vars.find(inner_scope.Index());
    if (inner_vars == scope_vars.end()) {
      continue;
    }
    for (const auto &inner_var : inner_vars->second) {
      auto inner_name = inner_var.NameToken();
      const auto inner_prefix = Prefix(inner_name.Str(), significant);

      for (auto outer = inner_scope.NestedIn(); outer; outer = outer.NestedIn()) {
        auto outer_vars = scope_vars.find(outer.Index());
        if (outer_vars == scope_vars.end()) {
          continue;
        }
        for (const auto &outer_var : outer_vars->second) {
          auto outer_name = outer_var.NameToken();
          if (inner_prefix != Prefix(outer_name.Str(), significant)) {
            continue;
          }
          if (outer_var->is_argument && outer.IsType(models::ScopeType::kGlobal) &&
              !inner_var->is_argument) {
            continue;
          }
          if (LineOf(inner_name) > LineOf(outer_name)) {
            ctx.Report(inner_name);
          } else {
            ctx.Report(outer_name);
          }
        }
      }

      auto same_named = named_scopes.find(inner_prefix);
      if (same_named != named_scopes.end()) {
        for (const auto &scope : same_named->second) {
          if (LineOf(inner_name) > LineOf(scope.BodyStart())) {
            ctx.Report(inner_name);
          } else {
            ctx.Report(scope.BodyStart());
          }
        }
      }

      if (enumerators.count(inner_prefix) != 0) {
        if (LineOf(inner_name) > LineOf(inner_scope.BodyStart())) {
          ctx.Report(inner_name);
        } else {
          ctx.Report(inner_scope.BodyStart());
        }
      }
    }
  }

  for (const auto &scope : Scopes(model)) {
    if (!scope->class_name.empty() &&
        enumerators.count(Prefix(scope->class_name, significant)) != 0) {
      ctx.Report(scope.BodyStart());
    }
  }
}

void MacroNameClash(const CheckContext &ctx) {
  static const std::regex kName(R"(#define ([a-zA-Z0-9_]+))");
  static const std::regex kParams(R"(#define ([a-zA-Z0-9_]+)[(]([a-zA-Z0-9_, ]+)[)])");
  const auto significant = ctx.SignificantChars();

  struct Macro {
    const models::Directive *directive;
    std::string name;
    std::vector<std::string> params;
  };
  std::vector<Macro> macros;
  std::map<std::string, std::size_t> short_names;

  for (const auto &directive : ctx.Model().directives) {
    std::smatch name_match;
    if (!std::regex_search(directive.str, name_match, kName,
                           std::regex_constants::match_continuous)) {
      continue;
    }
    Macro macro{&directive, name_match[1].str(), {}};
    const auto short_name = Prefix(macro.name, significant);
    auto known = short_names.find(short_name);
    if (known != short_names.end()) {
      if (macro.name != macros[known->second].name) {
        ctx.Report(directive);
      }
    } else {
      short_names[short_name] = macros.size();
    }

    std::smatch params_match;
    if (std::regex_search(directive.str, params_match, kParams,
                          std::regex_constants::match_continuous)) {
      std::string params = params_match[2].str();
      params.erase(std::remove(params.begin(), params.end(), ' '), params.end());
      std::string::size_type start = 0;
      while (true) {
        auto comma = params.find(',', start);
        macro.params.push_back(params.substr(start, comma - start));
        if (comma == std::string::npos) {
          break;
        }
        start = comma + 1;
      }
    }
    macros.push_back(std::move(macro));
  }

  for (const auto &macro : macros) {
    for (std::size_t i = 0; i < macro.params.size(); ++i) {
      const auto param = Prefix(macro.params[i], significant);
      for (std::size_t j = i + 1; j < macro.params.size(); ++j) {
        if (param == Prefix(macro.params[j], significant)) {
          ctx.Report(*macro.directive);
        }
      }
      auto clash = short_names.find(param);
      if (clash != short_names.end()) {
        const auto *other = macros[clash->second].directive;
        ctx.Report(other->line > macro.directive->line ? *other : *macro.directive);
      }
    }
  }
}

void IdentifierMacroClash(const CheckContext &ctx) {
  static const std::regex kName(R"(#define ([A-Za-z0-9_]+))");
  const auto significant = ctx.SignificantChars();

  std::set<std::string> macro_names;
  for (const auto &directive : ctx.Model().directives) {
    std::smatch match;
    if (std::regex_search(directive.str, match, kName,
                          std::regex_constants::match_continuous)) {
      macro_names.insert(Prefix(match[1].str(), significant));
    }
  }

  for (const auto &var : Variables(ctx.Model())) {
    auto name = var.NameToken();
    if (name && macro_names.count(Prefix(name.Str(), significant)) != 0) {
      ctx.Report(name);
    }
  }
  for (const auto &scope : Scopes(ctx.Model())) {
    if (!scope->class_name.empty() &&
        macro_names.count(Prefix(scope->class_name, significant)) != 0) {
      ctx.Report(scope.BodyStart());
    }
  }
}

void ReservedIdentifier(const CheckContext &ctx) {
  static const std::regex kReservedMacro(R"(#define (errno|_[_A-Z]+))");
  const auto &model = ctx.Model();

  for (const auto &directive : model.directives) {
    if (std::regex_search(directive.str, kReservedMacro)) {
      ctx.Report(directive);
    }
  }

  std::vector<models::TokenRef> identifiers;
  for (const auto &var : Variables(model)) {
    identifiers.push_back(var.NameToken());
  }
  for (std::size_t i = 0; i < model.functions.size(); ++i) {
    identifiers.push_back(models::FunctionRef(&model, static_cast<int>(i)).TokenDef());
  }
  for (const auto &tok : ctx.Tokens()) {
    if (tok->type_scope != models::kNoIndex) {
      identifiers.push_back(tok);
    }
  }
  for (const auto &tok : ctx.Tokens()) {
    const auto *type = tok.Type();
    if (type != nullptr && type->type_scope != models::kNoIndex) {
      identifiers.push_back(tok);
    }
  }

  std::set<int> seen;
  for (const auto &token : identifiers) {
    if (!token || !seen.insert(token.Index()).second) {
      continue;
    }
    const auto &name = token.Str();
    if (name.size() < 2) {
      continue;
    }
    if (name == "errno") {
      ctx.Report(token);
      continue;
    }
    if (name[0] != '_') {
      continue;
    }
    if (std::isupper(static_cast<unsigned char>(name[1])) || name[1] == '_') {
      ctx.Report(token);
      continue;
    }
    // file scope names with internal linkage may start with "_x"
    if (token.Scope().IsType(models::ScopeType::kGlobal)) {
      if (token.Variable() && token.Variable()->is_static) {
        continue;
      }
      if (token.Function() && token.Function()->is_static) {
        continue;
      }
    }
    ctx.Report(token);
  }
}

} // namespace rules::checks
