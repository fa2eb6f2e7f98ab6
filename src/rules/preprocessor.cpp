#include "checks.hpp"

#include "../matching/directives.hpp"
#include "../matching/expressions.hpp"

#include <algorithm>
#include <cctype>
#include <map>
#include <regex>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace rules::checks {

namespace {

bool StartsWith(const std::string &text, std::string_view prefix) {
  return text.compare(0, prefix.size(), prefix) == 0;
}

bool IsIdentifierChar(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
}

/* checks that every use of param in the replacement list is parenthesized */
bool IsParenthesized(const std::string &expansion, const std::string &param) {
  const std::string exp = "(" + expansion + ")";
  std::string::size_type pos = 0;
  while (pos < exp.size()) {
    pos = exp.find(param, pos);
    if (pos == std::string::npos) {
      break;
    }
    auto before = pos - 1;
    auto after = pos + param.size();
    pos = after;
    if (IsIdentifierChar(exp[before]) || IsIdentifierChar(exp[after])) {
      continue;
    }
    while (exp[before] == ' ') {
      before--;
    }
    if (exp[before] != '(' && exp[before] != '[') {
      return false;
    }
    while (exp[after] == ' ') {
      after++;
    }
    if (exp[after] != ')' && exp[after] != ']') {
      return false;
    }
  }
  return true;
}

} // namespace

void LateInclude(const CheckContext &ctx) {
  std::map<std::string, int> first_code_line;
  for (const auto &token : ctx.Tokens()) {
    auto it = first_code_line.find(token->file);
    if (it == first_code_line.end()) {
      first_code_line[token->file] = token->line;
    } else {
      it->second = std::min(it->second, token->line);
    }
  }
  for (const auto &directive : ctx.Model().directives) {
    if (!StartsWith(directive.str, "#include")) {
      continue;
    }
    auto it = first_code_line.find(directive.file);
    if (it != first_code_line.end() && it->second < directive.line) {
      ctx.Report(directive);
    }
  }
}

void IncludeHeaderName(const CheckContext &ctx) {
  static constexpr std::string_view kForbidden[] = {"\\", "//", "/*", "'"};
  for (const auto &directive : ctx.Model().directives) {
    if (!StartsWith(directive.str, "#include ")) {
      continue;
    }
    for (auto pattern : kForbidden) {
      if (directive.str.find(pattern) != std::string::npos) {
        ctx.Report(directive);
        break;
      }
    }
  }
}

void KeywordMacro(const CheckContext &ctx) {
  static const std::regex kDefine("#define ([a-z][a-z0-9_]+)");
  for (const auto &directive : ctx.Model().directives) {
    std::smatch match;
    if (std::regex_search(directive.str, match, kDefine) &&
        matching::IsKeyword(match[1].str())) {
      ctx.Report(directive);
    }
  }
}

void Undef(const CheckContext &ctx) {
  for (const auto &directive : ctx.Model().directives) {
    if (StartsWith(directive.str, "#undef ")) {
      ctx.Report(directive);
    }
  }
}

void UnparenthesizedMacroParameter(const CheckContext &ctx) {
  for (const auto &directive : ctx.Model().directives) {
    auto definition = matching::MacroDefinition::Parse(directive.str);
    if (!definition) {
      continue;
    }
    for (const auto &param : definition->params) {
      if (!param.empty() && !IsParenthesized(definition->expansion, param)) {
        ctx.Report(directive);
        break;
      }
    }
  }
}

void StringifyOperator(const CheckContext &ctx) {
  for (const auto &directive : ctx.Model().directives) {
    auto definition = matching::MacroDefinition::Parse(directive.str);
    if (definition && definition->expansion.find('#') != std::string::npos) {
      ctx.Report(directive);
    }
  }
}

void UnknownDirective(const CheckContext &ctx) {
  static const std::unordered_set<std::string> kKnown{
      "define", "elif",    "else",   "endif", "error", "if",
      "ifdef",  "ifndef",  "include", "pragma", "undef", "warning"};
  for (const auto &directive : ctx.Model().directives) {
    if (kKnown.count(matching::DirectiveName(directive.str)) == 0) {
      ctx.Report(directive);
    }
  }
}

void ConditionalAcrossFiles(const CheckContext &ctx) {
  // open #if directives, innermost last
  std::vector<const models::Directive *> open;
  for (const auto &directive : ctx.Model().directives) {
    const auto &text = directive.str;
    if (StartsWith(text, "#if ") || StartsWith(text, "#ifdef ") ||
        StartsWith(text, "#ifndef ")) {
      open.push_back(&directive);
    } else if (text == "#else" || StartsWith(text, "#elif ")) {
      if (open.empty()) {
        ctx.Report(directive);
        open.push_back(&directive);
      } else if (directive.file != open.back()->file) {
        ctx.Report(directive);
      }
    } else if (text == "#endif") {
      if (open.empty()) {
        ctx.Report(directive);
        continue;
      }
      if (directive.file != open.back()->file) {
        ctx.Report(directive);
      }
      open.pop_back();
    }
  }
}

} // namespace rules::checks
