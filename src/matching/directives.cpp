#include "directives.hpp"

#include <regex>

namespace matching {

std::optional<MacroDefinition> MacroDefinition::Parse(std::string_view directive) {
  static const std::regex kFunctionLike(
      R"(#define [A-Za-z0-9_]+\(([A-Za-z0-9_,]+)\)[ ]+(.*))");

  std::string text(directive);
  std::smatch match;
  if (!std::regex_search(text, match, kFunctionLike,
                         std::regex_constants::match_continuous)) {
    return std::nullopt;
  }

  MacroDefinition definition;
  std::string params = match[1].str();
  std::string::size_type start = 0;
  while (true) {
    auto comma = params.find(',', start);
    definition.params.push_back(params.substr(start, comma - start));
    if (comma == std::string::npos) {
      break;
    }
    start = comma + 1;
  }
  definition.expansion = match[2].str();
  return definition;
}

const models::Directive *FindInclude(const std::vector<models::Directive> &directives,
                                     std::string_view header) {
  const std::string wanted = "#include " + std::string(header);
  for (const auto &directive : directives) {
    if (directive.str == wanted) {
      return &directive;
    }
  }
  return nullptr;
}

std::string DirectiveName(std::string_view directive) {
  if (directive.empty() || directive.front() != '#') {
    return std::string(directive);
  }
  directive.remove_prefix(1);
  while (!directive.empty() && directive.front() == ' ') {
    directive.remove_prefix(1);
  }
  auto end = directive.find_first_of(" (<");
  return std::string(directive.substr(0, end));
}

} // namespace matching
