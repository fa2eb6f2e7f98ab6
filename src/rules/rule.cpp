#include "rule.hpp"

namespace rules {

namespace {

std::vector<models::TokenRef> Collect(const models::Model &model) {
  std::vector<models::TokenRef> tokens;
  tokens.reserve(model.tokens.size());
  for (std::size_t i = 0; i < model.tokens.size(); ++i) {
    tokens.emplace_back(&model, static_cast<int>(i));
  }
  return tokens;
}

} // namespace

std::vector<models::TokenRef> CheckContext::Tokens() const {
  return Collect(configuration_.model);
}

std::vector<models::TokenRef> CheckContext::RawTokens() const {
  return Collect(unit_.raw);
}

std::size_t CheckContext::SignificantChars() const {
  return configuration_.standards.c == "c99" ? 63 : 31;
}

void CheckContext::Report(const models::TokenRef &token) const {
  reporter_.Report(models::Location::Of(token), rule_);
}

void CheckContext::Report(const models::Directive &directive) const {
  reporter_.Report(models::Location::Of(directive), rule_);
}

} // namespace rules
