#include "rule_id.hpp"

#include <cctype>
#include <fmt/core.h>
#include <stdexcept>

namespace rules {

namespace {

int ParseNumber(std::string_view digits, std::string_view text) {
  if (digits.empty() || digits.size() > 4) {
    throw std::invalid_argument(fmt::format("bad rule id '{}'", text));
  }
  int value = 0;
  for (char c : digits) {
    if (!std::isdigit(static_cast<unsigned char>(c))) {
      throw std::invalid_argument(fmt::format("bad rule id '{}'", text));
    }
    value = value * 10 + (c - '0');
  }
  return value;
}

} // namespace

std::string RuleId::ToString() const { return fmt::format("{}.{}", major, minor); }

RuleId RuleId::Parse(std::string_view text) {
  auto dot = text.find('.');
  if (dot == std::string_view::npos) {
    throw std::invalid_argument(fmt::format("bad rule id '{}'", text));
  }
  RuleId id;
  id.major = ParseNumber(text.substr(0, dot), text);
  id.minor = ParseNumber(text.substr(dot + 1), text);
  if (id.minor >= 100) {
    throw std::invalid_argument(fmt::format("bad rule id '{}'", text));
  }
  return id;
}

} // namespace rules
