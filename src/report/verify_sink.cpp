#include "verify_sink.hpp"

#include <algorithm>
#include <fmt/core.h>
#include <regex>
#include <sstream>

namespace report {

void VerifySink::Report(const models::Location &location, rules::RuleId rule) {
  actual_.push_back(fmt::format("{}:{}", location.line, rule.ToString()));
}

std::vector<std::string> ExpectedTags(const models::Model &raw) {
  static const std::regex kRuleTag("[0-9]+\\.[0-9]+");
  std::vector<std::string> expected;
  for (const auto &token : raw.tokens) {
    if (token.str.compare(0, 2, "//") != 0 ||
        token.str.find("TODO") != std::string::npos) {
      continue;
    }
    std::istringstream words(token.str.substr(2));
    std::string word;
    while (std::getline(words, word, ' ')) {
      if (std::regex_search(word, kRuleTag,
                            std::regex_constants::match_continuous)) {
        expected.push_back(fmt::format("{}:{}", token.line, word));
      }
    }
  }
  return expected;
}

std::vector<std::string> CompareTags(const std::vector<std::string> &expected,
                                     const std::vector<std::string> &actual) {
  auto contains = [](const std::vector<std::string> &tags,
                     const std::string &tag) {
    return std::find(tags.begin(), tags.end(), tag) != tags.end();
  };
  std::vector<std::string> mismatches;
  for (const auto &tag : expected) {
    if (!contains(actual, tag)) {
      mismatches.push_back("Expected but not seen: " + tag);
    }
  }
  for (const auto &tag : actual) {
    if (!contains(expected, tag)) {
      mismatches.push_back("Not expected: " + tag);
    }
  }
  return mismatches;
}

} // namespace report
