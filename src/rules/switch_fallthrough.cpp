#include "switch_fallthrough.hpp"

#include "../matching/pattern.hpp"

#include <algorithm>
#include <cctype>
#include <string>

namespace rules {

namespace {

enum class ClauseState {
  kNone,   /**< outside a case or default clause */
  kBreak,  /**< clause terminator seen, waiting for its ';' */
  kOk,     /**< a new case or default label is allowed here */
  kSwitch  /**< between "switch" and its opening brace */
};

bool IsComment(const std::string &text) {
  return text.compare(0, 2, "/*") == 0 || text.compare(0, 2, "//") == 0;
}

bool MentionsFallthrough(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return text.find("fallthrough") != std::string::npos;
}

/* checks whether a closing brace ends a plain block inside a clause */
bool ClosesUnconditionalBlock(models::TokenRef rbrace) {
  auto prev = matching::FindRawLink(rbrace);
  if (prev) {
    prev = prev.Previous();
    while (prev && IsComment(prev.Str())) {
      prev = prev.Previous();
    }
  }
  return prev && (prev.Is(":") || prev.Is(";") || prev.Is("{") ||
                  prev.Is("}"));
}

} // namespace

void SwitchFallthroughRule::Check(const CheckContext &context) const {
  auto state = ClauseState::kNone;
  models::TokenRef end_switch;
  for (const auto &token : context.RawTokens()) {
    if (token.Is("switch")) {
      state = ClauseState::kSwitch;
    }
    if (state == ClauseState::kSwitch) {
      if (!token.Is("{")) {
        continue;
      }
      end_switch = matching::FindRawLink(token);
    }

    if (token.Is("break") || token.Is("return") || token.Is("throw")) {
      state = ClauseState::kBreak;
    } else if (token.Is(";")) {
      if (state == ClauseState::kBreak) {
        state = ClauseState::kOk;
      } else if (token.Next() && token.Next() == end_switch) {
        context.Report(token.Next());
      } else {
        state = ClauseState::kNone;
      }
    } else if (IsComment(token.Str())) {
      if (MentionsFallthrough(token.Str())) {
        state = ClauseState::kOk;
      }
    } else if (matching::SimpleMatch(token, "[ [ fallthrough ] ] ;")) {
      state = ClauseState::kBreak;
    } else if (token.Is("{")) {
      state = ClauseState::kOk;
    } else if (token.Is("}") && state == ClauseState::kOk) {
      if (!ClosesUnconditionalBlock(token)) {
        state = ClauseState::kNone;
      }
    } else if (token.Is("case") || token.Is("default")) {
      if (state != ClauseState::kOk) {
        context.Report(token);
      }
      state = ClauseState::kOk;
    }
  }
}

} // namespace rules
