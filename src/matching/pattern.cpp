#include "pattern.hpp"

#include <string>

namespace matching {

bool SimpleMatch(models::TokenRef token, std::string_view pattern) {
  std::string_view::size_type start = 0;
  while (start <= pattern.size()) {
    auto end = pattern.find(' ', start);
    if (end == std::string_view::npos) {
      end = pattern.size();
    }
    if (!token.Is(pattern.substr(start, end - start))) {
      return false;
    }
    token = token.Next();
    start = end + 1;
  }
  return true;
}

models::TokenRef RawLink(models::TokenRef token) {
  if (!token.Is("}")) {
    return {};
  }
  int indent = 0;
  while (token) {
    if (token.Is("}")) {
      indent++;
    } else if (token.Is("{")) {
      indent--;
      if (indent == 0) {
        return token;
      }
    }
    token = token.Previous();
  }
  return {};
}

models::TokenRef FindRawLink(models::TokenRef token) {
  static constexpr std::string_view kOpen = "{([";
  static constexpr std::string_view kClose = "})]";

  if (token.Str().size() != 1) {
    return {};
  }
  const char c = token.Str()[0];
  std::string open;
  std::string close;
  bool forward = false;
  if (auto pos = kOpen.find(c); pos != std::string_view::npos) {
    open = std::string(1, c);
    close = std::string(1, kClose[pos]);
    forward = true;
  } else if (auto pos = kClose.find(c); pos != std::string_view::npos) {
    open = std::string(1, c);
    close = std::string(1, kOpen[pos]);
  } else {
    return {};
  }

  int indent = 0;
  while (token) {
    if (token.Is(open)) {
      indent++;
    } else if (token.Is(close)) {
      if (indent <= 1) {
        return token;
      }
      indent--;
    }
    token = forward ? token.Next() : token.Previous();
  }
  return {};
}

models::TokenRef Link(models::TokenRef token) {
  if (auto link = token.Link()) {
    return link;
  }
  return FindRawLink(token);
}

bool HasNoParentheses(models::TokenRef from, models::TokenRef to) {
  while (from && from != to) {
    if (from.Is("(") || from.Is(")")) {
      return false;
    }
    from = from.Next();
  }
  return from && from == to;
}

} // namespace matching
