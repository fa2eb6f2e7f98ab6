#include "checks.hpp"

#include "../matching/literals.hpp"
#include "../matching/pattern.hpp"

#include <algorithm>
#include <regex>
#include <string>
#include <string_view>

namespace rules::checks {

namespace {

bool StartsWith(const std::string &text, std::string_view prefix) {
  return text.compare(0, prefix.size(), prefix) == 0;
}

bool EndsWith(const std::string &text, std::string_view suffix) {
  return text.size() >= suffix.size() &&
         text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool IsComment(const models::TokenRef &token) {
  return StartsWith(token.Str(), "//") || StartsWith(token.Str(), "/*");
}

} // namespace

void NestedCommentMarker(const CheckContext &ctx) {
  for (const auto &token : ctx.RawTokens()) {
    const auto &text = token.Str();
    const bool line_comment = StartsWith(text, "//");
    if (!line_comment && !StartsWith(text, "/*")) {
      continue;
    }
    auto body = text.substr(std::min(text.find_first_not_of('/'), text.size()));
    if ((!line_comment && body.find("//") != std::string::npos) ||
        body.find("/*") != std::string::npos) {
      ctx.Report(token);
    }
  }
}

void LineSplicingComment(const CheckContext &ctx) {
  for (const auto &token : ctx.RawTokens()) {
    if (!StartsWith(token.Str(), "//")) {
      continue;
    }
    // a "??/" trigraph would become a backslash
    if (EndsWith(token.Str(), "??/")) {
      ctx.Report(token);
    } else if (token.Next() && token.Next()->line == token->line) {
      ctx.Report(token);
    }
  }
}

void UnterminatedEscape(const CheckContext &ctx) {
  for (const auto &token : ctx.RawTokens()) {
    const auto &text = token.Str();
    if (text.size() < 3 || (text[0] != '"' && text[0] != '\'')) {
      continue;
    }
    if (text.back() != text.front()) {
      continue;
    }
    const std::string_view symbols(text.data() + 1, text.size() - 2);
    if (symbols.size() < 2 || !matching::HasNumericEscapeSequence(symbols)) {
      continue;
    }
    // every escape runs up to the next backslash
    auto start = symbols.find('\\');
    while (start != std::string_view::npos) {
      auto end = symbols.find('\\', start + 1);
      auto sequence = symbols.substr(start, end == std::string_view::npos
                                                ? std::string_view::npos
                                                : end - start);
      if (!matching::IsHexEscapeSequence(sequence) &&
          !matching::IsOctalEscapeSequence(sequence) &&
          !matching::IsSimpleEscapeSequence(sequence)) {
        ctx.Report(token);
      }
      start = end;
    }
  }
}

void Trigraph(const CheckContext &ctx) {
  static constexpr std::string_view kTrigraphs[] = {
      "?\?=", "?\?(", "?\?/", "?\?)", "?\?'", "?\?<", "?\?!", "?\?>", "?\?-"};

  for (const auto &token : ctx.RawTokens()) {
    const auto &text = token.Str();
    if (text.size() < 2 || text.front() != '"' || text.back() != '"') {
      continue;
    }
    const std::string_view body(text.data() + 1, text.size() - 2);
    for (auto trigraph : kTrigraphs) {
      if (body.find(trigraph) != std::string_view::npos) {
        ctx.Report(token);
        break;
      }
    }
  }
}

void OctalConstant(const CheckContext &ctx) {
  static const std::regex kOctal("^0[0-7]+$");
  for (const auto &token : ctx.RawTokens()) {
    if (std::regex_match(token.Str(), kOctal)) {
      ctx.Report(token);
    }
  }
}

void LowercaseLongSuffix(const CheckContext &ctx) {
  static const std::regex kLowercaseL("^[0-9.uU]+l");
  for (const auto &token : ctx.RawTokens()) {
    if (std::regex_search(token.Str(), kLowercaseL)) {
      ctx.Report(token);
    }
  }
}

void RestrictQualifier(const CheckContext &ctx) {
  for (const auto &token : ctx.RawTokens()) {
    if (token.Is("restrict")) {
      ctx.Report(token);
    }
  }
}

void DesignatedArraySize(const CheckContext &ctx) {
  for (const auto &token : ctx.RawTokens()) {
    if (matching::SimpleMatch(token, "[ ] = { [")) {
      ctx.Report(token);
    }
  }
}

void SizeofArithmetic(const CheckContext &ctx) {
  static const std::regex kIdentifierStart("^[a-zA-Z_]");
  enum class State { kNone, kSizeof, kOperand };

  auto state = State::kNone;
  for (const auto &token : ctx.RawTokens()) {
    if (IsComment(token)) {
      continue;
    }
    if (token.Is("sizeof")) {
      state = State::kSizeof;
    } else if (state == State::kSizeof) {
      state = std::regex_search(token.Str(), kIdentifierStart) ? State::kOperand
                                                                : State::kNone;
    } else if (state == State::kOperand) {
      if (token.Is("+") || token.Is("-") || token.Is("*") || token.Is("/") ||
          token.Is("%")) {
        ctx.Report(token);
      } else {
        state = State::kNone;
      }
    }
  }
}

void CompoundBody(const CheckContext &ctx) {
  enum class State { kNone, kCondition, kBody };

  auto state = State::kNone;
  int indent = 0;
  models::TokenRef keyword;
  for (const auto &token : ctx.RawTokens()) {
    if (token.Is("if") || token.Is("for") || token.Is("while")) {
      if (matching::SimpleMatch(token.Previous(), "# if")) {
        continue;
      }
      if (matching::SimpleMatch(token.Previous(), "} while")) {
        // do { ... } while
        auto start = matching::RawLink(token.Previous());
        if (start && matching::SimpleMatch(start.Previous(), "do {")) {
          continue;
        }
      }
      if (state == State::kBody) {
        ctx.Report(keyword);
      }
      state = State::kCondition;
      indent = 0;
      keyword = token;
    } else if (token.Is("else")) {
      if (matching::SimpleMatch(token.Previous(), "# else") ||
          matching::SimpleMatch(token, "else if")) {
        continue;
      }
      if (state == State::kBody) {
        ctx.Report(keyword);
      }
      state = State::kBody;
      indent = 0;
      keyword = token;
    } else if (state == State::kCondition) {
      if (indent == 0 && !token.Is("(")) {
        state = State::kNone;
        continue;
      }
      if (token.Is("(")) {
        indent++;
      } else if (token.Is(")")) {
        if (indent == 0) {
          state = State::kNone;
        } else if (indent == 1) {
          state = State::kBody;
        }
        indent--;
      }
    } else if (state == State::kBody) {
      if (IsComment(token)) {
        continue;
      }
      state = State::kNone;
      if (!token.Is("{")) {
        ctx.Report(keyword);
      }
    }
  }
}

void StaticArrayParameter(const CheckContext &ctx) {
  for (const auto &token : ctx.RawTokens()) {
    if (matching::SimpleMatch(token, "[ static")) {
      ctx.Report(token);
    }
  }
}

void IncludeSyntax(const CheckContext &ctx) {
  int line = -1;
  for (const auto &token : ctx.RawTokens()) {
    if (StartsWith(token.Str(), "/") || token->line == line) {
      continue;
    }
    line = token->line;
    if (!matching::SimpleMatch(token, "# include")) {
      continue;
    }
    int header_tokens = 0;
    for (auto header = token.Next().Next(); header && header->line == line;
         header = header.Next()) {
      if (!IsComment(header)) {
        header_tokens++;
      }
    }
    if (header_tokens != 1) {
      ctx.Report(token);
    }
  }
}

} // namespace rules::checks
