#include "literals.hpp"

#include <algorithm>
#include <cctype>

namespace matching {

namespace {

bool IsOctalDigit(char c) { return c >= '0' && c <= '7'; }

bool IsHexDigit(char c) {
  return std::isxdigit(static_cast<unsigned char>(c)) != 0;
}

} // namespace

bool IsHexEscapeSequence(std::string_view symbols) {
  if (symbols.size() < 3 || symbols.substr(0, 2) != "\\x") {
    return false;
  }
  auto digits = symbols.substr(2);
  return std::all_of(digits.begin(), digits.end(), IsHexDigit);
}

bool IsOctalEscapeSequence(std::string_view symbols) {
  if (symbols.size() < 2 || symbols.size() > 4 || symbols[0] != '\\') {
    return false;
  }
  auto digits = symbols.substr(1);
  return std::all_of(digits.begin(), digits.end(), IsOctalDigit);
}

bool IsSimpleEscapeSequence(std::string_view symbols) {
  static constexpr std::string_view kSimple = "'\"?\\abfnrtv";
  if (symbols.size() != 2 || symbols[0] != '\\') {
    return false;
  }
  return kSimple.find(symbols[1]) != std::string_view::npos;
}

bool HasNumericEscapeSequence(std::string_view symbols) {
  if (symbols.find('\\') == std::string_view::npos) {
    return false;
  }
  for (std::size_t i = 0; i + 1 < symbols.size(); i += 2) {
    if (symbols[i] == '\\' &&
        (symbols[i + 1] == 'x' || IsOctalDigit(symbols[i + 1]))) {
      return true;
    }
  }
  return false;
}

} // namespace matching
