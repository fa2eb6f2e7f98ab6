#include "location.hpp"

#include "refs.hpp"

namespace models {

Location Location::Of(const TokenRef &token) {
  if (!token) {
    return {};
  }
  return {token->file, token->line, token->column};
}

Location Location::Of(const Directive &directive) {
  return {directive.file, directive.line, directive.column};
}

} // namespace models
