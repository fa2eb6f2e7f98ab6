#include "refs.hpp"

#include <cstddef>
#include <vector>

namespace models {

namespace {

const Token kEmptyToken{};
const models::Scope kEmptyScope{};
const models::Variable kEmptyVariable{};
const models::Function kEmptyFunction{};
const std::string kEmptyString;

template <typename T>
bool InRange(const std::vector<T> &arena, int index) {
  return index >= 0 && static_cast<std::size_t>(index) < arena.size();
}

} // namespace

TokenRef Model::Front() const {
  return TokenRef(this, tokens.empty() ? kNoIndex : 0);
}

// TokenRef

TokenRef::TokenRef(const Model *model, int index)
    : model_(model), index_(index) {}

bool TokenRef::Valid() const {
  return model_ && InRange(model_->tokens, index_);
}

const Token &TokenRef::Get() const {
  return Valid() ? model_->tokens[index_] : kEmptyToken;
}

const std::string &TokenRef::Str() const {
  return Valid() ? model_->tokens[index_].str : kEmptyString;
}

bool TokenRef::Is(std::string_view text) const {
  return Valid() && model_->tokens[index_].str == text;
}

TokenRef TokenRef::Next() const {
  if (!Valid()) {
    return {};
  }
  return TokenRef(model_, Get().next);
}

TokenRef TokenRef::Previous() const {
  if (!Valid()) {
    return {};
  }
  return TokenRef(model_, Get().previous);
}

TokenRef TokenRef::Link() const {
  if (!Valid()) {
    return {};
  }
  return TokenRef(model_, Get().link);
}

TokenRef TokenRef::Operand1() const {
  if (!Valid()) {
    return {};
  }
  return TokenRef(model_, Get().ast_operand1);
}

TokenRef TokenRef::Operand2() const {
  if (!Valid()) {
    return {};
  }
  return TokenRef(model_, Get().ast_operand2);
}

TokenRef TokenRef::Parent() const {
  if (!Valid()) {
    return {};
  }
  return TokenRef(model_, Get().ast_parent);
}

ScopeRef TokenRef::Scope() const {
  if (!Valid()) {
    return {};
  }
  return ScopeRef(model_, Get().scope);
}

ScopeRef TokenRef::TypeScope() const {
  if (!Valid()) {
    return {};
  }
  return ScopeRef(model_, Get().type_scope);
}

VariableRef TokenRef::Variable() const {
  if (!Valid()) {
    return {};
  }
  return VariableRef(model_, Get().variable);
}

FunctionRef TokenRef::Function() const {
  if (!Valid()) {
    return {};
  }
  return FunctionRef(model_, Get().function);
}

const ValueType *TokenRef::Type() const {
  if (!Valid() || !Get().value_type.has_value()) {
    return nullptr;
  }
  return &Get().value_type.value();
}

bool TokenRef::operator==(const TokenRef &other) const {
  if (!Valid() || !other.Valid()) {
    return Valid() == other.Valid();
  }
  return model_ == other.model_ && index_ == other.index_;
}

// ScopeRef

ScopeRef::ScopeRef(const Model *model, int index)
    : model_(model), index_(index) {}

bool ScopeRef::Valid() const {
  return model_ && InRange(model_->scopes, index_);
}

const models::Scope &ScopeRef::Get() const {
  return Valid() ? model_->scopes[index_] : kEmptyScope;
}

bool ScopeRef::IsType(ScopeType type) const {
  return Valid() && Get().type == type;
}

ScopeRef ScopeRef::NestedIn() const {
  if (!Valid()) {
    return {};
  }
  return ScopeRef(model_, Get().nested_in);
}

TokenRef ScopeRef::BodyStart() const {
  if (!Valid()) {
    return {};
  }
  return TokenRef(model_, Get().body_start);
}

TokenRef ScopeRef::BodyEnd() const {
  if (!Valid()) {
    return {};
  }
  return TokenRef(model_, Get().body_end);
}

FunctionRef ScopeRef::Function() const {
  if (!Valid()) {
    return {};
  }
  return FunctionRef(model_, Get().function);
}

bool ScopeRef::operator==(const ScopeRef &other) const {
  if (!Valid() || !other.Valid()) {
    return Valid() == other.Valid();
  }
  return model_ == other.model_ && index_ == other.index_;
}

// VariableRef

VariableRef::VariableRef(const Model *model, int index)
    : model_(model), index_(index) {}

bool VariableRef::Valid() const {
  return model_ && InRange(model_->variables, index_);
}

const models::Variable &VariableRef::Get() const {
  return Valid() ? model_->variables[index_] : kEmptyVariable;
}

TokenRef VariableRef::NameToken() const {
  if (!Valid()) {
    return {};
  }
  return TokenRef(model_, Get().name_token);
}

TokenRef VariableRef::TypeStartToken() const {
  if (!Valid()) {
    return {};
  }
  return TokenRef(model_, Get().type_start_token);
}

TokenRef VariableRef::TypeEndToken() const {
  if (!Valid()) {
    return {};
  }
  return TokenRef(model_, Get().type_end_token);
}

ScopeRef VariableRef::Scope() const {
  if (!Valid()) {
    return {};
  }
  return ScopeRef(model_, Get().scope);
}

bool VariableRef::operator==(const VariableRef &other) const {
  if (!Valid() || !other.Valid()) {
    return Valid() == other.Valid();
  }
  return model_ == other.model_ && index_ == other.index_;
}

// FunctionRef

FunctionRef::FunctionRef(const Model *model, int index)
    : model_(model), index_(index) {}

bool FunctionRef::Valid() const {
  return model_ && InRange(model_->functions, index_);
}

const models::Function &FunctionRef::Get() const {
  return Valid() ? model_->functions[index_] : kEmptyFunction;
}

TokenRef FunctionRef::TokenDef() const {
  if (!Valid()) {
    return {};
  }
  return TokenRef(model_, Get().token_def);
}

VariableRef FunctionRef::Argument(int position) const {
  if (!Valid()) {
    return {};
  }
  auto it = Get().arguments.find(position);
  if (it == Get().arguments.end()) {
    return {};
  }
  return VariableRef(model_, it->second);
}

bool FunctionRef::operator==(const FunctionRef &other) const {
  if (!Valid() || !other.Valid()) {
    return Valid() == other.Valid();
  }
  return model_ == other.model_ && index_ == other.index_;
}

} // namespace models
