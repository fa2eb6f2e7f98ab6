#pragma once

#include "models_fwd.hpp"
#include "program.hpp"

#include <string>
#include <string_view>

namespace models {

/**
 * @class TokenRef
 * @brief Non-owning handle to a token inside a Model.
 *
 * Every navigation method resolves an index through the owning Model and
 * returns an empty handle when the relation is absent, so rules can walk
 * partial models without checking each step.
 */
class TokenRef {
public:
  TokenRef() = default;
  TokenRef(const Model *model, int index);

  explicit operator bool() const { return Valid(); }
  bool Valid() const;

  const Token &operator*() const { return Get(); }
  const Token *operator->() const { return &Get(); }
  const Token &Get() const;

  /**
   * @brief Returns the token text, empty for an empty handle.
   */
  const std::string &Str() const;

  /**
   * @brief Compares the token text.
   * @param text The expected text.
   * @return True when the handle is valid and the text matches.
   */
  bool Is(std::string_view text) const;

  TokenRef Next() const;
  TokenRef Previous() const;
  TokenRef Link() const;
  TokenRef Operand1() const;
  TokenRef Operand2() const;
  TokenRef Parent() const;

  ScopeRef Scope() const;
  ScopeRef TypeScope() const;
  VariableRef Variable() const;
  FunctionRef Function() const;

  /**
   * @brief Returns the computed type, nullptr when unknown.
   */
  const ValueType *Type() const;

  int Index() const { return index_; }
  const Model *Owner() const { return model_; }

  bool operator==(const TokenRef &other) const;
  bool operator!=(const TokenRef &other) const { return !(*this == other); }

private:
  const Model *model_ = nullptr;
  int index_ = kNoIndex;
};

/**
 * @class ScopeRef
 * @brief Non-owning handle to a scope inside a Model.
 */
class ScopeRef {
public:
  ScopeRef() = default;
  ScopeRef(const Model *model, int index);

  explicit operator bool() const { return Valid(); }
  bool Valid() const;

  const models::Scope &operator*() const { return Get(); }
  const models::Scope *operator->() const { return &Get(); }
  const models::Scope &Get() const;

  /**
   * @brief Checks the scope kind.
   * @return False for an empty handle.
   */
  bool IsType(ScopeType type) const;

  ScopeRef NestedIn() const;
  TokenRef BodyStart() const;
  TokenRef BodyEnd() const;
  FunctionRef Function() const;

  int Index() const { return index_; }

  bool operator==(const ScopeRef &other) const;
  bool operator!=(const ScopeRef &other) const { return !(*this == other); }

private:
  const Model *model_ = nullptr;
  int index_ = kNoIndex;
};

/**
 * @class VariableRef
 * @brief Non-owning handle to a variable inside a Model.
 */
class VariableRef {
public:
  VariableRef() = default;
  VariableRef(const Model *model, int index);

  explicit operator bool() const { return Valid(); }
  bool Valid() const;

  const models::Variable &operator*() const { return Get(); }
  const models::Variable *operator->() const { return &Get(); }
  const models::Variable &Get() const;

  TokenRef NameToken() const;
  TokenRef TypeStartToken() const;
  TokenRef TypeEndToken() const;
  ScopeRef Scope() const;

  int Index() const { return index_; }

  bool operator==(const VariableRef &other) const;
  bool operator!=(const VariableRef &other) const { return !(*this == other); }

private:
  const Model *model_ = nullptr;
  int index_ = kNoIndex;
};

/**
 * @class FunctionRef
 * @brief Non-owning handle to a function inside a Model.
 */
class FunctionRef {
public:
  FunctionRef() = default;
  FunctionRef(const Model *model, int index);

  explicit operator bool() const { return Valid(); }
  bool Valid() const;

  const models::Function &operator*() const { return Get(); }
  const models::Function *operator->() const { return &Get(); }
  const models::Function &Get() const;

  TokenRef TokenDef() const;

  /**
   * @brief Returns the parameter at a 1-based position.
   * @param position Parameter position.
   * @return The parameter variable, empty when there is none.
   */
  VariableRef Argument(int position) const;

  int Index() const { return index_; }

  bool operator==(const FunctionRef &other) const;
  bool operator!=(const FunctionRef &other) const { return !(*this == other); }

private:
  const Model *model_ = nullptr;
  int index_ = kNoIndex;
};

} // namespace models
