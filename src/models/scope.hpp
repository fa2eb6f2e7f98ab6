#pragma once

#include "models_fwd.hpp"

#include <string>
#include <string_view>

namespace models {

enum class ScopeType {
  kGlobal,
  kFunction,
  kClass,
  kStruct,
  kUnion,
  kNamespace,
  kEnum,
  kIf,
  kElse,
  kFor,
  kWhile,
  kDo,
  kSwitch,
  kUnconditional,
  kTry,
  kCatch,
  kLambda
};

/**
 * @struct Scope
 * Structure representing a scope of the analyzed program.
 */
struct Scope {
    ScopeType type = ScopeType::kGlobal; /**< Kind of scope. */
    std::string class_name; /**< Name of a struct/enum/function scope. */
    int nested_in = kNoIndex; /**< Enclosing scope, unset for the global scope. */
    int body_start = kNoIndex; /**< Opening brace. */
    int body_end = kNoIndex; /**< Closing brace. */
    int function = kNoIndex; /**< Owning function of a function scope. */

    /**
     * @brief Checks whether statements of this scope are executed.
     * @return True for function bodies and control-flow scopes.
     */
    bool IsExecutable() const;
};

/**
 * @brief Parses a scope kind name ("Function", "Switch", ...).
 * @param name The kind name as written by the analyzer.
 * @return The parsed kind, kGlobal for unrecognized names.
 */
ScopeType ParseScopeType(std::string_view name);

} // namespace models
