#include "scope.hpp"

#include <unordered_map>

namespace models {

const std::unordered_map<std::string_view, ScopeType> kScopeTypes{
    {"Global", ScopeType::kGlobal},
    {"Function", ScopeType::kFunction},
    {"Class", ScopeType::kClass},
    {"Struct", ScopeType::kStruct},
    {"Union", ScopeType::kUnion},
    {"Namespace", ScopeType::kNamespace},
    {"Enum", ScopeType::kEnum},
    {"If", ScopeType::kIf},
    {"Else", ScopeType::kElse},
    {"For", ScopeType::kFor},
    {"While", ScopeType::kWhile},
    {"Do", ScopeType::kDo},
    {"Switch", ScopeType::kSwitch},
    {"Unconditional", ScopeType::kUnconditional},
    {"Try", ScopeType::kTry},
    {"Catch", ScopeType::kCatch},
    {"Lambda", ScopeType::kLambda},
};

bool Scope::IsExecutable() const {
  switch (type) {
  case ScopeType::kGlobal:
  case ScopeType::kClass:
  case ScopeType::kStruct:
  case ScopeType::kUnion:
  case ScopeType::kNamespace:
  case ScopeType::kEnum:
    return false;
  default:
    return true;
  }
}

ScopeType ParseScopeType(std::string_view name) {
  auto it = kScopeTypes.find(name);
  if (it == kScopeTypes.end()) {
    return ScopeType::kGlobal;
  }
  return it->second;
}

} // namespace models
