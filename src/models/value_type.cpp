#include "value_type.hpp"

#include <unordered_map>

namespace models {

const std::unordered_map<std::string_view, TypeKind> kTypeKinds{
    {"void", TypeKind::kVoid},
    {"bool", TypeKind::kBool},
    {"char", TypeKind::kChar},
    {"short", TypeKind::kShort},
    {"wchar_t", TypeKind::kWChar},
    {"int", TypeKind::kInt},
    {"long", TypeKind::kLong},
    {"long long", TypeKind::kLongLong},
    {"unknown int", TypeKind::kUnknownInt},
    {"float", TypeKind::kFloat},
    {"double", TypeKind::kDouble},
    {"long double", TypeKind::kLongDouble},
    {"record", TypeKind::kRecord},
    {"container", TypeKind::kContainer},
    {"iterator", TypeKind::kIterator},
    {"nonstd", TypeKind::kNonStd},
};

bool ValueType::IsIntegral() const {
  switch (type) {
  case TypeKind::kBool:
  case TypeKind::kChar:
  case TypeKind::kShort:
  case TypeKind::kInt:
  case TypeKind::kLong:
  case TypeKind::kLongLong:
    return true;
  default:
    return false;
  }
}

bool ValueType::IsFloat() const {
  return type == TypeKind::kFloat || type == TypeKind::kDouble ||
         type == TypeKind::kLongDouble;
}

TypeKind ParseTypeKind(std::string_view name) {
  auto it = kTypeKinds.find(name);
  if (it == kTypeKinds.end()) {
    return TypeKind::kUnknown;
  }
  return it->second;
}

std::string_view TypeKindName(TypeKind kind) {
  for (const auto &[name, value] : kTypeKinds) {
    if (value == kind) {
      return name;
    }
  }
  return "unknown";
}

std::string_view SignName(Sign sign) {
  return sign == Sign::kSigned ? "signed" : "unsigned";
}

} // namespace models
