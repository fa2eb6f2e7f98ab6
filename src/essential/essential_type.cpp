#include "essential_type.hpp"

#include <algorithm>
#include <string_view>
#include <unordered_map>
#include <unordered_set>

namespace essential {

namespace {

const std::unordered_set<std::string_view> kBoolResultOperators{
    "<", "<=", "==", "!=", ">=", ">", "&&", "||", "!"};

const std::unordered_set<std::string_view> kRankOperators{
    "+", "-", "*", "/", "%", "&", "|", "^", ">>", "<<", "?", ":"};

const std::unordered_map<std::string_view, Rank> kDeclaredRanks{
    {"char", Rank::kChar},   {"short", Rank::kShort}, {"int", Rank::kInt},
    {"long", Rank::kLong},   {"float", Rank::kFloat}, {"double", Rank::kDouble},
};

MaybeCategory FromSign(const models::ValueType &type) {
  if (!type.sign.has_value()) {
    return std::nullopt;
  }
  return EssentialCategory{*type.sign == models::Sign::kSigned
                               ? Category::kSigned
                               : Category::kUnsigned,
                           ""};
}

bool IsPointer(models::TokenRef expr) {
  const auto *type = expr.Type();
  return type != nullptr && type->pointer > 0;
}

} // namespace

bool EssentialCategory::IsAnonymousEnum() const {
  return kind == Category::kEnum &&
         enum_name.find("Anonymous") != std::string::npos;
}

bool EssentialCategory::IsSignedOrUnsigned() const {
  return kind == Category::kSigned || kind == Category::kUnsigned;
}

std::string EssentialCategory::Name() const {
  switch (kind) {
  case Category::kBool:
    return "bool";
  case Category::kSigned:
    return "signed";
  case Category::kUnsigned:
    return "unsigned";
  case Category::kFloat:
    return "float";
  case Category::kEnum:
    return "enum<" + enum_name + ">";
  }
  return "";
}

bool EssentialCategory::operator==(const EssentialCategory &other) const {
  return kind == other.kind && enum_name == other.enum_name;
}

MaybeCategory EssentialCategoryOf(models::TokenRef expr) {
  if (!expr) {
    return std::nullopt;
  }
  if (expr.Is(",")) {
    return EssentialCategoryOf(expr.Operand2());
  }
  if (kBoolResultOperators.count(expr.Str()) != 0) {
    return EssentialCategory{Category::kBool, ""};
  }
  if (expr.Is("<<") || expr.Is(">>")) {
    return EssentialCategoryOf(expr.Operand1());
  }

  const auto *type = expr.Type();
  if (expr.Str().size() == 1 &&
      std::string_view("+-*/%&|^").find(expr.Str()[0]) != std::string_view::npos) {
    auto e1 = EssentialCategoryOf(expr.Operand1());
    auto e2 = EssentialCategoryOf(expr.Operand2());
    if (e1 && e2 && *e1 == *e2) {
      return e1;
    }
    if (type != nullptr) {
      return FromSign(*type);
    }
  }

  if (type != nullptr && type->type_scope != models::kNoIndex) {
    models::ScopeRef scope(expr.Owner(), type->type_scope);
    return EssentialCategory{Category::kEnum, scope->class_name};
  }

  if (auto var = expr.Variable()) {
    auto end = var.TypeEndToken();
    for (auto tok = var.TypeStartToken(); tok; tok = tok.Next()) {
      if (const auto *declared = tok.Type()) {
        if (declared->type == models::TypeKind::kBool) {
          return EssentialCategory{Category::kBool, ""};
        }
        if (declared->IsFloat()) {
          return EssentialCategory{Category::kFloat, ""};
        }
        if (declared->sign.has_value()) {
          return FromSign(*declared);
        }
      }
      if (tok == end) {
        break;
      }
    }
  }

  if (type != nullptr) {
    return FromSign(*type);
  }
  return std::nullopt;
}

std::pair<MaybeCategory, MaybeCategory>
EssentialCategories(models::TokenRef operand1, models::TokenRef operand2) {
  if (!operand1 || !operand2) {
    return {};
  }
  if (operand1.Is("++") || operand1.Is("--") || operand2.Is("++") ||
      operand2.Is("--")) {
    return {};
  }
  if (IsPointer(operand1) || IsPointer(operand2)) {
    return {};
  }
  return {EssentialCategoryOf(operand1), EssentialCategoryOf(operand2)};
}

std::optional<Rank> EssentialRankOf(models::TokenRef expr) {
  if (!expr) {
    return std::nullopt;
  }
  if (auto var = expr.Variable()) {
    for (auto tok = var.TypeStartToken(); tok && tok->is_name; tok = tok.Next()) {
      if (tok.Is("long") && tok.Next().Is("long")) {
        return Rank::kLongLong;
      }
      auto it = kDeclaredRanks.find(tok.Str());
      if (it != kDeclaredRanks.end()) {
        return it->second;
      }
    }
    return std::nullopt;
  }
  if (expr.Operand1() && expr.Operand2() &&
      kRankOperators.count(expr.Str()) != 0) {
    if (IsPointer(expr.Operand1()) || IsPointer(expr.Operand2())) {
      return std::nullopt;
    }
    auto r1 = EssentialRankOf(expr.Operand1());
    auto r2 = EssentialRankOf(expr.Operand2());
    if (!r1 || !r2 || *r1 > Rank::kLongLong || *r2 > Rank::kLongLong) {
      return std::nullopt;
    }
    return std::max(*r1, *r2);
  }
  if (expr.Is("~")) {
    return EssentialRankOf(expr.Operand1());
  }
  return std::nullopt;
}

std::optional<Rank> IntegerRankOf(models::TypeKind kind) {
  switch (kind) {
  case models::TypeKind::kChar:
    return Rank::kChar;
  case models::TypeKind::kShort:
    return Rank::kShort;
  case models::TypeKind::kInt:
    return Rank::kInt;
  case models::TypeKind::kLong:
    return Rank::kLong;
  case models::TypeKind::kLongLong:
    return Rank::kLongLong;
  default:
    return std::nullopt;
  }
}

bool IsIntegerRank(Rank rank) {
  return rank >= Rank::kChar && rank <= Rank::kLongLong;
}

int BitsOfRank(Rank rank, const models::Platform &platform) {
  switch (rank) {
  case Rank::kChar:
    return platform.char_bit;
  case Rank::kShort:
    return platform.short_bit;
  case Rank::kInt:
    return platform.int_bit;
  case Rank::kLong:
    return platform.long_bit;
  case Rank::kLongLong:
    return platform.long_long_bit;
  default:
    return 0;
  }
}

int BitsOfEssentialType(models::TokenRef expr,
                        const models::Platform &platform) {
  auto rank = EssentialRankOf(expr);
  if (!rank) {
    return 0;
  }
  return BitsOfRank(*rank, platform);
}

bool IsEnumTyped(models::TokenRef expr) {
  const auto *type = expr.Type();
  if (type == nullptr) {
    return false;
  }
  return models::ScopeRef(expr.Owner(), type->type_scope)
      .IsType(models::ScopeType::kEnum);
}

} // namespace essential
