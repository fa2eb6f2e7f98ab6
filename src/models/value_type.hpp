#pragma once

#include "models_fwd.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace models {

/* base type reported by the analyzer for an expression */
enum class TypeKind {
  kUnknown = 0,
  kVoid,
  kBool,
  kChar,
  kShort,
  kWChar,
  kInt,
  kLong,
  kLongLong,
  kUnknownInt,
  kFloat,
  kDouble,
  kLongDouble,
  kRecord,
  kContainer,
  kIterator,
  kNonStd
};

enum class Sign { kSigned, kUnsigned };

/**
 * @struct ValueType
 * Structure representing the computed type of an expression.
 */
struct ValueType {
    TypeKind type = TypeKind::kUnknown; /**< Base type. */
    std::optional<Sign> sign; /**< Signedness, unset for non-integral types. */
    int bits = 0; /**< Bit-field width, 0 when not a bit-field. */
    int pointer = 0; /**< Pointer depth. */
    int constness = 0; /**< Bit mask, bit n set when indirection level n is const. */
    int type_scope = kNoIndex; /**< Scope declaring the enum/struct type. */

    /**
     * @brief Checks for bool, char, short, int, long and long long.
     * @return True for integral base types.
     */
    bool IsIntegral() const;

    /**
     * @brief Checks for float, double and long double.
     * @return True for floating base types.
     */
    bool IsFloat() const;
};

/**
 * @brief Parses a base type name ("long long", "record", ...).
 * @param name The type name as written by the analyzer.
 * @return The parsed kind, kUnknown for unrecognized names.
 */
TypeKind ParseTypeKind(std::string_view name);

/**
 * @brief Returns the analyzer spelling of a base type.
 * @param kind The base type.
 * @return The type name.
 */
std::string_view TypeKindName(TypeKind kind);

/**
 * @brief Returns "signed" or "unsigned".
 * @param sign The signedness.
 * @return The sign name.
 */
std::string_view SignName(Sign sign);

} // namespace models
