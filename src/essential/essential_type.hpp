#pragma once

#include "../models/program.hpp"
#include "../models/refs.hpp"

#include <optional>
#include <string>
#include <utility>

namespace essential {

enum class Category { kBool, kSigned, kUnsigned, kFloat, kEnum };

/**
 * @struct EssentialCategory
 * Essential type category of an expression. Enum categories carry the
 * name of the enum scope, so two different enums compare unequal.
 */
struct EssentialCategory {
    Category kind = Category::kSigned;
    std::string enum_name; /**< Scope name of an enum category, else empty. */

    /**
     * @brief Checks for the category of an unnamed enum.
     * @return True when the enum scope name is generated ("Anonymous...").
     */
    bool IsAnonymousEnum() const;

    /**
     * @brief Checks for the signed or unsigned category.
     */
    bool IsSignedOrUnsigned() const;

    /**
     * @brief Spelling used in diagnostics: "bool", "signed", "unsigned",
     * "float" or "enum<Name>".
     */
    std::string Name() const;

    bool operator==(const EssentialCategory &other) const;
    bool operator!=(const EssentialCategory &other) const {
      return !(*this == other);
    }
};

using MaybeCategory = std::optional<EssentialCategory>;

/**
 * @brief Classifies an expression into its essential type category.
 *
 * Comma yields the right operand. Comparison and logical operators yield
 * bool. Shifts take the category of the left operand only. Single
 * character arithmetic and bitwise operators yield the common operand
 * category, or the signedness of the expression when the operands
 * differ. Enum typed expressions yield enum<Name>. Variables are
 * classified from their declared type tokens.
 *
 * @param expr AST node, may be empty.
 * @return The category, std::nullopt when nothing is known.
 */
MaybeCategory EssentialCategoryOf(models::TokenRef expr);

/**
 * @brief Classifies both operands of a binary expression.
 *
 * Abstains (both std::nullopt) when an operand is missing, is an
 * increment or decrement, or has pointer type.
 *
 * @param operand1 Left operand.
 * @param operand2 Right operand.
 * @return Categories of both operands.
 */
std::pair<MaybeCategory, MaybeCategory>
EssentialCategories(models::TokenRef operand1, models::TokenRef operand2);

/* standard ranks in increasing order, floating ranks last */
enum class Rank { kBool, kChar, kShort, kInt, kLong, kLongLong, kFloat, kDouble };

/**
 * @brief Computes the essential rank of an expression.
 *
 * A variable yields the first of char, short, int, long, float, double in
 * its declared type. Binary arithmetic, bitwise, shift and conditional
 * operators yield the higher rank of both operands when both are integer
 * ranks and neither operand is a pointer. "~" yields the rank of its
 * operand.
 *
 * @param expr AST node, may be empty.
 * @return The rank, std::nullopt when unknown.
 */
std::optional<Rank> EssentialRankOf(models::TokenRef expr);

/**
 * @brief Maps an integer base type from char to long long to its rank.
 * @param kind The base type.
 * @return The rank, std::nullopt for bool and non-integer types.
 */
std::optional<Rank> IntegerRankOf(models::TypeKind kind);

/**
 * @brief Checks for char, short, int, long and long long.
 */
bool IsIntegerRank(Rank rank);

/**
 * @brief Returns the platform width of an integer rank.
 * @param rank The rank.
 * @param platform Target bit widths.
 * @return The width in bits, 0 for bool and floating ranks.
 */
int BitsOfRank(Rank rank, const models::Platform &platform);

/**
 * @brief Returns the platform width of the essential rank of an
 * expression.
 * @param expr AST node, may be empty.
 * @param platform Target bit widths.
 * @return The width in bits, 0 when the rank or its width is unknown.
 */
int BitsOfEssentialType(models::TokenRef expr, const models::Platform &platform);

/**
 * @brief Checks whether the computed type of an expression is an enum.
 * @param expr AST node, may be empty.
 * @return True when the declared-type scope is an enum scope.
 */
bool IsEnumTyped(models::TokenRef expr);

} // namespace essential
