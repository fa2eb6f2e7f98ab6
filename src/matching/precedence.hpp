#pragma once

#include "../models/refs.hpp"

namespace matching {

/* precedence of a unary operator or an atom */
constexpr int kAtomPrecedence = 16;
constexpr int kMultiplicativePrecedence = 12;
constexpr int kAdditivePrecedence = 11;
constexpr int kConditionalPrecedence = 2;

/**
 * @brief Maps a binary operator token to its C precedence bucket.
 *
 * Multiplicative operators are 12, additive 11, shifts 10, relational 9,
 * equality 8, & 7, ^ 6, | 5, && 4, || 3, ?: 2, assignments 1 and comma 0.
 *
 * @param expr AST node, may be empty.
 * @return kAtomPrecedence for atoms and unary nodes, -1 for other binary
 * nodes.
 */
int Precedence(models::TokenRef expr);

} // namespace matching
