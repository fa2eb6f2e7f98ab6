#pragma once

#include "../models/refs.hpp"

#include <array>
#include <optional>
#include <string_view>
#include <vector>

namespace matching {

/**
 * @brief Checks whether a name is a C keyword.
 * @param name The identifier.
 * @return True for the 32 C90 keywords.
 */
bool IsKeyword(std::string_view name);

/**
 * @brief Detects a C-style cast: a "(" with one operand that is not "( )".
 * @param expr AST node, may be empty.
 * @return True for cast nodes.
 */
bool IsCast(models::TokenRef expr);

/**
 * @brief Detects a call: a "(" whose first operand is the preceding
 * non-keyword token.
 * @param expr AST node, may be empty.
 * @return True for call nodes.
 */
bool IsFunctionCall(models::TokenRef expr);

/**
 * @brief Checks for a non-static global variable.
 * @param var The variable.
 * @return True when the variable has external linkage.
 */
bool HasExternalLinkage(const models::VariableRef &var);

/**
 * @brief Counts "++", "--" and "=" nodes below an expression, without
 * descending into "," and ";".
 * @param expr AST node, may be empty.
 * @return Number of side effects.
 */
int CountSideEffects(models::TokenRef expr);

/**
 * @brief Checks for increments, decrements and assignments in an
 * expression. Designated and member initializers are not side effects.
 * @param expr AST node, may be empty.
 * @return True when a side effect was found.
 */
bool HasSideEffectsRecursive(models::TokenRef expr);

/**
 * @brief Splits a for statement into its three clauses.
 * @param for_token The "for" keyword.
 * @return Init, condition and step expressions (each may be empty), or
 * std::nullopt when the statement is not a well formed for.
 */
std::optional<std::array<models::TokenRef, 3>>
ForLoopExpressions(models::TokenRef for_token);

/**
 * @brief Collects the name operands of the comparisons and arithmetic
 * in a loop condition.
 * @param cond The condition expression.
 * @return Candidate loop counters.
 */
std::vector<models::TokenRef> FindCounterTokens(models::TokenRef cond);

/**
 * @brief Detects a while or do-while loop that modifies a floating point
 * counter used in its condition.
 * @param while_token The "while" keyword.
 * @return True when such a counter was found.
 */
bool IsFloatCounterInWhileLoop(models::TokenRef while_token);

/**
 * @brief Checks for an essentially boolean expression.
 * @param expr AST node, may be empty.
 * @return True for bool typed, one bit, comparison, logical and 0/1 nodes.
 */
bool IsBoolExpression(models::TokenRef expr);

/**
 * @brief Checks that an expression only involves numbers and sizeof.
 * @param expr AST node, may be empty.
 * @return True for constant expressions.
 */
bool IsConstantExpression(models::TokenRef expr);

/**
 * @brief Checks for an unsigned literal, possibly inside arithmetic.
 * @param expr AST node, may be empty.
 * @return True when an operand is a literal with a u/U suffix.
 */
bool IsUnsignedInt(models::TokenRef expr);

/**
 * @brief Finds the label a goto jumps to, searching forward up to the end
 * of the enclosing function.
 * @param goto_token The "goto" keyword.
 * @return The label name token, empty when the label precedes the goto or
 * does not exist.
 */
models::TokenRef FindGotoLabel(models::TokenRef goto_token);

/**
 * @brief Flattens the argument list of a call.
 * @param call The "(" of the call.
 * @return Argument expressions in order.
 */
std::vector<models::TokenRef> FunctionArguments(models::TokenRef call);

/**
 * @brief Checks whether a block ends in break, return or throw.
 * @param token The closing brace of the block.
 * @return True when the block cannot fall through.
 */
bool IsNoReturnScope(models::TokenRef token);

} // namespace matching
