#pragma once

#include "../models/refs.hpp"

#include <string_view>

namespace matching {

/**
 * @brief Matches a token run against space separated literal texts.
 * @param token First token of the run, may be empty.
 * @param pattern Literal token texts, e.g. "switch (".
 * @return True when every pattern element matches in order.
 */
bool SimpleMatch(models::TokenRef token, std::string_view pattern);

/**
 * @brief Finds the opening brace of a raw closing brace.
 * @param token A raw "}" token.
 * @return The matching "{", empty for other tokens or unbalanced input.
 */
models::TokenRef RawLink(models::TokenRef token);

/**
 * @brief Resolves a bracket by counting nesting depth in the flat stream.
 *
 * Opening brackets search forward, closing brackets search backward.
 *
 * @param token A bracket token.
 * @return The matching bracket, empty when not found.
 */
models::TokenRef FindRawLink(models::TokenRef token);

/**
 * @brief Resolves a bracket through the model link, falling back to the
 * depth-counting search for undecorated streams.
 * @param token A bracket token.
 * @return The matching bracket, empty when not found.
 */
models::TokenRef Link(models::TokenRef token);

/**
 * @brief Checks that no parenthesis lies between two tokens.
 * @param from First token.
 * @param to Last token, must follow from in the stream.
 * @return True when to is reached without passing "(" or ")".
 */
bool HasNoParentheses(models::TokenRef from, models::TokenRef to);

} // namespace matching
