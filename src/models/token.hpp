#pragma once

#include "models_fwd.hpp"
#include "value_type.hpp"

#include <optional>
#include <string>
#include <vector>

namespace models {

/**
 * @struct Value
 * A statically known possible value of an expression.
 */
struct Value {
    std::optional<long long> int_value; /**< Integer value, unset for non-integer facts. */
    bool known = false; /**< True when this is the only possible value. */
};

/**
 * @struct Token
 * Structure representing a token of the analyzed program.
 *
 * All relations are indices into the arenas of the owning Model.
 * Raw tokens only carry text, location and sequence links.
 */
struct Token {
    std::string str; /**< Token text as written. */
    std::string file; /**< Source file name. */
    int line = 0; /**< Line number. */
    int column = 0; /**< Column number. */

    bool is_name = false;
    bool is_number = false;
    bool is_int = false;
    bool is_float = false;
    bool is_string = false;
    bool is_char = false;
    bool is_op = false;
    bool is_arithmetical_op = false;
    bool is_assignment_op = false;
    bool is_comparison_op = false;
    bool is_logical_op = false;

    int next = kNoIndex; /**< Following token in the stream. */
    int previous = kNoIndex; /**< Preceding token in the stream. */
    int link = kNoIndex; /**< Matching bracket. */
    int ast_operand1 = kNoIndex; /**< First AST operand. */
    int ast_operand2 = kNoIndex; /**< Second AST operand. */
    int ast_parent = kNoIndex; /**< AST parent. */

    int scope = kNoIndex; /**< Enclosing scope. */
    int variable = kNoIndex; /**< Referenced variable. */
    int function = kNoIndex; /**< Referenced function. */
    int type_scope = kNoIndex; /**< Scope of a type name token. */
    int var_id = 0; /**< Variable id, 0 when the token is not a variable. */

    std::optional<ValueType> value_type; /**< Computed expression type. */
    std::vector<Value> values; /**< Possible values. */
};

} // namespace models
