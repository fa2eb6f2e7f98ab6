#pragma once

#include "models_fwd.hpp"

#include <map>
#include <string>

namespace models {

/**
 * @struct Variable
 * Structure representing a declared variable or function parameter.
 */
struct Variable {
    int name_token = kNoIndex; /**< Declaration-site name token. */
    int type_start_token = kNoIndex; /**< First token of the declared type. */
    int type_end_token = kNoIndex; /**< Last token of the declared type. */
    int scope = kNoIndex; /**< Declaring scope. */

    bool is_argument = false;
    bool is_array = false;
    bool is_class = false;
    bool is_const = false;
    bool is_extern = false;
    bool is_global = false;
    bool is_local = false;
    bool is_pointer = false;
    bool is_reference = false;
    bool is_static = false;
    bool is_volatile = false;
    int constness = 0; /**< Bit mask, bit n set when indirection level n is const. */
};

/**
 * @struct Function
 * Structure representing a declared function.
 */
struct Function {
    std::string name; /**< Function name. */
    int token_def = kNoIndex; /**< Name token of the declaration. */
    int token = kNoIndex; /**< Name token of the definition. */
    bool is_static = false; /**< Internal linkage. */
    std::map<int, int> arguments; /**< 1-based parameter position to variable. */
};

/**
 * @struct Directive
 * Structure representing a preprocessor directive line.
 */
struct Directive {
    std::string str; /**< Directive text, e.g. "#define X 1". */
    std::string file; /**< Source file name. */
    int line = 0; /**< Line number. */
    int column = 0; /**< Column number. */
};

} // namespace models
