#pragma once

#include "../models/symbol.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace matching {

/**
 * @struct MacroDefinition
 * Parameters and replacement list of a function-like macro.
 */
struct MacroDefinition {
    std::vector<std::string> params; /**< Parameter names in order. */
    std::string expansion; /**< Replacement list as written. */

    /**
     * @brief Parses "#define NAME(a,b) expansion".
     * @param directive The directive line.
     * @return The definition, std::nullopt for object-like macros and
     * other directives.
     */
    static std::optional<MacroDefinition> Parse(std::string_view directive);
};

/**
 * @brief Finds "#include <header>" among directives.
 * @param directives Directives of one configuration.
 * @param header The header with its delimiters, e.g. "<stdio.h>".
 * @return The first matching directive, nullptr when absent.
 */
const models::Directive *FindInclude(const std::vector<models::Directive> &directives,
                                     std::string_view header);

/**
 * @brief Extracts the directive keyword: the text after '#' and optional
 * spaces up to the first space, '(' or '<'.
 * @param directive The directive line.
 * @return The keyword, e.g. "define"; the whole text when it does not
 * start with '#'.
 */
std::string DirectiveName(std::string_view directive);

} // namespace matching
