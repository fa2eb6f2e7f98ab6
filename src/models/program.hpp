#pragma once

#include "models_fwd.hpp"
#include "scope.hpp"
#include "symbol.hpp"
#include "token.hpp"

#include <optional>
#include <string>
#include <vector>

namespace models {

/**
 * @struct Model
 * Arenas for one token stream and the entities decorating it.
 *
 * The raw token stream of a translation unit is a Model with only
 * tokens; a configuration fills every arena.
 */
struct Model {
    std::vector<Token> tokens;
    std::vector<Scope> scopes;
    std::vector<Variable> variables;
    std::vector<Function> functions;
    std::vector<Directive> directives;

    /**
     * @brief Returns the first token of the stream.
     * @return The first token, empty when there are no tokens.
     */
    TokenRef Front() const;
};

/**
 * @struct Platform
 * Bit widths of the target integer types.
 */
struct Platform {
    int char_bit = 8;
    int short_bit = 16;
    int int_bit = 32;
    int long_bit = 64;
    int long_long_bit = 64;
    int pointer_bit = 64;
};

/**
 * @struct Standards
 * Language standard levels the unit was analyzed with.
 */
struct Standards {
    std::string c = "c11"; /**< C standard: c89, c99 or c11. */
};

/**
 * @struct Configuration
 * One preprocessor-resolved variant of a translation unit.
 */
struct Configuration {
    std::string name; /**< Set of defined macros, empty for the default. */
    Standards standards;
    Model model;
};

/**
 * @struct SuppressionDirective
 * A suppression extracted by the analyzer from an inline annotation.
 */
struct SuppressionDirective {
    std::string error_id; /**< e.g. "misra-c2012-15.1" or "misra_15_1". */
    std::optional<std::string> file_name;
    std::optional<int> line_number;
    std::optional<std::string> symbol_name;
};

/**
 * @struct TranslationUnit
 * Everything the analyzer produced for one source file.
 */
struct TranslationUnit {
    std::string path; /**< Source path of the unit. */
    Model raw; /**< Raw tokens including comments, configuration independent. */
    std::vector<Configuration> configurations;
    Platform platform;
    std::vector<SuppressionDirective> suppressions;
};

} // namespace models
