#pragma once

#include "models_fwd.hpp"

#include <string>

namespace models {

/**
 * @struct Location
 * Source position a violation is attributed to.
 */
struct Location {
    std::string file;
    int line = 0;
    int column = 0;

    /**
     * @brief Location of a token.
     * @param token The token, may be empty.
     * @return The token position, a zero location for an empty handle.
     */
    static Location Of(const TokenRef &token);

    /**
     * @brief Location of a directive.
     * @param directive The directive.
     * @return The directive position.
     */
    static Location Of(const Directive &directive);
};

} // namespace models
