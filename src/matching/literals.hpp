#pragma once

#include <string_view>

namespace matching {

/**
 * @brief Checks for a hexadecimal escape sequence: \x followed by at
 * least one hex digit and nothing else.
 * @param symbols Characters of the candidate sequence.
 * @return True when symbols form a hex escape.
 */
bool IsHexEscapeSequence(std::string_view symbols);

/**
 * @brief Checks for an octal escape sequence: a backslash followed by one
 * to three octal digits.
 * @param symbols Characters of the candidate sequence.
 * @return True when symbols form an octal escape.
 */
bool IsOctalEscapeSequence(std::string_view symbols);

/**
 * @brief Checks for one of the simple escapes \' \" \? \\ \a \b \f \n \r
 * \t \v.
 * @param symbols Characters of the candidate sequence.
 * @return True when symbols form a simple escape.
 */
bool IsSimpleEscapeSequence(std::string_view symbols);

/**
 * @brief Scans a literal body two characters at a time for a backslash
 * followed by 'x' or an octal digit.
 * @param symbols Literal body without delimiters.
 * @return True when a numeric escape starts on an even offset.
 */
bool HasNumericEscapeSequence(std::string_view symbols);

} // namespace matching
