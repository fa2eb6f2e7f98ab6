#ifndef FATAL_MISRACHECK_H
#define FATAL_MISRACHECK_H

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

/**
 * @brief Namespace containing logging functions for errors and progress.
 *
 * The `loger` namespace writes every message to standard output with the
 * "misracheck:" prefix. Recoverable errors are counted so the embedding
 * application can decide on its exit status.
 */
namespace loger {

/**
 * @brief Logs a recoverable error with an optional additional message.
 * @param s1 The main error message.
 * @param s2 Optional additional message.
 */
void non_fatal(const std::string_view &s1,
               const std::optional<std::string> &s2 = std::nullopt);

/**
 * @brief Logs a progress message unless output is silenced.
 * @param message The message.
 */
void status(const std::string_view &message);

/**
 * @brief Logs a prefixed diagnostic message unless output is silenced.
 * @param message The message.
 */
void verbose(const std::string_view &message);

/**
 * @brief Number of errors logged through non_fatal since the last reset.
 */
std::size_t errorCount();

void resetErrorCount();

} // namespace loger

#endif
