#pragma once

#include <exception>
#include <optional>
#include <string>
#include <string_view>

/**
 * @brief Namespace containing the driver's error reporting functions.
 *
 * The `loger` namespace prints fatal and non-fatal errors and keeps count of
 * the non-fatal ones so the driver can pick its exit status. The library
 * itself never calls into it.
 */
namespace rollkit::loger {

/**
 * @brief Logs a fatal error with an optional additional message and exits.
 * @param s1 The main error message.
 * @param s2 Optional additional message.
 */
void fatal(const std::string_view &s1,
           const std::optional<std::string> &s2 = std::nullopt);

/**
 * @brief Logs a non-fatal error with an optional additional message.
 * @param s1 The main error message.
 * @param s2 Optional additional message.
 */
void non_fatal(const std::string_view &s1,
               const std::optional<std::string> &s2 = std::nullopt);

/**
 * @brief Returns the number of non-fatal errors logged so far.
 */
int GetErrorCount();

/**
 * @brief Resets the error counter.
 */
void ResetErrorCount();

/**
 * @brief Converts a caught exception to the text shown to the user.
 * @param error The exception.
 * @return The message, prefixed with the error family.
 */
std::string explainToString(const std::exception &error);

} // namespace rollkit::loger
