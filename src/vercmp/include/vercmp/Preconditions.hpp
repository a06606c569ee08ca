#ifndef SRC_VERCMP_INCLUDE_VERCMP_PRECONDITIONS_HPP_
#define SRC_VERCMP_INCLUDE_VERCMP_PRECONDITIONS_HPP_

#include <string>

namespace Vercmp {

/*! Checks for a string with no printable content.
 *
 * \param value The string to check, may be nullptr.
 * \return True if value is nullptr, empty, or made up only of ASCII whitespace characters.
 */
bool isBlank(const char* value);

/*! Checks for a string with no printable content.
 *
 * \param value The string to check.
 * \return True if value is empty or made up only of ASCII whitespace characters.
 */
bool isBlank(const std::string& value);

/*! Rejects a blank argument.
 *
 * \param value The argument to check, may be nullptr.
 * \param errorMessage The message carried by the exception on failure.
 * \throws std::invalid_argument if isBlank(value) is true.
 */
void checkArgumentNotBlank(const char* value, const std::string& errorMessage);

/*! Rejects a blank argument.
 *
 * \param value The argument to check.
 * \param errorMessage The message carried by the exception on failure.
 * \throws std::invalid_argument if isBlank(value) is true.
 */
void checkArgumentNotBlank(const std::string& value, const std::string& errorMessage);

}  // namespace Vercmp

#endif  // SRC_VERCMP_INCLUDE_VERCMP_PRECONDITIONS_HPP_
