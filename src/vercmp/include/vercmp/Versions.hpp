#ifndef SRC_VERCMP_INCLUDE_VERCMP_VERSIONS_HPP_
#define SRC_VERCMP_INCLUDE_VERCMP_VERSIONS_HPP_

#include <string>

namespace Vercmp {

/*! Three-way comparison of two free-form version strings.
 *
 * Both versions are split into tokens on runs of non-alphanumeric ASCII characters, then compared token by token
 * from the left. Two numeric tokens compare by integer magnitude, so "10" is higher than "2" and "042" equals "42".
 * Any other pair of tokens compares as case-insensitive text. The first unequal pair decides the result.
 *
 * If every shared token is equal, the version with more tokens is the higher one, whatever its extra tokens hold.
 * "1.0" is higher than "1" and "1.0.0.0" is higher than "1.0.0".
 *
 * \param left The first version, for example "1.2.3".
 * \param right The second version, for example "1.2.4".
 * \return -1 if left is lower than right, 0 if the versions are equal, 1 if left is higher than right.
 * \throws std::invalid_argument if either version is blank or has no characters other than delimiters. The message
 *         contains "version cannot be blank".
 */
int compare(const std::string& left, const std::string& right);

/*! Three-way comparison of two version strings, either of which may be nullptr.
 *
 * \sa compare(const std::string&, const std::string&)
 * \throws std::invalid_argument if either version is nullptr or blank.
 */
int compare(const char* left, const char* right);

/*! Given two versions, return the higher one.
 *
 * \param left The first version to compare.
 * \param right The second version to compare.
 * \return left if it is higher than or the same as right, otherwise right.
 */
std::string higherVersion(const std::string& left, const std::string& right);
std::string higherVersion(const char* left, const char* right);

/*! Version comparison for strictly higher than.
 *
 * \param left The first version to compare.
 * \param right The second version to compare.
 * \return True if left is strictly higher than right.
 * \throws std::invalid_argument if either version is blank.
 */
bool isStrictlyHigherVersion(const std::string& left, const std::string& right);
bool isStrictlyHigherVersion(const char* left, const char* right);

/*! Version comparison for higher than or equality.
 *
 * \param left The first version to compare.
 * \param right The second version to compare.
 * \return True if left is higher than or the same as right.
 * \throws std::invalid_argument if either version is blank.
 */
bool isHigherOrSameVersion(const std::string& left, const std::string& right);
bool isHigherOrSameVersion(const char* left, const char* right);

/*! Version comparison for strictly lower than.
 *
 * \param left The first version to compare.
 * \param right The second version to compare.
 * \return True if left is strictly lower than right.
 * \throws std::invalid_argument if either version is blank.
 */
bool isStrictlyLowerVersion(const std::string& left, const std::string& right);
bool isStrictlyLowerVersion(const char* left, const char* right);

/*! Version comparison for lower than or equality.
 *
 * \param left The first version to compare.
 * \param right The second version to compare.
 * \return True if left is lower than or the same as right.
 * \throws std::invalid_argument if either version is blank.
 */
bool isLowerOrSameVersion(const std::string& left, const std::string& right);
bool isLowerOrSameVersion(const char* left, const char* right);

/*! Version comparison for equality. Versions can be the same without being identical strings, for example
 * "1.07-FINAL" and "1.7.final".
 *
 * \param left The first version to compare.
 * \param right The second version to compare.
 * \return True if left and right compare as the same version.
 * \throws std::invalid_argument if either version is blank.
 */
bool isSameVersion(const std::string& left, const std::string& right);
bool isSameVersion(const char* left, const char* right);

}  // namespace Vercmp

#endif  // SRC_VERCMP_INCLUDE_VERCMP_VERSIONS_HPP_
