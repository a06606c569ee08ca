#ifndef SRC_VERCMP_INCLUDE_VERCMP_TOKENIZER_HPP_
#define SRC_VERCMP_INCLUDE_VERCMP_TOKENIZER_HPP_

#include <string>
#include <vector>

namespace Vercmp {

/*! Tests if a character separates version tokens.
 *
 * Any ASCII character that is not a letter or a digit is a delimiter. Bytes outside of the ASCII range are never
 * delimiters, so UTF-8 sequences stay inside their tokens.
 *
 * \param c The character to test.
 * \return True if c is a delimiter.
 */
bool isDelimiter(char c);

/*! Splits a version string into its tokens.
 *
 * A run of one or more delimiters is a single boundary, and leading or trailing delimiters are ignored, so no returned
 * token is ever empty. Tokens keep their original order and casing.
 *
 * \param version The version string, for example "1.1.1-SNAPSHOT".
 * \return The tokens of version, for example { "1", "1", "1", "SNAPSHOT" }. Empty if version has no characters other
 *         than delimiters.
 */
std::vector<std::string> tokenize(const std::string& version);

}  // namespace Vercmp

#endif  // SRC_VERCMP_INCLUDE_VERCMP_TOKENIZER_HPP_
