#ifndef SRC_VERCMP_INCLUDE_VERCMP_SEGMENT_HPP_
#define SRC_VERCMP_INCLUDE_VERCMP_SEGMENT_HPP_

#include <string>

namespace Vercmp {

/*! One classified token of a version string.
 *
 * A Segment is either numeric, when every character of the token is an ASCII digit, or alphabetic otherwise. Numeric
 * Segments compare to each other by integer magnitude, of any length. Every other pairing, including numeric against
 * alphabetic, falls back to a case-insensitive comparison of the original token text.
 */
class Segment {
public:
    /*! Describes the class of the token.
     */
    enum Type {
        kNumeric = 1,
        kAlpha = 2
    };

    /*! Classifies a token.
     *
     * \param token A non-empty token, as produced by tokenize().
     * \return A Segment of type kNumeric if token is made up only of ASCII digits, kAlpha otherwise.
     */
    static Segment classify(const std::string& token);

    Segment() = delete;

    /*! Compares this Segment to another.
     *
     * \param segment The Segment to compare against.
     * \return -1 if this Segment is lower than segment, 0 if they are equal, 1 if this Segment is higher.
     */
    int compare(const Segment& segment) const;

    /*! The class of this Segment.
     *
     * \return kNumeric or kAlpha.
     */
    Type type() const { return m_type; }

    /*! The token exactly as it appeared in the version string.
     *
     * \return The original token text, with original casing and any leading zeros.
     */
    const std::string& text() const { return m_text; }

    /*! Integer magnitude of a numeric Segment, as decimal digits with leading zeros removed.
     *
     * \return The magnitude digits, "0" for a token of only zeros. Empty for alphabetic Segments.
     */
    const std::string& magnitude() const { return m_magnitude; }

private:
    Segment(Type type, const std::string& text, const std::string& magnitude);

    int compareMagnitude(const Segment& segment) const;
    int compareText(const Segment& segment) const;

    Type m_type;
    std::string m_text;
    std::string m_magnitude;
};

}  // namespace Vercmp

#endif  // SRC_VERCMP_INCLUDE_VERCMP_SEGMENT_HPP_
