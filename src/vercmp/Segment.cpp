#include "vercmp/Segment.hpp"

#include <algorithm>

namespace {

bool isAsciiDigit(char c) {
    return c >= '0' && c <= '9';
}

unsigned char foldCase(char c) {
    auto byte = static_cast<unsigned char>(c);
    if (byte >= 'A' && byte <= 'Z') {
        return static_cast<unsigned char>(byte + ('a' - 'A'));
    }
    return byte;
}

int sign(int value) {
    return (value > 0) - (value < 0);
}

}  // namespace

namespace Vercmp {

// static
Segment Segment::classify(const std::string& token) {
    for (auto c : token) {
        if (!isAsciiDigit(c)) {
            return Segment(kAlpha, token, std::string());
        }
    }

    auto firstSignificant = token.find_first_not_of('0');
    if (firstSignificant == std::string::npos) {
        return Segment(kNumeric, token, "0");
    }
    return Segment(kNumeric, token, token.substr(firstSignificant));
}

Segment::Segment(Type type, const std::string& text, const std::string& magnitude) :
    m_type(type),
    m_text(text),
    m_magnitude(magnitude) {
}

int Segment::compare(const Segment& segment) const {
    if (m_type == kNumeric && segment.type() == kNumeric) {
        return compareMagnitude(segment);
    }
    return compareText(segment);
}

int Segment::compareMagnitude(const Segment& segment) const {
    // With leading zeros stripped a longer digit string is always the larger number.
    if (m_magnitude.size() != segment.magnitude().size()) {
        return m_magnitude.size() < segment.magnitude().size() ? -1 : 1;
    }
    return sign(m_magnitude.compare(segment.magnitude()));
}

int Segment::compareText(const Segment& segment) const {
    const std::string& other = segment.text();
    size_t length = std::min(m_text.size(), other.size());
    for (size_t i = 0; i < length; ++i) {
        unsigned char left = foldCase(m_text[i]);
        unsigned char right = foldCase(other[i]);
        if (left != right) {
            return left < right ? -1 : 1;
        }
    }

    if (m_text.size() == other.size()) {
        return 0;
    }
    return m_text.size() < other.size() ? -1 : 1;
}

}  // namespace Vercmp
