#include "vercmp/Versions.hpp"

#include "vercmp/Preconditions.hpp"
#include "vercmp/Segment.hpp"
#include "vercmp/Tokenizer.hpp"

#include "fmt/core.h"
#include "spdlog/spdlog.h"

#include <algorithm>
#include <stdexcept>
#include <vector>

namespace {

template<typename T>
void checkVersionsNotBlank(const T& left, const T& right) {
    if (Vercmp::isBlank(left) && Vercmp::isBlank(right)) {
        throw std::invalid_argument("left and right version cannot be blank");
    }
    Vercmp::checkArgumentNotBlank(left, "left version cannot be blank");
    Vercmp::checkArgumentNotBlank(right, "right version cannot be blank");
}

std::vector<Vercmp::Segment> toSegments(const std::string& version, const char* side) {
    auto tokens = Vercmp::tokenize(version);
    if (tokens.empty()) {
        throw std::invalid_argument(fmt::format("{} version cannot be blank or consist only of delimiters, got \"{}\"",
            side, version));
    }

    std::vector<Vercmp::Segment> segments;
    segments.reserve(tokens.size());
    for (const auto& token : tokens) {
        segments.push_back(Vercmp::Segment::classify(token));
    }
    return segments;
}

}  // namespace

namespace Vercmp {

int compare(const std::string& left, const std::string& right) {
    checkVersionsNotBlank(left, right);

    auto leftSegments = toSegments(left, "left");
    auto rightSegments = toSegments(right, "right");

    // Most significant segment first, stopping at the first difference.
    size_t shared = std::min(leftSegments.size(), rightSegments.size());
    for (size_t i = 0; i < shared; ++i) {
        int result = leftSegments[i].compare(rightSegments[i]);
        if (result != 0) {
            spdlog::debug("version {} vs {} decided at segment {}, \"{}\" vs \"{}\": {}", left, right, i,
                leftSegments[i].text(), rightSegments[i].text(), result);
            return result;
        }
    }

    // All shared segments are equal, so any extra segment, even a zero, makes that version the higher one.
    if (leftSegments.size() == rightSegments.size()) {
        return 0;
    }
    int result = leftSegments.size() < rightSegments.size() ? -1 : 1;
    spdlog::debug("version {} vs {} decided by segment count {} vs {}: {}", left, right, leftSegments.size(),
        rightSegments.size(), result);
    return result;
}

int compare(const char* left, const char* right) {
    checkVersionsNotBlank(left, right);
    return compare(std::string(left), std::string(right));
}

std::string higherVersion(const std::string& left, const std::string& right) {
    return compare(left, right) >= 0 ? left : right;
}

std::string higherVersion(const char* left, const char* right) {
    return compare(left, right) >= 0 ? std::string(left) : std::string(right);
}

bool isStrictlyHigherVersion(const std::string& left, const std::string& right) {
    return compare(left, right) > 0;
}

bool isStrictlyHigherVersion(const char* left, const char* right) {
    return compare(left, right) > 0;
}

bool isHigherOrSameVersion(const std::string& left, const std::string& right) {
    return compare(left, right) >= 0;
}

bool isHigherOrSameVersion(const char* left, const char* right) {
    return compare(left, right) >= 0;
}

bool isStrictlyLowerVersion(const std::string& left, const std::string& right) {
    return compare(left, right) < 0;
}

bool isStrictlyLowerVersion(const char* left, const char* right) {
    return compare(left, right) < 0;
}

bool isLowerOrSameVersion(const std::string& left, const std::string& right) {
    return compare(left, right) <= 0;
}

bool isLowerOrSameVersion(const char* left, const char* right) {
    return compare(left, right) <= 0;
}

bool isSameVersion(const std::string& left, const std::string& right) {
    return compare(left, right) == 0;
}

bool isSameVersion(const char* left, const char* right) {
    return compare(left, right) == 0;
}

}  // namespace Vercmp
