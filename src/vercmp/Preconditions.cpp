#include "vercmp/Preconditions.hpp"

#include <stdexcept>

namespace {

bool isAsciiWhitespace(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\v' || c == '\f' || c == '\r';
}

}  // namespace

namespace Vercmp {

bool isBlank(const char* value) {
    if (value == nullptr) {
        return true;
    }
    for (const char* c = value; *c != '\0'; ++c) {
        if (!isAsciiWhitespace(*c)) {
            return false;
        }
    }
    return true;
}

bool isBlank(const std::string& value) {
    for (auto c : value) {
        if (!isAsciiWhitespace(c)) {
            return false;
        }
    }
    return true;
}

void checkArgumentNotBlank(const char* value, const std::string& errorMessage) {
    if (isBlank(value)) {
        throw std::invalid_argument(errorMessage);
    }
}

void checkArgumentNotBlank(const std::string& value, const std::string& errorMessage) {
    if (isBlank(value)) {
        throw std::invalid_argument(errorMessage);
    }
}

}  // namespace Vercmp
