#include "vercmp/Tokenizer.hpp"

namespace Vercmp {

bool isDelimiter(char c) {
    auto byte = static_cast<unsigned char>(c);
    if (byte >= 0x80) {
        return false;
    }
    bool isDigit = (byte >= '0' && byte <= '9');
    bool isLetter = (byte >= 'a' && byte <= 'z') || (byte >= 'A' && byte <= 'Z');
    return !(isDigit || isLetter);
}

std::vector<std::string> tokenize(const std::string& version) {
    std::vector<std::string> tokens;
    size_t tokenStart = 0;
    bool inToken = false;
    for (size_t i = 0; i < version.size(); ++i) {
        if (isDelimiter(version[i])) {
            if (inToken) {
                tokens.emplace_back(version, tokenStart, i - tokenStart);
                inToken = false;
            }
        } else if (!inToken) {
            tokenStart = i;
            inToken = true;
        }
    }

    if (inToken) {
        tokens.emplace_back(version, tokenStart, version.size() - tokenStart);
    }

    return tokens;
}

}  // namespace Vercmp
