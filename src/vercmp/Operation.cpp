#include "vercmp/Operation.hpp"

#include "vercmp/Versions.hpp"

#include "fmt/core.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <stdexcept>
#include <utility>

namespace {

const std::array<std::pair<Vercmp::Operation, const char*>, 7> kOperationNames = {{
    { Vercmp::kCompare, "compare" },
    { Vercmp::kHigherVersion, "higher" },
    { Vercmp::kIsStrictlyHigher, "strictly-higher" },
    { Vercmp::kIsHigherOrSame, "higher-or-same" },
    { Vercmp::kIsStrictlyLower, "strictly-lower" },
    { Vercmp::kIsLowerOrSame, "lower-or-same" },
    { Vercmp::kIsSame, "same" }
}};

const char* renderBool(bool value) {
    return value ? "true" : "false";
}

}  // namespace

namespace Vercmp {

std::optional<Operation> parseOperation(const std::string& name) {
    std::string lowerName(name);
    std::transform(lowerName.begin(), lowerName.end(), lowerName.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });

    for (const auto& entry : kOperationNames) {
        if (lowerName == entry.second) {
            return entry.first;
        }
    }
    return std::nullopt;
}

const char* operationName(Operation operation) {
    for (const auto& entry : kOperationNames) {
        if (entry.first == operation) {
            return entry.second;
        }
    }
    return "unknown";
}

bool isPredicate(Operation operation) {
    return operation != kCompare && operation != kHigherVersion;
}

std::string runOperation(Operation operation, const std::string& left, const std::string& right) {
    switch (operation) {
    case kCompare:
        return fmt::format("{}", compare(left, right));

    case kHigherVersion:
        return higherVersion(left, right);

    case kIsStrictlyHigher:
        return renderBool(isStrictlyHigherVersion(left, right));

    case kIsHigherOrSame:
        return renderBool(isHigherOrSameVersion(left, right));

    case kIsStrictlyLower:
        return renderBool(isStrictlyLowerVersion(left, right));

    case kIsLowerOrSame:
        return renderBool(isLowerOrSameVersion(left, right));

    case kIsSame:
        return renderBool(isSameVersion(left, right));
    }

    throw std::invalid_argument(fmt::format("unknown version operation {}", static_cast<int>(operation)));
}

}  // namespace Vercmp
