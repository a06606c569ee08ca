#ifndef SRC_VERCMP_INCLUDE_VERCMP_OPERATION_HPP_
#define SRC_VERCMP_INCLUDE_VERCMP_OPERATION_HPP_

#include <optional>
#include <string>

namespace Vercmp {

/*! Names one of the public version operations, so it can be chosen at runtime.
 */
enum Operation {
    kCompare = 1,
    kHigherVersion = 2,
    kIsStrictlyHigher = 3,
    kIsHigherOrSame = 4,
    kIsStrictlyLower = 5,
    kIsLowerOrSame = 6,
    kIsSame = 7
};

/*! Utility to convert a string into the equivalent Operation.
 *
 * \param name One of "compare", "higher", "strictly-higher", "higher-or-same", "strictly-lower", "lower-or-same" or
 *             "same", in any case.
 * \return The named Operation, or std::nullopt if name is not recognized.
 */
std::optional<Operation> parseOperation(const std::string& name);

/*! The name parseOperation() accepts for an Operation.
 *
 * \param operation The Operation to name.
 * \return A lowercase name, for example "strictly-higher".
 */
const char* operationName(Operation operation);

/*! \return True if the operation produces a boolean, false for kCompare and kHigherVersion.
 */
bool isPredicate(Operation operation);

/*! Evaluates an Operation on two versions and renders the result.
 *
 * \param operation The Operation to run.
 * \param left The first version.
 * \param right The second version.
 * \return "-1", "0" or "1" for kCompare, the chosen version for kHigherVersion, "true" or "false" for predicates.
 * \throws std::invalid_argument if either version is blank.
 */
std::string runOperation(Operation operation, const std::string& left, const std::string& right);

}  // namespace Vercmp

#endif  // SRC_VERCMP_INCLUDE_VERCMP_OPERATION_HPP_
