#ifndef STARPLAN_ERRORS_H
#define STARPLAN_ERRORS_H

#include <stdexcept>
#include <string>

namespace starplan {

// Invalid planner parameters, raised before any planner state exists.
class ConfigError : public std::invalid_argument {
public:
    explicit ConfigError(const std::string& what) : std::invalid_argument(what) {}
};

// Internal consistency failure (e.g. querying a tree with no root).
class InvariantViolation : public std::logic_error {
public:
    explicit InvariantViolation(const std::string& what) : std::logic_error(what) {}
};

} // namespace starplan

#endif // STARPLAN_ERRORS_H
