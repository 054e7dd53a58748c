/************************************************************
 * Errors.hpp
 *
 * Exception types shared by environments, agents and the
 * Python bridge.
 ************************************************************/

#ifndef MEMORY_RL_ERRORS_HPP
#define MEMORY_RL_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace memory_rl {

// Operation invoked in a state that does not allow it
// (e.g. react() after the episode has terminated).
class InvalidStateError : public std::logic_error {
public:
    explicit InvalidStateError(const std::string& what) : std::logic_error(what) {}
};

// Malformed construction parameter or unavailable action.
class InvalidArgumentError : public std::invalid_argument {
public:
    explicit InvalidArgumentError(const std::string& what) : std::invalid_argument(what) {}
};

// Failure inside an external collaborator (Python environment,
// knowledge lookup). Carries the collaborator's own message.
class ExternalLookupError : public std::runtime_error {
public:
    explicit ExternalLookupError(const std::string& what) : std::runtime_error(what) {}
};

} // namespace memory_rl

#endif // MEMORY_RL_ERRORS_HPP
