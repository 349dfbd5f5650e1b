#ifndef CURVELOOP_COMMON_ERRORS_HPP
#define CURVELOOP_COMMON_ERRORS_HPP

#include "logging.hpp"
#include <stdexcept>
#include <string>

namespace curveloop {

// Caller handed in something the operation cannot work with
// (both or neither of count/step, an empty entity path, ...)
class InvalidArgument : public std::invalid_argument {
public:
    explicit InvalidArgument(const std::string& what)
        : std::invalid_argument(what) {}
};

// Adjacent entities of a path do not share an endpoint, or a vertex
// pair of a cycle is not an edge of the graph
class InconsistentTopology : public std::runtime_error {
public:
    explicit InconsistentTopology(const std::string& what)
        : std::runtime_error(what) {}
};

// A numerical postcondition did not hold (tolerance misconfiguration or a bug)
class NumericalError : public std::logic_error {
public:
    explicit NumericalError(const std::string& what)
        : std::logic_error(what) {}
};

// Strict builds (CURVELOOP_STRICT_CHECKS) throw on a failed check,
// other builds only log it.
inline void check_postcondition(bool condition, const std::string& message) {
    if (condition) {
        return;
    }
#ifdef CURVELOOP_STRICT_CHECKS
    throw NumericalError(message);
#else
    logging::get_logger()->warn("Postcondition failed: {}", message);
#endif
}

}  // namespace curveloop

#endif // CURVELOOP_COMMON_ERRORS_HPP
