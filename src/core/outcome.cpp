#include "libnumopt/core/outcome.hpp"

namespace numopt {

const char* to_string(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::NonConvergence:       return "NonConvergence";
    case ErrorKind::InvalidBracket:       return "InvalidBracket";
    case ErrorKind::DegenerateDerivative: return "DegenerateDerivative";
    }
    return "Unknown";
}

SolverError::SolverError(ErrorKind kind, const std::string& message)
    : std::runtime_error(std::string(to_string(kind)) + ": " + message), kind_(kind) {}

} // namespace numopt
