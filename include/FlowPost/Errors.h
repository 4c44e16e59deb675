#ifndef FLOWPOST_ERRORS_H
#define FLOWPOST_ERRORS_H

#include <stdexcept>
#include <string>

namespace FLOW {

    // bad inputs: non-positive variances, inverted bounds, malformed configuration files
    struct ConfigError : public std::invalid_argument {
        explicit ConfigError(const std::string & msg) : std::invalid_argument("configuration error: " + msg) {}
    };

    // the sampler could not start from a feasible state
    struct InitializationError : public std::runtime_error {
        explicit InitializationError(const std::string & msg) : std::runtime_error("initialization error: " + msg) {}
    };

    // quadrature failed to produce a usable normalizing constant, or was asked for a bad reduction
    struct NumericError : public std::runtime_error {
        explicit NumericError(const std::string & msg) : std::runtime_error("numeric error: " + msg) {}
    };

    // sqlite failures while exporting results
    struct StorageError : public std::runtime_error {
        explicit StorageError(const std::string & msg) : std::runtime_error("storage error: " + msg) {}
    };

}

#endif // FLOWPOST_ERRORS_H
