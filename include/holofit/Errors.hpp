#pragma once

#include <stdexcept>
#include <string>

namespace holofit {

class HolofitError : public std::runtime_error {
public:
    explicit HolofitError(const std::string& message)
        : std::runtime_error(message) {}
};

/* add_tie() named a parameter the registry does not know */
class UnknownParameter : public HolofitError {
public:
    explicit UnknownParameter(const std::string& message)
        : HolofitError("Unknown parameter: " + message) {}
};

/* attempted tie between priors with different distributions */
class TieError : public HolofitError {
public:
    explicit TieError(const std::string& message)
        : HolofitError("Tie error: " + message) {}
};

/* a required quantity is neither mapped nor available from a fallback */
class MissingParameter : public HolofitError {
public:
    explicit MissingParameter(const std::string& message)
        : HolofitError("Missing parameter: " + message) {}
};

class SerializationError : public HolofitError {
public:
    explicit SerializationError(const std::string& message)
        : HolofitError("Serialization error: " + message) {}
};

class ConfigError : public HolofitError {
public:
    explicit ConfigError(const std::string& message)
        : HolofitError("Config error: " + message) {}
};

/*
 * Thrown by forward evaluators when a candidate cannot be computed
 * (overlapping spheres, failed T-matrix, ...).  The model converts it
 * to a log-probability of -inf; the mapping engine never throws it.
 */
class EvaluationFailure : public HolofitError {
public:
    explicit EvaluationFailure(const std::string& message)
        : HolofitError("Evaluation failure: " + message) {}
};

} // namespace holofit
