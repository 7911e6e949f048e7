#ifndef STRATA_EXCEPTIONS_H
#define STRATA_EXCEPTIONS_H

#include <stdexcept>
#include <string>

namespace Strata {

class StrataException : public std::runtime_error {
public:
    explicit StrataException(const std::string& message) : std::runtime_error(message) {}
};

class IOException : public StrataException {
public:
    explicit IOException(const std::string& message) : StrataException("IO Error: " + message) {}
};

class DatasetException : public StrataException {
public:
    explicit DatasetException(const std::string& message) : StrataException("Dataset Error: " + message) {}
};

class ConfigurationException : public StrataException {
public:
    explicit ConfigurationException(const std::string& message) : StrataException("Configuration Error: " + message) {}
};

// Failures scoped to a single candidate. The layer builder absorbs these.
class CandidateException : public StrataException {
public:
    explicit CandidateException(const std::string& message) : StrataException(message) {}
};

class MissingDependencyException : public CandidateException {
public:
    explicit MissingDependencyException(const std::string& message)
        : CandidateException("Missing dependency: " + message) {}
};

class NumericalException : public CandidateException {
public:
    explicit NumericalException(const std::string& message)
        : CandidateException("Numerical error: " + message) {}
};

class TimeLimitExceeded : public CandidateException {
public:
    explicit TimeLimitExceeded(const std::string& message)
        : CandidateException("Time limit exceeded: " + message) {}
};

// Raised when no model could be fit in any layer. what() carries the aggregated report.
class FitFailedException : public StrataException {
public:
    explicit FitFailedException(const std::string& report) : StrataException("Fit failed: " + report) {}
};

} // namespace Strata

#endif // STRATA_EXCEPTIONS_H
