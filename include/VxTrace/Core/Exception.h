#pragma once

#include <VxTrace/Core/Export.h>

/**
 * @file Exception.h
 * @brief Exception classes for VxTrace
 *
 * Only InvalidArgumentException escapes Vectorize(). The tracing and budget
 * exceptions are raised inside the pipeline and converted into result flags
 * at the backend / pass boundary.
 */

#include <stdexcept>
#include <string>

namespace Vx::Trace {

/**
 * @brief Base exception class for VxTrace
 */
class VXTRACE_API Exception : public std::runtime_error {
public:
    explicit Exception(const std::string& message)
        : std::runtime_error(message) {}

    explicit Exception(const char* message)
        : std::runtime_error(message) {}
};

/**
 * @brief Invalid argument (bad configuration or malformed input)
 */
class VXTRACE_API InvalidArgumentException : public Exception {
public:
    explicit InvalidArgumentException(const std::string& message)
        : Exception("Invalid argument: " + message) {}
};

/**
 * @brief Out of range exception
 */
class VXTRACE_API OutOfRangeException : public Exception {
public:
    explicit OutOfRangeException(const std::string& message)
        : Exception("Out of range: " + message) {}
};

/**
 * @brief Insufficient data for algorithm (e.g., not enough points for fitting)
 */
class VXTRACE_API InsufficientDataException : public Exception {
public:
    explicit InsufficientDataException(const std::string& message)
        : Exception("Insufficient data: " + message) {}
};

/**
 * @brief File I/O exception
 */
class VXTRACE_API IOException : public Exception {
public:
    explicit IOException(const std::string& message)
        : Exception("I/O error: " + message) {}
};

/**
 * @brief Unsupported operation or format
 */
class VXTRACE_API UnsupportedException : public Exception {
public:
    explicit UnsupportedException(const std::string& message)
        : Exception("Unsupported: " + message) {}
};

/**
 * @brief A single feature (boundary, branch) could not be resolved
 */
class VXTRACE_API TracingException : public Exception {
public:
    explicit TracingException(const std::string& message)
        : Exception("Tracing failed: " + message) {}
};

/**
 * @brief Wall-clock processing budget exhausted
 */
class VXTRACE_API TimeBudgetException : public Exception {
public:
    explicit TimeBudgetException(const std::string& stage)
        : Exception("Time budget exceeded at stage: " + stage), stage_(stage) {}

    const std::string& Stage() const { return stage_; }

private:
    std::string stage_;
};

} // namespace Vx::Trace
