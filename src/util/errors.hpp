#ifndef PRIVGATE_UTIL_ERRORS_HPP
#define PRIVGATE_UTIL_ERRORS_HPP

#include <stdexcept>
#include <string>

/**
 * @file errors.hpp
 * @brief Exception taxonomy for the privacy engine.
 *
 *   - ConfigurationError:      bad method/category/level name, missing encryption key,
 *                              malformed config line. Never retried.
 *   - BackendUnavailableError: an optional recognition/classification backend is absent
 *                              or stopped answering. Callers recover with the pattern fallback.
 *   - DetectionError /
 *     ClassificationError:     malformed input (invalid UTF-8, embedded NUL).
 *   - AuditWriteError:         the audit store could not persist an entry. The entry
 *                              is still held in memory by the ledger.
 */

namespace privgate {
namespace util {

class PrivgateError : public std::runtime_error
{
public:
    explicit PrivgateError(const std::string &msg)
        : std::runtime_error(msg)
    {
    }
};

class ConfigurationError : public PrivgateError
{
public:
    explicit ConfigurationError(const std::string &msg)
        : PrivgateError("ConfigurationError: " + msg)
    {
    }
};

class BackendUnavailableError : public PrivgateError
{
public:
    explicit BackendUnavailableError(const std::string &msg)
        : PrivgateError("BackendUnavailableError: " + msg)
    {
    }
};

class DetectionError : public PrivgateError
{
public:
    explicit DetectionError(const std::string &msg)
        : PrivgateError("DetectionError: " + msg)
    {
    }
};

class ClassificationError : public PrivgateError
{
public:
    explicit ClassificationError(const std::string &msg)
        : PrivgateError("ClassificationError: " + msg)
    {
    }
};

class AuditWriteError : public PrivgateError
{
public:
    explicit AuditWriteError(const std::string &msg)
        : PrivgateError("AuditWriteError: " + msg)
    {
    }
};

} // namespace util
} // namespace privgate

#endif // PRIVGATE_UTIL_ERRORS_HPP
