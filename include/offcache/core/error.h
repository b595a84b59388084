#ifndef OFFCACHE_CORE_ERROR_H_
#define OFFCACHE_CORE_ERROR_H_

#include <stdexcept>
#include <string>

namespace offcache {
namespace core {

/**
 * @brief Exception carrying one of the codes also used by Result
 *
 * Thrown only for construction-time misconfiguration and for host process
 * failures (binding a port, creating the store directory). The request path
 * reports through Result instead.
 */
class Error : public std::runtime_error {
public:
    enum class Code {
        UNKNOWN = 0,
        INVALID_ARGUMENT = 1,     // Bad config value, non-GET write, bad state transition
        NOT_FOUND = 2,
        ALREADY_EXISTS = 3,       // Phase already done, processor already running
        TIMEOUT = 4,              // Network lost the race against its timer
        RESOURCE_EXHAUSTED = 5,   // Store quota, full task queue
        INTERNAL = 6,             // Filesystem and other local failures
        UNAVAILABLE = 7           // Network unreachable, processor stopped
    };

    explicit Error(const std::string& message, Code code = Code::UNKNOWN)
        : std::runtime_error(message), code_(code) {}

    Code code() const { return code_; }

private:
    Code code_;
};

class InvalidArgumentError : public Error {
public:
    explicit InvalidArgumentError(const std::string& message)
        : Error(message, Code::INVALID_ARGUMENT) {}
};

class TimeoutError : public Error {
public:
    explicit TimeoutError(const std::string& message)
        : Error(message, Code::TIMEOUT) {}
};

class ResourceExhaustedError : public Error {
public:
    explicit ResourceExhaustedError(const std::string& message)
        : Error(message, Code::RESOURCE_EXHAUSTED) {}
};

/**
 * @brief An upstream host or a local service could not be reached
 */
class UnavailableError : public Error {
public:
    explicit UnavailableError(const std::string& message)
        : Error(message, Code::UNAVAILABLE) {}
};

class InternalError : public Error {
public:
    explicit InternalError(const std::string& message)
        : Error(message, Code::INTERNAL) {}
};

/**
 * @brief Upper-case name of a code, as it appears in log lines
 */
const char* code_name(Error::Code code);

} // namespace core
} // namespace offcache

#endif // OFFCACHE_CORE_ERROR_H_
