#ifndef OFFCACHE_CORE_RESULT_H_
#define OFFCACHE_CORE_RESULT_H_

#include <string>
#include <optional>
#include <stdexcept>
#include <utility>
#include "offcache/core/error.h"

namespace offcache {
namespace core {

namespace detail {

/**
 * @brief Error half of a Result: an optional message and its code
 */
class ResultState {
public:
    bool ok() const { return !error_msg_.has_value(); }
    bool has_error() const { return error_msg_.has_value(); }

    std::string error() const {
        if (!error_msg_) {
            throw std::runtime_error("Attempting to access error of ok result");
        }
        return *error_msg_;
    }

    Error::Code error_code() const { return code_; }

protected:
    ResultState() = default;
    ResultState(std::string error_msg, Error::Code code)
        : error_msg_(std::move(error_msg)), code_(code) {}

    std::optional<std::string> error_msg_;
    Error::Code code_ = Error::Code::UNKNOWN;
};

} // namespace detail

/**
 * @brief Value of an operation that can fail, or the reason it failed
 *
 * Usage:
 * ```
 * Result<Response> fetch() {
 *     if (unreachable) {
 *         return Result<Response>::error("connection refused", Error::Code::UNAVAILABLE);
 *     }
 *     return response;
 * }
 *
 * auto result = fetch();
 * if (!result.ok()) {
 *     return Result<Outcome>::forward(result);
 * }
 * Response response = result.take_value();
 * ```
 *
 * Failures travel between layers with forward(), which keeps the code.
 */
template<typename T>
class Result : public detail::ResultState {
public:
    Result(T value) : value_(std::move(value)) {}

    explicit Result(const Error& error)
        : ResultState(error.what(), error.code()), value_() {}

    Result(Result&& other) = default;
    Result& operator=(Result&& other) = default;

    // Move-only, responses can be large
    Result(const Result&) = delete;
    Result& operator=(const Result&) = delete;

    // The static error() factory below would hide the accessor
    using detail::ResultState::error;

    const T& value() const { return value_; }
    T&& take_value() { return std::move(value_); }

    static Result<T> error(const std::string& message, Error::Code code = Error::Code::UNKNOWN) {
        return Result<T>(message, code);
    }

    template<typename U>
    static Result<T> forward(const Result<U>& failed) {
        return Result<T>(failed.error(), failed.error_code());
    }

private:
    Result(std::string error_msg, Error::Code code)
        : ResultState(std::move(error_msg), code), value_() {}

    T value_;
};

/**
 * @brief Success or failure without a value; copyable
 */
template<>
class Result<void> : public detail::ResultState {
public:
    Result() = default;

    explicit Result(const Error& error)
        : ResultState(error.what(), error.code()) {}

    using detail::ResultState::error;

    static Result<void> error(const std::string& message, Error::Code code = Error::Code::UNKNOWN) {
        return Result<void>(message, code);
    }

    template<typename U>
    static Result<void> forward(const Result<U>& failed) {
        return Result<void>(failed.error(), failed.error_code());
    }

private:
    Result(std::string error_msg, Error::Code code)
        : ResultState(std::move(error_msg), code) {}
};

} // namespace core
} // namespace offcache

#endif // OFFCACHE_CORE_RESULT_H_
