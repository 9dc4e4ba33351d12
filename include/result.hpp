/**
 * @file result.hpp
 * @brief Result type for recoverable error handling
 * @version 1.0.0
 * @author Bennie Shearer
 * Copyright (c) 2025 Bennie Shearer - MIT License
 *
 * Error codes are grouped by hundreds: 1xx directory data, 2xx signed cache
 * and locks, 3xx authentication, 4xx configuration, 5xx runtime.
 */
#ifndef AUTHCORE_RESULT_HPP
#define AUTHCORE_RESULT_HPP

#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace authcore {

enum class ErrorCode {
    SUCCESS = 0,
    INVALID_ARGUMENT = 3,
    CANCELLED = 6,

    DIRECTORY_DATA_INVALID = 101,
    DIRECTORY_STRUCTURE_INVALID = 102,
    INVALID_CONDITION = 104,

    CACHE_MISS = 200,
    CACHE_SIGNATURE_MISMATCH = 201,
    CACHE_HEADER_TRUNCATED = 202,
    CACHE_HEADER_STALE = 203,
    CACHE_IO_ERROR = 204,
    LOCK_FAILED = 205,

    AUTHENTICATION_FAILED = 300,
    UNKNOWN_USER = 301,
    ORG_MISMATCH = 302,

    CONFIG_INVALID = 400,
    CONFIG_MISSING = 401,
    CONFIG_PARSE_ERROR = 402,

    SYSTEM_ERROR = 500,
    BACKEND_UNREACHABLE = 501,
    STALENESS_UNRECOVERABLE = 502,
    INTERNAL_ERROR = 503
};

inline std::string errorCodeToString(ErrorCode code) {
    static constexpr std::pair<ErrorCode, const char*> names[] = {
        {ErrorCode::SUCCESS, "SUCCESS"},
        {ErrorCode::INVALID_ARGUMENT, "INVALID_ARGUMENT"},
        {ErrorCode::CANCELLED, "CANCELLED"},
        {ErrorCode::DIRECTORY_DATA_INVALID, "DIRECTORY_DATA_INVALID"},
        {ErrorCode::DIRECTORY_STRUCTURE_INVALID, "DIRECTORY_STRUCTURE_INVALID"},
        {ErrorCode::INVALID_CONDITION, "INVALID_CONDITION"},
        {ErrorCode::CACHE_MISS, "CACHE_MISS"},
        {ErrorCode::CACHE_SIGNATURE_MISMATCH, "CACHE_SIGNATURE_MISMATCH"},
        {ErrorCode::CACHE_HEADER_TRUNCATED, "CACHE_HEADER_TRUNCATED"},
        {ErrorCode::CACHE_HEADER_STALE, "CACHE_HEADER_STALE"},
        {ErrorCode::CACHE_IO_ERROR, "CACHE_IO_ERROR"},
        {ErrorCode::LOCK_FAILED, "LOCK_FAILED"},
        {ErrorCode::AUTHENTICATION_FAILED, "AUTHENTICATION_FAILED"},
        {ErrorCode::UNKNOWN_USER, "UNKNOWN_USER"},
        {ErrorCode::ORG_MISMATCH, "ORG_MISMATCH"},
        {ErrorCode::CONFIG_INVALID, "CONFIG_INVALID"},
        {ErrorCode::CONFIG_MISSING, "CONFIG_MISSING"},
        {ErrorCode::CONFIG_PARSE_ERROR, "CONFIG_PARSE_ERROR"},
        {ErrorCode::SYSTEM_ERROR, "SYSTEM_ERROR"},
        {ErrorCode::BACKEND_UNREACHABLE, "BACKEND_UNREACHABLE"},
        {ErrorCode::STALENESS_UNRECOVERABLE, "STALENESS_UNRECOVERABLE"},
        {ErrorCode::INTERNAL_ERROR, "INTERNAL_ERROR"},
    };
    for (const auto& [value, name] : names) {
        if (value == code) return name;
    }
    return "ERROR_" + std::to_string(static_cast<int>(code));
}

struct Error {
    ErrorCode code = ErrorCode::INTERNAL_ERROR;
    std::string message;
    std::string context;

    Error() = default;
    Error(ErrorCode c, std::string msg = "", std::string ctx = "")
        : code(c), message(std::move(msg)), context(std::move(ctx)) {}

    /** @brief "[CODE] message (context: ctx)" */
    [[nodiscard]] std::string toString() const {
        std::string text = "[" + errorCodeToString(code) + "]";
        if (!message.empty()) text += " " + message;
        if (!context.empty()) text += " (context: " + context + ")";
        return text;
    }
};

/**
 * @brief Either a value or an Error
 *
 * Converts to true when it holds a value. value() on an error and error()
 * on a value throw std::bad_variant_access.
 */
template<typename T>
class Result {
public:
    Result(const T& value) : state_(std::in_place_index<0>, value) {}
    Result(T&& value) : state_(std::in_place_index<0>, std::move(value)) {}
    Result(Error err) : state_(std::in_place_index<1>, std::move(err)) {}

    [[nodiscard]] bool isError() const noexcept { return state_.index() == 1; }
    [[nodiscard]] explicit operator bool() const noexcept { return !isError(); }

    [[nodiscard]] const T& value() const& { return std::get<0>(state_); }
    [[nodiscard]] T& value() & { return std::get<0>(state_); }
    [[nodiscard]] T value() && { return std::get<0>(std::move(state_)); }
    [[nodiscard]] const T* operator->() const { return &value(); }
    [[nodiscard]] const T& operator*() const& { return value(); }

    [[nodiscard]] const Error& error() const { return std::get<1>(state_); }

    /** @brief Same result, with @p ctx attached when it is an error */
    [[nodiscard]] Result withContext(const std::string& ctx) const {
        if (!isError()) return *this;
        return Error(error().code, error().message, ctx);
    }

private:
    std::variant<T, Error> state_;
};

template<>
class Result<void> {
public:
    Result() = default;
    Result(Error err) : error_(std::move(err)) {}

    [[nodiscard]] bool isError() const noexcept { return error_.has_value(); }
    [[nodiscard]] explicit operator bool() const noexcept { return !isError(); }
    [[nodiscard]] const Error& error() const { return error_.value(); }

    [[nodiscard]] Result withContext(const std::string& ctx) const {
        if (!isError()) return *this;
        return Error(error_->code, error_->message, ctx);
    }

private:
    std::optional<Error> error_;
};

template<typename T>
Result<std::decay_t<T>> Ok(T&& value) { return Result<std::decay_t<T>>(std::forward<T>(value)); }

inline Result<void> Ok() { return {}; }

template<typename T>
Result<T> Err(ErrorCode code, const std::string& msg = "") { return Result<T>(Error(code, msg)); }

/** @brief Forward an error held by a result of another type */
template<typename T>
Result<T> Err(const Error& err) { return Result<T>(err); }

inline Result<void> Err(ErrorCode code, const std::string& msg = "") { return Result<void>(Error(code, msg)); }

} // namespace authcore

#endif // AUTHCORE_RESULT_HPP
