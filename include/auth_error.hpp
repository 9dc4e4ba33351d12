/**
 * @file auth_error.hpp
 * @brief Exception hierarchy for conditions that unwind the call stack
 * @version 1.0.0
 * @author Bennie Shearer
 * Copyright (c) 2025 Bennie Shearer - MIT License
 *
 * Recoverable outcomes use Result<T> (result.hpp). The exceptions below
 * cover the cases that must cross several layers: structural directory
 * problems, an unreachable backend, configuration rejected at startup and
 * staleness that can no longer be tolerated.
 */
#ifndef AUTHCORE_AUTH_ERROR_HPP
#define AUTHCORE_AUTH_ERROR_HPP

#include "result.hpp"
#include <stdexcept>
#include <string>

namespace authcore {

class AuthCoreError : public std::runtime_error {
public:
    AuthCoreError(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }
    [[nodiscard]] Error toError() const { return Error{code_, what()}; }

private:
    ErrorCode code_;
};

/** @brief Missing or invalid tuning parameters; the process must not start */
class ConfigurationError : public AuthCoreError {
public:
    explicit ConfigurationError(const std::string& message, ErrorCode code = ErrorCode::CONFIG_INVALID)
        : AuthCoreError(code, message) {}
};

/** @brief A malformed value in a single directory entry */
class DirectoryDataError : public AuthCoreError {
public:
    explicit DirectoryDataError(const std::string& message)
        : AuthCoreError(ErrorCode::DIRECTORY_DATA_INVALID, message) {}
};

/** @brief The directory graph as a whole cannot be used (bad shape, dangling reference) */
class DirectoryStructureError : public AuthCoreError {
public:
    explicit DirectoryStructureError(const std::string& message)
        : AuthCoreError(ErrorCode::DIRECTORY_STRUCTURE_INVALID, message) {}
};

class AuthenticationError : public AuthCoreError {
public:
    explicit AuthenticationError(const std::string& message,
                                 ErrorCode code = ErrorCode::AUTHENTICATION_FAILED)
        : AuthCoreError(code, message) {}
};

/** @brief The directory backend could not be reached; distinct from a denial */
class CommunicationError : public AuthCoreError {
public:
    explicit CommunicationError(const std::string& message)
        : AuthCoreError(ErrorCode::BACKEND_UNREACHABLE, message) {}
};

class CacheIntegrityError : public AuthCoreError {
public:
    CacheIntegrityError(ErrorCode code, const std::string& message)
        : AuthCoreError(code, message) {}
};

class LockError : public AuthCoreError {
public:
    explicit LockError(const std::string& message)
        : AuthCoreError(ErrorCode::LOCK_FAILED, message) {}
};

class CancelledError : public AuthCoreError {
public:
    CancelledError() : AuthCoreError(ErrorCode::CANCELLED, "operation cancelled") {}
};

class UnrecoverableStalenessError : public AuthCoreError {
public:
    explicit UnrecoverableStalenessError(const std::string& message)
        : AuthCoreError(ErrorCode::STALENESS_UNRECOVERABLE, message) {}
};

} // namespace authcore

#endif // AUTHCORE_AUTH_ERROR_HPP
