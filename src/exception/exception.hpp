/*
 * exception.hpp
 *
 * Copyright (C) 2024 The sweeplink Authors
 */

/*************************************************

Date: 2024-12

Description: Fleet error taxonomy

**************************************************/

#ifndef SWEEPLINK_EXCEPTION_EXCEPTION_HPP
#define SWEEPLINK_EXCEPTION_EXCEPTION_HPP

#include <chrono>
#include <cstdint>
#include <source_location>
#include <stdexcept>
#include <string>
#include <string_view>

namespace sweeplink {

/**
 * @brief Classification of every failure the fleet core can report
 */
enum class ErrorKind : uint8_t {
    Authentication,
    Connectivity,
    Timeout,
    Protocol,
    Cache,
    UnknownDeviceModel,
    Cancelled,
    NotFound,
    DuplicateRequest,
    Config
};

/**
 * @brief Stable lowercase name of an error kind, used in logs and JSON
 */
[[nodiscard]] constexpr auto errorKindName(ErrorKind kind) noexcept
    -> std::string_view {
    switch (kind) {
        case ErrorKind::Authentication: return "authentication";
        case ErrorKind::Connectivity: return "connectivity";
        case ErrorKind::Timeout: return "timeout";
        case ErrorKind::Protocol: return "protocol";
        case ErrorKind::Cache: return "cache";
        case ErrorKind::UnknownDeviceModel: return "unknown_device_model";
        case ErrorKind::Cancelled: return "cancelled";
        case ErrorKind::NotFound: return "not_found";
        case ErrorKind::DuplicateRequest: return "duplicate_request";
        case ErrorKind::Config: return "config";
    }
    return "unknown";
}

/**
 * @brief Base exception class for all fleet errors
 */
class FleetException : public std::runtime_error {
public:
    FleetException(
        ErrorKind kind, std::string_view message,
        std::source_location location = std::source_location::current())
        : std::runtime_error(std::string(message)),
          kind_(kind),
          location_(location) {}

    [[nodiscard]] auto kind() const noexcept -> ErrorKind { return kind_; }

    [[nodiscard]] auto location() const noexcept
        -> const std::source_location& {
        return location_;
    }

private:
    ErrorKind kind_;
    std::source_location location_;
};

/**
 * @brief Account credentials were rejected (cloud login or broker)
 */
class AuthenticationFailure : public FleetException {
public:
    explicit AuthenticationFailure(
        std::string_view message,
        std::source_location location = std::source_location::current())
        : FleetException(ErrorKind::Authentication, message, location) {}
};

/**
 * @brief Transport-level failure; retryable
 */
class ConnectivityFailure : public FleetException {
public:
    explicit ConnectivityFailure(
        std::string_view message,
        std::source_location location = std::source_location::current())
        : FleetException(ErrorKind::Connectivity, message, location) {}
};

/**
 * @brief A command did not receive its response before the deadline
 */
class RequestTimeout : public FleetException {
public:
    RequestTimeout(
        std::string_view message, std::chrono::milliseconds timeout,
        std::source_location location = std::source_location::current())
        : FleetException(ErrorKind::Timeout, message, location),
          timeout_(timeout) {}

    [[nodiscard]] auto timeout() const noexcept -> std::chrono::milliseconds {
        return timeout_;
    }

private:
    std::chrono::milliseconds timeout_;
};

/**
 * @brief Malformed or unexpected data from a peer; not retried
 */
class ProtocolViolation : public FleetException {
public:
    explicit ProtocolViolation(
        std::string_view message,
        std::source_location location = std::source_location::current())
        : FleetException(ErrorKind::Protocol, message, location) {}
};

/**
 * @brief The persistent cache could not be written
 */
class CacheUnavailable : public FleetException {
public:
    explicit CacheUnavailable(
        std::string_view message,
        std::source_location location = std::source_location::current())
        : FleetException(ErrorKind::Cache, message, location) {}
};

/**
 * @brief The owning session or device was closed while a request waited
 */
class RequestCancelled : public FleetException {
public:
    explicit RequestCancelled(
        std::string_view message,
        std::source_location location = std::source_location::current())
        : FleetException(ErrorKind::Cancelled, message, location) {}
};

/**
 * @brief A command addressed a DUID the manager does not know
 */
class DeviceNotFound : public FleetException {
public:
    explicit DeviceNotFound(
        std::string_view message,
        std::source_location location = std::source_location::current())
        : FleetException(ErrorKind::NotFound, message, location) {}
};

/**
 * @brief A request id was started while an identical one is outstanding
 */
class DuplicateRequestId : public FleetException {
public:
    explicit DuplicateRequestId(
        std::string_view message,
        std::source_location location = std::source_location::current())
        : FleetException(ErrorKind::DuplicateRequest, message, location) {}
};

/**
 * @brief Configuration file could not be read, parsed or validated
 */
class ConfigError : public FleetException {
public:
    explicit ConfigError(
        std::string_view message,
        std::source_location location = std::source_location::current())
        : FleetException(ErrorKind::Config, message, location) {}
};

}  // namespace sweeplink

#endif  // SWEEPLINK_EXCEPTION_EXCEPTION_HPP
