#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

#include "core/ErrorCatalog.hpp"

namespace fastmda {

enum class ErrorKind {
    Connection,
    Hardware,
    InvalidPosition,
    NotFound,
    Busy,
    Config,
    Control
};

const char* to_string(ErrorKind kind);

/**
 * @brief Base of every error raised by the engine, registries and capabilities.
 *
 * Carries a kind for classification and a catalogue code (see ErrorCatalog.hpp)
 * that crosses the RPC boundary unchanged.
 */
class Error : public std::runtime_error {
public:
    Error(ErrorKind kind, int code, const std::string& message)
    : std::runtime_error(message), kind_(kind), code_(code) {}

    ErrorKind kind() const noexcept { return kind_; }
    int code() const noexcept { return code_; }

    // Id of the device the failing operation targeted, when known.
    const std::string& device_id() const noexcept { return device_id_; }
    void set_device_id(std::string id) { device_id_ = std::move(id); }

private:
    ErrorKind kind_;
    int code_;
    std::string device_id_;
};

enum class ConnectionCode {
    Ok,
    Timeout,
    NotFound,
    InUse,
    Transport
};

const char* to_string(ConnectionCode code);
int catalog_code(ConnectionCode code);

class ConnectionError : public Error {
public:
    ConnectionError(ConnectionCode reason, const std::string& message)
    : Error(ErrorKind::Connection, catalog_code(reason), message), reason_(reason) {}

    ConnectionCode reason() const noexcept { return reason_; }

private:
    ConnectionCode reason_;
};

class HardwareError : public Error {
public:
    explicit HardwareError(const std::string& message)
    : Error(ErrorKind::Hardware, errors::E1200_HARDWARE, message) {}
};

enum class LimitKind { Hard, Soft };

class InvalidPositionError : public Error {
public:
    InvalidPositionError(LimitKind limit, const std::string& message)
    : Error(ErrorKind::InvalidPosition,
            limit == LimitKind::Hard ? errors::E1300_HARD_LIMIT : errors::E1301_SOFT_LIMIT,
            message),
      limit_(limit) {}

    LimitKind limit() const noexcept { return limit_; }

private:
    LimitKind limit_;
};

class NotFoundError : public Error {
public:
    explicit NotFoundError(const std::string& message)
    : Error(ErrorKind::NotFound, errors::E1400_NOT_FOUND, message) {}
};

class BusyError : public Error {
public:
    explicit BusyError(const std::string& message)
    : Error(ErrorKind::Busy, errors::E1500_BUSY, message) {}
};

class ConfigError : public Error {
public:
    explicit ConfigError(const std::string& message)
    : Error(ErrorKind::Config, errors::E1600_CONFIG, message) {}
};

// Malformed control request; the message carries the catalogued 2400 prefix.
class ControlError : public Error {
public:
    explicit ControlError(std::string_view detail)
    : Error(ErrorKind::Control, errors::E2400_CONTROL_REJECTED, errors::format_E2400_control_rejected(detail)) {}
};

} // namespace fastmda
