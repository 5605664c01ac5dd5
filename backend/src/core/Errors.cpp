#include "core/Errors.hpp"

namespace fastmda {

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Connection: return "connection";
        case ErrorKind::Hardware: return "hardware";
        case ErrorKind::InvalidPosition: return "invalid_position";
        case ErrorKind::NotFound: return "not_found";
        case ErrorKind::Busy: return "busy";
        case ErrorKind::Config: return "config";
        case ErrorKind::Control: return "control";
    }
    return "unknown";
}

const char* to_string(ConnectionCode code) {
    switch (code) {
        case ConnectionCode::Ok: return "ok";
        case ConnectionCode::Timeout: return "timeout";
        case ConnectionCode::NotFound: return "not_found";
        case ConnectionCode::InUse: return "in_use";
        case ConnectionCode::Transport: return "transport";
    }
    return "unknown";
}

int catalog_code(ConnectionCode code) {
    switch (code) {
        case ConnectionCode::Ok: return 0;
        case ConnectionCode::Timeout: return errors::E1101_CONNECTION_TIMEOUT;
        case ConnectionCode::NotFound: return errors::E1102_CONNECTION_NOT_FOUND;
        case ConnectionCode::InUse: return errors::E1103_CONNECTION_IN_USE;
        case ConnectionCode::Transport: return errors::E1100_CONNECTION_FAILED;
    }
    return errors::E1100_CONNECTION_FAILED;
}

} // namespace fastmda
