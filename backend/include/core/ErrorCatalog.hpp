#pragma once

#include <string>
#include <string_view>

namespace fastmda::errors {

// 1100-1199: device connection
// 1200-1299: hardware / capability command failures
// 1300-1399: actuator and setting domain violations
// 1400-1499: unknown identities
// 1500-1599: busy capabilities / device leases
// 1600-1699: configuration and measurement validation
// 2400-2499: WebSocket / control channel errors

inline constexpr int E1100_CONNECTION_FAILED = 1100;
inline constexpr int E1101_CONNECTION_TIMEOUT = 1101;
inline constexpr int E1102_CONNECTION_NOT_FOUND = 1102;
inline constexpr int E1103_CONNECTION_IN_USE = 1103;
inline constexpr int E1200_HARDWARE = 1200;
inline constexpr int E1300_HARD_LIMIT = 1300;
inline constexpr int E1301_SOFT_LIMIT = 1301;
inline constexpr int E1400_NOT_FOUND = 1400;
inline constexpr int E1500_BUSY = 1500;
inline constexpr int E1600_CONFIG = 1600;
inline constexpr int E2400_CONTROL_REJECTED = 2400;

inline constexpr const char* MSG_E2400_CONTROL_REJECTED_PREFIX = "Error 2400: Control message rejected: ";
inline constexpr const char* MSG_E2410_SESSION_DROPPED = "Error 2410: WebSocket session dropped unexpectedly";

// Catalogued detail strings. Kept here so ad-hoc strings do not cross the RPC boundary.
inline constexpr const char* D2400_INVALID_REQUEST = "invalid request";
inline constexpr const char* D2400_RPC_MISSING_ID = "rpc request missing id";
inline constexpr const char* D2400_RPC_MISSING_METHOD = "rpc request missing method";
inline constexpr const char* D2400_RPC_UNKNOWN_METHOD = "unknown rpc method";
inline constexpr const char* D2400_PARAMS_NOT_OBJECT = "params must be object";
inline constexpr const char* D2400_MISSING_DEVICE_ID = "missing params.device_id";
inline constexpr const char* D2400_MISSING_ACTUATOR_ID = "missing params.actuator_id";
inline constexpr const char* D2400_MISSING_DETECTOR_ID = "missing params.detector_id";
inline constexpr const char* D2400_MISSING_VALUE = "missing params.value";
inline constexpr const char* D2400_MISSING_RUN_ID = "missing params.run_id";
inline constexpr const char* D2400_MISSING_MEASUREMENT = "missing params.measurement";

inline constexpr const char* D1200_DEVICE_DISCONNECTED = "device is not connected";
inline constexpr const char* D1200_DIMENSIONALITY_MISMATCH = "reading dimensionality does not match detector";
inline constexpr const char* D1200_SHAPE_MISMATCH = "reading values do not match reading shape";
inline constexpr const char* D1300_INDEX_OUT_OF_RANGE = "position index out of range";
inline constexpr const char* D1300_OUTSIDE_HARDWARE_LIMITS = "target outside hardware limits";
inline constexpr const char* D1300_NOT_FINITE = "target is not a finite number";
inline constexpr const char* D1301_OPTION_INVALID = "option temporarily invalid";
inline constexpr const char* D1301_OUTSIDE_SOFTWARE_LIMITS = "target outside software limits";
inline constexpr const char* D1500_DEVICE_LEASED = "device is in use by a measurement run";
inline constexpr const char* D1600_RUN_ACTIVE = "run is still active";
inline constexpr const char* D1600_SOFT_LIMITS_EXCEED_HARDWARE = "software limits exceed hardware limits";

inline std::string format_E2400_control_rejected(std::string_view detail) {
    std::string out;
    out.reserve(std::char_traits<char>::length(MSG_E2400_CONTROL_REJECTED_PREFIX) + detail.size());
    out.append(MSG_E2400_CONTROL_REJECTED_PREFIX);
    if (detail.empty()) {
        out.append(D2400_INVALID_REQUEST);
    } else {
        out.append(detail.data(), detail.size());
    }
    return out;
}

} // namespace fastmda::errors
