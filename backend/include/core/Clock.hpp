#pragma once

#include <chrono>
#include <cstdint>

namespace fastmda {

inline int64_t now_ms() {
    return static_cast<int64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count());
}

} // namespace fastmda
