#pragma once

#include <chrono>

namespace devmux {
namespace utils {

/**
 * @brief Wall-clock time as fractional seconds since the Unix epoch.
 *
 * This is the timestamp representation used by aggregates and the device store.
 */
inline double epochSeconds() {
    return std::chrono::duration<double>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

} // namespace utils
} // namespace devmux
