#pragma once

#include <chrono>

namespace improver {

/**
 * @brief Settings for subprocess-driven acceptance runs
 *
 * IMPROVER_HARNESS_TIMEOUT_MS overrides the timeout; 0 disables it and
 * anything that is not a non-negative integer keeps the default.
 */
struct HarnessConfig {
    static constexpr long long DEFAULT_TIMEOUT_MS = 10000;

    std::chrono::milliseconds timeout{DEFAULT_TIMEOUT_MS};

    static HarnessConfig fromEnvironment();
    static std::chrono::milliseconds parseTimeout(const char* value);
};

}
