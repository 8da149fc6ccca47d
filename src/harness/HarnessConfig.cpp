#include "harness/HarnessConfig.hpp"

#include <cctype>
#include <cstdlib>
#include <string>

namespace improver {

std::chrono::milliseconds HarnessConfig::parseTimeout(const char* value) {
    const std::chrono::milliseconds fallback{DEFAULT_TIMEOUT_MS};
    if (!value) return fallback;
    std::string v(value);
    if (v.empty() || v.size() > 12) return fallback;
    for (char c : v) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return fallback;
    }
    return std::chrono::milliseconds{std::stoll(v)};
}

HarnessConfig HarnessConfig::fromEnvironment() {
    HarnessConfig cfg;
    cfg.timeout = parseTimeout(std::getenv("IMPROVER_HARNESS_TIMEOUT_MS"));
    return cfg;
}

}
