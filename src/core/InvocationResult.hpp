#pragma once

#include <string>

namespace improver {

/**
 * @brief Observable outcome of one CLI invocation: exit code plus both streams
 */
struct InvocationResult {
    int exitCode{0};
    std::string out;
    std::string err;
};

}
