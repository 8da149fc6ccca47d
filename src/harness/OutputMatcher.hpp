#pragma once

#include <cstddef>
#include <string>

#include "core/InvocationResult.hpp"
#include "util/Expected.hpp"

namespace improver {

namespace OutputMatcher {

// Offset of the first differing byte, or std::string::npos if equal
std::size_t firstDifference(const std::string& expected, const std::string& actual);

/**
 * @brief Compare an invocation against its golden exit code and stdout
 *
 * Equality is byte-exact, whitespace and line endings included. On mismatch
 * the RenderMismatch message carries the offset of the first difference,
 * both stdout texts and the captured stderr.
 */
Expected<void> compareExact(const InvocationResult& actual, int expectedExit, const std::string& expectedOut);

}  // namespace OutputMatcher

}  // namespace improver
