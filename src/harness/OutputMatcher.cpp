#include "harness/OutputMatcher.hpp"

#include <algorithm>
#include <sstream>

namespace improver {

namespace OutputMatcher {

std::size_t firstDifference(const std::string& expected, const std::string& actual) {
    auto mismatch = std::mismatch(expected.begin(), expected.end(), actual.begin(), actual.end());
    if (mismatch.first == expected.end() && mismatch.second == actual.end()) return std::string::npos;
    return static_cast<std::size_t>(mismatch.first - expected.begin());
}

Expected<void> compareExact(const InvocationResult& actual, int expectedExit, const std::string& expectedOut) {
    const std::size_t diff = firstDifference(expectedOut, actual.out);
    const bool exitOk = actual.exitCode == expectedExit;
    if (exitOk && diff == std::string::npos) return {};

    std::ostringstream msg;
    if (!exitOk) {
        msg << "exit code: expected " << expectedExit << ", got " << actual.exitCode << "\n";
    }
    if (diff != std::string::npos) {
        msg << "stdout differs at byte " << diff
            << " (expected " << expectedOut.size() << " bytes, got " << actual.out.size() << ")\n";
    }
    msg << "--- expected stdout ---\n" << expectedOut
        << "--- actual stdout ---\n" << actual.out;
    if (!actual.err.empty()) {
        msg << "--- actual stderr ---\n" << actual.err;
    }
    return Error{ErrorCode::RenderMismatch, msg.str()};
}

}  // namespace OutputMatcher

}  // namespace improver
