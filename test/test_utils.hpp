#pragma once

#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "cli/CommandSpec.hpp"
#include "core/InvocationResult.hpp"

namespace improver::test {

/**
 * @brief Test utilities for improver tests
 * 
 * Provides the golden help fixture, spec builders and the exact-output
 * assertion shared by the in-process and subprocess tests.
 */
namespace utils {

/**
 * @brief Golden output of `improver tests -h`
 */
const std::string& goldenTestsHelp();

/**
 * @brief Build a spec with the given options and fixed usage/description
 * @param name Command name
 * @param options Options in declaration order
 */
CommandSpec makeSpec(const std::string& name, const std::vector<Option>& options = {});

/**
 * @brief Path of the built improver executable
 */
std::string cliPath();

/**
 * @brief GoogleTest predicate over OutputMatcher::compareExact
 *
 * Usage: EXPECT_TRUE(ExactOutput(result, 0, expected));
 */
::testing::AssertionResult ExactOutput(const InvocationResult& actual, int expectedExit,
                                       const std::string& expectedOut);

} // namespace utils

} // namespace improver::test
