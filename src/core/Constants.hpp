#pragma once

#include <cstddef>

/**
 * @brief Help-layout and exit-code constants used throughout the codebase
 *
 * The layout values reproduce the improver help text column for column.
 */
namespace improver {

namespace Constants {
    // Binary name printed in usage lines and diagnostics
    constexpr const char* PROGRAM_NAME = "improver";

    // Help layout
    constexpr size_t OPTION_INDENT = 4;           // Spaces before each flag token
    constexpr size_t DEFAULT_FLAG_WIDTH = 16;     // Flag column for declared options
    constexpr size_t HELP_FLAG_WIDTH = 20;        // Flag column for the built-in -h, --help
    constexpr size_t MIN_FLAG_GAP = 2;            // Gap when a token overflows its column

    // Built-in help option
    constexpr const char* HELP_SHORT = "h";
    constexpr const char* HELP_LONG = "help";
    constexpr const char* HELP_DESCRIPTION = "Show this message and exit";

    // Process exit codes
    constexpr int EXIT_OK = 0;
    constexpr int EXIT_FAILURE_CODE = 1;
    constexpr int EXIT_USAGE = 2;
}
}
