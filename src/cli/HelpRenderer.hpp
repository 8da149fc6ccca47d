#pragma once

#include <string>
#include <vector>

#include "cli/CommandSpec.hpp"

namespace improver {

/**
 * @brief Turns help data into the canonical improver help text
 *
 * Output layout for a command:
 *
 *   <usage>
 *
 *   <description>
 *
 *   Optional arguments:
 *       <flag token, padded to its column><description>
 *
 * Every line ends in a single '\n' and nothing follows the last option.
 * Rendering is pure: no locale, no terminal width, no global state.
 */
namespace HelpRenderer {

std::string render(const CommandSpec& spec);

/**
 * @brief Render one "Optional arguments" line, including its newline
 *
 * The flag token is padded to option.flagWidth, or to the default column
 * when the option does not set one. A token that does not fit is followed
 * by a two-space gap instead.
 */
std::string renderOption(const Option& option);

/**
 * @brief Render the top-level command listing
 *
 * @param specs Commands in display order
 * @param program Binary name used in the usage line
 */
std::string renderCommandList(const std::vector<CommandSpec>& specs, const std::string& program);

}  // namespace HelpRenderer

}  // namespace improver
