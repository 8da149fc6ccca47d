#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "util/Expected.hpp"

namespace improver {

/**
 * @brief One entry of a command's "Optional arguments" section
 *
 * shortFlag and longFlag are stored without dashes ("h", "help").
 * flagWidth of 0 means the default flag column is used when rendering.
 */
struct Option {
    std::string shortFlag;
    std::string longFlag;
    std::string description;
    std::size_t flagWidth{0};

    // "-h, --help", "--debug" or "-v"
    std::string flagToken() const;
    bool sharesFlagWith(const Option& other) const;
};

bool operator==(const Option& a, const Option& b);
bool operator!=(const Option& a, const Option& b);

/**
 * @brief Declarative help data for one CLI command
 *
 * Options are kept in declaration order, which is also their render order.
 */
struct CommandSpec {
    std::string name;
    std::string usage;
    std::string description;
    std::vector<Option> options;

    bool declares(const Option& option) const;
};

bool operator==(const CommandSpec& a, const CommandSpec& b);
bool operator!=(const CommandSpec& a, const CommandSpec& b);

/**
 * @brief Check the Option and CommandSpec invariants
 *
 * Non-empty name, usage and description; every option has a flag and a
 * description, and a short flag is a single character.
 *
 * @return InvalidArgs describing the first violation
 */
Expected<void> validateSpec(const CommandSpec& spec);

}
