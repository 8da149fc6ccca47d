#pragma once

#include <string>
#include <vector>

#include "cli/CommandRegistry.hpp"
#include "cli/CommandSpec.hpp"
#include "core/InvocationResult.hpp"

namespace improver {

/**
 * @brief Routes an argument vector to help rendering or command execution
 *
 * args[0] names the command. A -h/--help anywhere after it renders that
 * command's help and stops; nothing else in args is looked at. Without a
 * help flag the command's execution behaviour is invoked.
 *
 * Exit codes: 0 success or help, 1 command failure, 2 usage error.
 */
class Dispatcher {
public:
    explicit Dispatcher(const CommandRegistry& registry) : registry(registry) {}

    InvocationResult dispatch(const std::vector<std::string>& args) const;

    static bool isHelpFlag(const std::string& arg);
    static Option helpOption();
    // Appends the built-in help option unless a colliding flag is declared
    static CommandSpec withHelpOption(CommandSpec spec);

private:
    const CommandRegistry& registry;
};

}
