#pragma once

#include <ostream>
#include <string>
#include <vector>

#include "util/Expected.hpp"

namespace improver {

class CommandRegistry;

struct AppContext {
    std::ostream& out;
    std::ostream& err;
    const CommandRegistry& registry;
};

/**
 * @brief Execution side of a registered command
 *
 * Help text is not produced here: it comes from the command's CommandSpec
 * and is rendered by the dispatcher before execute() is ever reached.
 */
class ICommand {
public:
    virtual ~ICommand() = default;
    virtual Expected<void> execute(const AppContext& ctx, const std::vector<std::string>& args) = 0;
    virtual const char* name() const = 0;
};

}
