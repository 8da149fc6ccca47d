#include "cli/commands/BuiltinCommands.hpp"

#include <memory>

#include "cli/commands/HelpCommand.hpp"
#include "cli/commands/TestsCommand.hpp"

namespace improver {

Expected<void> registerBuiltinCommands(CommandRegistry& registry) {
    auto res = registry.registerCommand(HelpCommand::helpSpec(), [] { return std::make_unique<HelpCommand>(); });
    if (!res) return res;
    res = registry.registerCommand(TestsCommand::helpSpec(), [] { return std::make_unique<TestsCommand>(); });
    if (!res) return res;
    return {};
}

}
