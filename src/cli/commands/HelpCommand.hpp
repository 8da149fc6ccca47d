#pragma once

#include "cli/CommandSpec.hpp"
#include "cli/ICommand.hpp"

namespace improver {

class HelpCommand : public ICommand {
public:
    Expected<void> execute(const AppContext& ctx, const std::vector<std::string>& args) override;
    const char* name() const override { return "help"; }

    static CommandSpec helpSpec() {
        return CommandSpec{"help", "improver help [command]",
                           "Show help for a command, or list all commands.", {}};
    }
};

}
