#pragma once

#include "cli/CommandSpec.hpp"
#include "cli/ICommand.hpp"

namespace improver {

class TestsCommand : public ICommand {
public:
    Expected<void> execute(const AppContext& ctx, const std::vector<std::string>& args) override;
    const char* name() const override { return "tests"; }

    static CommandSpec helpSpec() {
        return CommandSpec{"tests", "improver tests [--debug]",
                           "Run pep8, pylint, unit and CLI acceptance tests.",
                           { {"", "debug", "Run in verbose mode (may take longer for CLI)"} }};
    }
};

}
