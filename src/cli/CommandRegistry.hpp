#pragma once

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "cli/CommandSpec.hpp"
#include "cli/ICommand.hpp"

namespace improver {

class CommandRegistry {
public:
    using Creator = std::function<std::unique_ptr<ICommand>()>;

    static CommandRegistry& instance();

    CommandRegistry() = default;
    CommandRegistry(const CommandRegistry&) = delete;
    CommandRegistry& operator=(const CommandRegistry&) = delete;

    // DuplicateCommand, InvalidArgs or RegistrySealed on failure
    Expected<void> registerCommand(const CommandSpec& spec, Creator creator = nullptr);
    Expected<CommandSpec> lookup(const std::string& name) const;
    bool contains(const std::string& name) const;
    // nullptr when the name is unknown or has no execution behaviour
    std::unique_ptr<ICommand> create(const std::string& name) const;
    std::vector<CommandSpec> specs() const;

    // No registration is accepted once sealed
    void seal() { sealed = true; }
    bool isSealed() const { return sealed; }

private:
    struct Entry {
        CommandSpec spec;
        Creator creator;
    };

    std::map<std::string, Entry> entries;
    bool sealed{false};
};

}
