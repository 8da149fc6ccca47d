#include "cli/CommandRegistry.hpp"

#include "util/Logger.hpp"

namespace improver {

CommandRegistry& CommandRegistry::instance() {
    static CommandRegistry r;
    return r;
}

Expected<void> CommandRegistry::registerCommand(const CommandSpec& spec, Creator creator) {
    if (sealed) {
        return Error{ErrorCode::RegistrySealed, "cannot register '" + spec.name + "': registry is sealed"};
    }
    auto valid = validateSpec(spec);
    if (!valid) return valid;
    if (entries.count(spec.name)) {
        return Error{ErrorCode::DuplicateCommand, "command '" + spec.name + "' is already registered"};
    }
    entries.emplace(spec.name, Entry{spec, std::move(creator)});
    Logger::instance().debug("Registered command: " + spec.name);
    return {};
}

Expected<CommandSpec> CommandRegistry::lookup(const std::string& name) const {
    auto it = entries.find(name);
    if (it == entries.end()) {
        return Error{ErrorCode::UnknownCommand, "unknown command '" + name + "'"};
    }
    return it->second.spec;
}

bool CommandRegistry::contains(const std::string& name) const {
    return entries.count(name) != 0;
}

std::unique_ptr<ICommand> CommandRegistry::create(const std::string& name) const {
    auto it = entries.find(name);
    if (it == entries.end() || !it->second.creator) return nullptr;
    return it->second.creator();
}

std::vector<CommandSpec> CommandRegistry::specs() const {
    std::vector<CommandSpec> out;
    out.reserve(entries.size());
    for (const auto& kv : entries) {
        out.push_back(kv.second.spec);
    }
    return out;
}

}
