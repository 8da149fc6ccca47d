// improver CLI entry: static command registration, then dispatch.

#include <iostream>
#include <string>
#include <vector>

#include "cli/CommandRegistry.hpp"
#include "cli/Dispatcher.hpp"
#include "cli/commands/BuiltinCommands.hpp"
#include "core/Constants.hpp"
#include "util/Logger.hpp"

using namespace improver;

int main(int argc, char** argv) {
    auto& registry = CommandRegistry::instance();
    auto reg = registerBuiltinCommands(registry);
    if (!reg) {
        Logger::instance().error(reg.error().message);
        return Constants::EXIT_FAILURE_CODE;
    }
    registry.seal();

    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) args.emplace_back(argv[i]);

    Dispatcher dispatcher(registry);
    auto result = dispatcher.dispatch(args);
    std::cout << result.out << std::flush;
    std::cerr << result.err << std::flush;
    return result.exitCode;
}
