#include "cli/commands/HelpCommand.hpp"

#include <string>
#include <vector>

#include "cli/CommandRegistry.hpp"
#include "cli/Dispatcher.hpp"
#include "cli/HelpRenderer.hpp"
#include "core/Constants.hpp"

namespace improver {

/**
 * @brief Execute 'improver help [command]'
 *
 * Without a topic prints the command listing. With a topic prints exactly
 * what 'improver <topic> -h' prints; extra arguments after the topic are
 * ignored.
 */
Expected<void> HelpCommand::execute(const AppContext& ctx, const std::vector<std::string>& args) {
    if (args.empty()) {
        ctx.out << HelpRenderer::renderCommandList(ctx.registry.specs(), Constants::PROGRAM_NAME);
        return {};
    }

    const std::string& topic = args.front();
    auto spec = ctx.registry.lookup(topic);
    if (!spec) {
        return Error{ErrorCode::UnknownCommand, "unknown help topic '" + topic + "'"};
    }
    ctx.out << HelpRenderer::render(Dispatcher::withHelpOption(spec.value()));
    return {};
}

}
