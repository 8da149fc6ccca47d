#include "cli/Dispatcher.hpp"

#include <algorithm>
#include <sstream>

#include "cli/HelpRenderer.hpp"
#include "core/Constants.hpp"
#include "util/Logger.hpp"

namespace improver {

namespace {

int exitCodeFor(const Error& err) {
    switch (err.code) {
        case ErrorCode::InvalidArgs:
        case ErrorCode::UnknownCommand:
            return Constants::EXIT_USAGE;
        default:
            return Constants::EXIT_FAILURE_CODE;
    }
}

}

bool Dispatcher::isHelpFlag(const std::string& arg) {
    return arg == "-h" || arg == "--help";
}

Option Dispatcher::helpOption() {
    return Option{Constants::HELP_SHORT, Constants::HELP_LONG, Constants::HELP_DESCRIPTION,
                  Constants::HELP_FLAG_WIDTH};
}

CommandSpec Dispatcher::withHelpOption(CommandSpec spec) {
    Option help = helpOption();
    if (!spec.declares(help)) spec.options.push_back(std::move(help));
    return spec;
}

InvocationResult Dispatcher::dispatch(const std::vector<std::string>& args) const {
    auto& log = Logger::instance();
    InvocationResult result;

    if (args.empty() || isHelpFlag(args.front())) {
        result.out = HelpRenderer::renderCommandList(registry.specs(), Constants::PROGRAM_NAME);
        result.exitCode = Constants::EXIT_OK;
        return result;
    }

    const std::string& cmdName = args.front();
    auto specRes = registry.lookup(cmdName);
    if (!specRes) {
        log.debug("Lookup failed: " + specRes.error().message);
        result.err = std::string(Constants::PROGRAM_NAME) + ": " + specRes.error().message + "\n" +
                     "Run '" + Constants::PROGRAM_NAME + " -h' for a list of commands.\n";
        result.exitCode = Constants::EXIT_USAGE;
        return result;
    }

    std::vector<std::string> rest(args.begin() + 1, args.end());
    if (std::any_of(rest.begin(), rest.end(), isHelpFlag)) {
        log.debug("Rendering help for: " + cmdName);
        result.out = HelpRenderer::render(withHelpOption(specRes.value()));
        result.exitCode = Constants::EXIT_OK;
        return result;
    }

    auto cmd = registry.create(cmdName);
    if (!cmd) {
        result.err = std::string(Constants::PROGRAM_NAME) + ": command '" + cmdName + "' cannot be executed\n";
        result.exitCode = Constants::EXIT_FAILURE_CODE;
        return result;
    }

    std::ostringstream out;
    std::ostringstream err;
    AppContext ctx{out, err, registry};
    log.debug(std::string("Executing command: ") + cmd->name());
    Expected<void> res;
    {
        // A command may change verbosity for itself, never for later invocations
        ScopedLogLevel levelGuard;
        res = cmd->execute(ctx, rest);
    }
    result.out = out.str();
    result.err = err.str();
    if (!res) {
        log.debug(std::string(cmd->name()) + " failed with " + errorCodeName(res.error().code));
        result.err += std::string(Constants::PROGRAM_NAME) + " " + cmd->name() + ": " + res.error().message + "\n";
        result.exitCode = exitCodeFor(res.error());
        return result;
    }
    result.exitCode = Constants::EXIT_OK;
    return result;
}

}
