#include "cli/commands/TestsCommand.hpp"

#include <algorithm>
#include <string>
#include <vector>

#include "util/Logger.hpp"

namespace improver {

Expected<void> TestsCommand::execute(const AppContext&, const std::vector<std::string>& args) {
    auto& log = Logger::instance();
    if (std::find(args.begin(), args.end(), "--debug") != args.end()) {
        log.setLevel(LogLevel::Debug);
    }
    log.debug("tests: pep8, pylint, unit and CLI acceptance suites requested");

    // The suites themselves are run by the external test runner, not this binary.
    return Error{ErrorCode::NotSupported, "suite execution is provided by the external test runner"};
}

}
