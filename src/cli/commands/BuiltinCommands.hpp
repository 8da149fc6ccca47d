#pragma once

#include "cli/CommandRegistry.hpp"

namespace improver {

// Registers every improver command; shared by main() and the tests.
Expected<void> registerBuiltinCommands(CommandRegistry& registry);

}
