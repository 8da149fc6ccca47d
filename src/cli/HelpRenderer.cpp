#include "cli/HelpRenderer.hpp"

#include "core/Constants.hpp"

namespace improver {

namespace HelpRenderer {

namespace {

std::string padded(const std::string& token, size_t width) {
    if (token.size() >= width) return token + std::string(Constants::MIN_FLAG_GAP, ' ');
    return token + std::string(width - token.size(), ' ');
}

}

std::string renderOption(const Option& option) {
    size_t width = option.flagWidth ? option.flagWidth : Constants::DEFAULT_FLAG_WIDTH;
    std::string line(Constants::OPTION_INDENT, ' ');
    line += padded(option.flagToken(), width);
    line += option.description;
    line += '\n';
    return line;
}

std::string render(const CommandSpec& spec) {
    std::string out;
    out += spec.usage + "\n\n";
    out += spec.description + "\n\n";
    out += "Optional arguments:\n";
    for (const auto& opt : spec.options) {
        out += renderOption(opt);
    }
    return out;
}

std::string renderCommandList(const std::vector<CommandSpec>& specs, const std::string& program) {
    std::string out;
    out += "usage: " + program + " <command> [-h]\n\n";
    out += "Commands:\n";
    for (const auto& spec : specs) {
        out += std::string(Constants::OPTION_INDENT, ' ');
        out += padded(spec.name, Constants::DEFAULT_FLAG_WIDTH);
        out += spec.description;
        out += '\n';
    }
    return out;
}

}  // namespace HelpRenderer

}  // namespace improver
