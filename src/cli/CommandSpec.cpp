#include "cli/CommandSpec.hpp"

#include <algorithm>

namespace improver {

std::string Option::flagToken() const {
    std::string token;
    if (!shortFlag.empty()) token += "-" + shortFlag;
    if (!longFlag.empty()) {
        if (!token.empty()) token += ", ";
        token += "--" + longFlag;
    }
    return token;
}

bool Option::sharesFlagWith(const Option& other) const {
    if (!shortFlag.empty() && shortFlag == other.shortFlag) return true;
    if (!longFlag.empty() && longFlag == other.longFlag) return true;
    return false;
}

bool operator==(const Option& a, const Option& b) {
    return a.shortFlag == b.shortFlag && a.longFlag == b.longFlag &&
           a.description == b.description && a.flagWidth == b.flagWidth;
}

bool operator!=(const Option& a, const Option& b) { return !(a == b); }

bool CommandSpec::declares(const Option& option) const {
    return std::any_of(options.begin(), options.end(),
                       [&](const Option& o) { return o.sharesFlagWith(option); });
}

bool operator==(const CommandSpec& a, const CommandSpec& b) {
    return a.name == b.name && a.usage == b.usage &&
           a.description == b.description && a.options == b.options;
}

bool operator!=(const CommandSpec& a, const CommandSpec& b) { return !(a == b); }

Expected<void> validateSpec(const CommandSpec& spec) {
    if (spec.name.empty()) return Error{ErrorCode::InvalidArgs, "command name must not be empty"};
    if (spec.usage.empty()) return Error{ErrorCode::InvalidArgs, spec.name + ": usage must not be empty"};
    if (spec.description.empty()) {
        return Error{ErrorCode::InvalidArgs, spec.name + ": description must not be empty"};
    }
    for (const auto& opt : spec.options) {
        if (opt.shortFlag.empty() && opt.longFlag.empty()) {
            return Error{ErrorCode::InvalidArgs, spec.name + ": option has neither short nor long flag"};
        }
        if (opt.shortFlag.size() > 1) {
            return Error{ErrorCode::InvalidArgs, spec.name + ": short flag '-" + opt.shortFlag + "' is longer than one character"};
        }
        if (opt.description.empty()) {
            return Error{ErrorCode::InvalidArgs, spec.name + ": option " + opt.flagToken() + " has no description"};
        }
    }
    return {};
}

}
