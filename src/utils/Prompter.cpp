#include "utils/Prompter.hpp"
#include "utils/Logger.hpp"
#include "utils/StringUtils.hpp"
#include <istream>
#include <ostream>

namespace remembrances {

TerminalPrompter::TerminalPrompter(bool interactive, std::istream& in, std::ostream& out)
    : interactive_(interactive)
    , in_(in)
    , out_(out) {
}

bool TerminalPrompter::askYesNo(const std::string& question, bool default_yes) {
    const std::string hint = default_yes ? " [Y/n] " : " [y/N] ";
    const std::string default_str = default_yes ? "y" : "n";

    if (!interactive_) {
        LOG_WARN("Non-interactive mode: using default (" + default_str + ") for: " + question);
        return default_yes;
    }

    out_ << question << hint << std::flush;

    std::string reply;
    if (!std::getline(in_, reply)) {
        out_ << std::endl;
        LOG_WARN("No answer read, using default (" + default_str + ")");
        return default_yes;
    }

    reply = toLower(trim(reply));
    if (reply.empty()) {
        return default_yes;
    }
    if (reply[0] == 'y') {
        return true;
    }
    if (reply[0] == 'n') {
        return false;
    }

    LOG_WARN("Unrecognized answer '" + reply + "', using default (" + default_str + ")");
    return default_yes;
}

}
