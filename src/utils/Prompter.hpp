#pragma once

#include <iosfwd>
#include <memory>
#include <string>

namespace remembrances {

// Yes/no question abstraction used by the installer wizard.
class Prompter {
public:
    virtual ~Prompter() = default;

    // Returns the answer, or `default_yes` when nothing usable was given
    // or no terminal is attached.
    virtual bool askYesNo(const std::string& question, bool default_yes) = 0;

    virtual bool isInteractive() const = 0;
};

using PrompterPtr = std::shared_ptr<Prompter>;

class TerminalPrompter : public Prompter {
public:
    TerminalPrompter(bool interactive, std::istream& in, std::ostream& out);

    bool askYesNo(const std::string& question, bool default_yes) override;
    bool isInteractive() const override { return interactive_; }

private:
    bool interactive_;
    std::istream& in_;
    std::ostream& out_;
};

}
