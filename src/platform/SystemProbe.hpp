#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace remembrances {

struct CommandResult {
    bool started = false;   // false if the command could not be launched
    int exit_code = -1;
    std::string output;     // captured stdout

    bool ok() const { return started && exit_code == 0; }
};

struct UnameInfo {
    std::string sysname;
    std::string machine;
};

// Every read-only query the installer makes against the host goes through
// this interface, so detection logic can be exercised against scripted
// hosts.
class SystemProbe {
public:
    virtual ~SystemProbe() = default;

    virtual UnameInfo uname() = 0;

    // Runs argv[0] with the remaining arguments, capturing stdout.
    // stderr is discarded.
    virtual CommandResult run(const std::vector<std::string>& argv) = 0;

    // Runs with stdout/stderr attached to the terminal (progress bars).
    // Returns the exit status, -1 if the command could not be launched.
    virtual int runAttached(const std::vector<std::string>& argv) = 0;

    virtual bool commandExists(const std::string& name) = 0;
    virtual bool fileExists(const std::string& path) = 0;
    virtual std::optional<std::string> readFile(const std::string& path) = 0;

    // Entry names (not paths) of a directory; empty if it cannot be read.
    virtual std::vector<std::string> listDirectory(const std::string& path) = 0;

    virtual std::optional<std::string> getEnv(const std::string& name) = 0;
    virtual bool stdinIsTerminal() = 0;
};

using SystemProbePtr = std::shared_ptr<SystemProbe>;

}
