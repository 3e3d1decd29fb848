#pragma once

#include "platform/SystemProbe.hpp"

namespace remembrances {

// SystemProbe backed by the running host (uname(2), popen, PATH lookup).
class LocalSystem : public SystemProbe {
public:
    UnameInfo uname() override;
    CommandResult run(const std::vector<std::string>& argv) override;
    int runAttached(const std::vector<std::string>& argv) override;
    bool commandExists(const std::string& name) override;
    bool fileExists(const std::string& path) override;
    std::optional<std::string> readFile(const std::string& path) override;
    std::vector<std::string> listDirectory(const std::string& path) override;
    std::optional<std::string> getEnv(const std::string& name) override;
    bool stdinIsTerminal() override;
};

}
