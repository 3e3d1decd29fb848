#pragma once

#include "platform/SystemProbe.hpp"
#include <string>

namespace remembrances {

enum class HttpTool {
    CURL,
    WGET,
    NONE
};

// HTTP via curl or wget, whichever is installed (curl preferred).
class Downloader {
public:
    explicit Downloader(SystemProbePtr system);

    HttpTool tool();

    // Response body; throws InstallError if no tool is available or the
    // request fails.
    std::string fetchText(const std::string& url);

    // Downloads to `destination` with a progress bar. Returns false on
    // failure; throws InstallError only if no tool is available.
    bool downloadFile(const std::string& url, const std::string& destination);

private:
    SystemProbePtr system_;
};

}
