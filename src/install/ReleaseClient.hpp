#pragma once

#include "install/Downloader.hpp"
#include "release/ReleaseManifest.hpp"

#include <string>

namespace remembrances {

class ReleaseClient {
public:
    ReleaseClient(SystemProbePtr system, std::string repository);

    // "latest" (or empty) -> /releases/latest, otherwise /releases/tags/<version>
    static std::string apiUrl(const std::string& repository, const std::string& version);

    // Throws InstallError when the metadata cannot be fetched or parsed.
    ReleaseManifest fetch(const std::string& version);

private:
    Downloader downloader_;
    std::string repository_;
};

}
