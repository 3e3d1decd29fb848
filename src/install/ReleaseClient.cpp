#include "install/ReleaseClient.hpp"
#include "utils/InstallError.hpp"
#include "utils/Logger.hpp"

namespace remembrances {

ReleaseClient::ReleaseClient(SystemProbePtr system, std::string repository)
    : downloader_(std::move(system))
    , repository_(std::move(repository)) {
}

std::string ReleaseClient::apiUrl(const std::string& repository, const std::string& version) {
    const std::string base = "https://api.github.com/repos/" + repository + "/releases/";
    if (version.empty() || version == "latest") {
        return base + "latest";
    }
    return base + "tags/" + version;
}

ReleaseManifest ReleaseClient::fetch(const std::string& version) {
    std::string url = apiUrl(repository_, version);
    LOG_DEBUG("Fetching release metadata from " + url);

    std::string body;
    try {
        body = downloader_.fetchText(url);
    } catch (const InstallError& e) {
        throw InstallError("Failed to fetch release metadata from GitHub. " + std::string(e.what()));
    }

    return ReleaseManifest::fromJson(body);
}

}
