#include "install/Downloader.hpp"
#include "utils/InstallError.hpp"
#include "utils/Logger.hpp"

namespace remembrances {

Downloader::Downloader(SystemProbePtr system)
    : system_(std::move(system)) {
}

HttpTool Downloader::tool() {
    if (system_->commandExists("curl")) {
        return HttpTool::CURL;
    }
    if (system_->commandExists("wget")) {
        return HttpTool::WGET;
    }
    return HttpTool::NONE;
}

std::string Downloader::fetchText(const std::string& url) {
    CommandResult result;
    switch (tool()) {
        case HttpTool::CURL:
            result = system_->run({"curl", "-fsSL", url});
            break;
        case HttpTool::WGET:
            result = system_->run({"wget", "-q", "-O", "-", url});
            break;
        default:
            throw InstallError("Neither curl nor wget found. Please install one of them.");
    }

    if (!result.ok()) {
        throw InstallError("Request failed (exit " + std::to_string(result.exit_code) + "): " + url);
    }
    return result.output;
}

bool Downloader::downloadFile(const std::string& url, const std::string& destination) {
    int status = -1;
    switch (tool()) {
        case HttpTool::CURL:
            status = system_->runAttached({"curl", "-fL", "--progress-bar", "-o", destination, url});
            break;
        case HttpTool::WGET:
            status = system_->runAttached({"wget", "--show-progress", "-q", "-O", destination, url});
            break;
        default:
            throw InstallError("Neither curl nor wget found. Please install one of them.");
    }

    if (status != 0) {
        LOG_ERROR("Download failed (exit " + std::to_string(status) + "): " + url);
        return false;
    }
    return true;
}

}
