#include "install/ArchiveExtractor.hpp"
#include "utils/InstallError.hpp"
#include "utils/Logger.hpp"

#include <algorithm>
#include <filesystem>
#include <vector>

namespace fs = std::filesystem;

namespace remembrances {

ArchiveExtractor::ArchiveExtractor(SystemProbePtr system)
    : system_(std::move(system)) {
}

bool ArchiveExtractor::extractZip(const std::string& archive, const std::string& destination) {
    if (!system_->commandExists("unzip")) {
        throw InstallError("unzip command not found. Please install it.");
    }

    CommandResult result = system_->run({"unzip", "-q", "-o", archive, "-d", destination});
    if (!result.ok()) {
        LOG_ERROR("unzip failed (exit " + std::to_string(result.exit_code) + ") for " + archive);
        return false;
    }
    return true;
}

bool ArchiveExtractor::extractTarXz(const std::string& archive, const std::string& destination) {
    if (!system_->commandExists("tar")) {
        throw InstallError("tar is required to extract " + archive + ". Please install tar.");
    }

    CommandResult result = system_->run({"tar", "-xJf", archive, "-C", destination});
    if (!result.ok()) {
        LOG_ERROR("tar failed (exit " + std::to_string(result.exit_code) + ") for " + archive);
        return false;
    }
    return true;
}

std::string ArchiveExtractor::extractedRoot(const std::string& extraction_dir) {
    std::vector<fs::path> dirs;
    std::error_code ec;
    for (fs::directory_iterator it(extraction_dir, ec), end; !ec && it != end; it.increment(ec)) {
        if (it->is_directory(ec)) {
            dirs.push_back(it->path());
        }
    }

    if (dirs.empty()) {
        return extraction_dir;
    }
    std::sort(dirs.begin(), dirs.end());
    return dirs.front().string();
}

}
