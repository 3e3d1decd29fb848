#include "release/ReleaseManifest.hpp"
#include "utils/InstallError.hpp"
#include "utils/Logger.hpp"
#include "utils/StringUtils.hpp"

#include <nlohmann/json.hpp>

namespace remembrances {

namespace {

std::string urlBasename(const std::string& url) {
    size_t slash = url.find_last_of('/');
    if (slash == std::string::npos) {
        return url;
    }
    return url.substr(slash + 1);
}

}

ReleaseManifest ReleaseManifest::fromJson(const std::string& json_text) {
    nlohmann::json js;
    try {
        js = nlohmann::json::parse(json_text);
    } catch (const nlohmann::json::parse_error& e) {
        throw InstallError("Release metadata is not valid JSON: " + std::string(e.what()));
    }

    if (!js.is_object()) {
        throw InstallError("Release metadata is not a JSON object");
    }

    ReleaseManifest manifest;
    if (js.contains("tag_name") && js["tag_name"].is_string()) {
        manifest.tag = js["tag_name"].get<std::string>();
    }
    if (manifest.tag.empty()) {
        throw InstallError("Could not determine the release tag from the GitHub API response");
    }

    if (js.contains("assets") && js["assets"].is_array()) {
        for (const auto& item : js["assets"]) {
            if (!item.is_object()) {
                continue;
            }
            std::string url = item.value("browser_download_url", std::string());
            if (url.empty()) {
                LOG_DEBUG("Skipping release asset without download URL");
                continue;
            }

            AssetDescriptor asset;
            asset.download_url = url;
            asset.filename = item.value("name", std::string());
            if (asset.filename.empty()) {
                asset.filename = urlBasename(url);
            }
            manifest.assets.push_back(asset);
        }
    }

    return manifest;
}

const AssetDescriptor* ReleaseManifest::find(const std::string& filename) const {
    if (filename.empty()) {
        return nullptr;
    }
    for (const auto& asset : assets) {
        if (asset.filename == filename || endsWith(asset.download_url, "/" + filename)) {
            return &asset;
        }
    }
    return nullptr;
}

std::vector<std::string> ReleaseManifest::embeddedAssetNames() const {
    std::vector<std::string> names;
    for (const auto& asset : assets) {
        if (asset.filename.find("embedded") != std::string::npos) {
            names.push_back(asset.filename);
        }
    }
    return names;
}

}
