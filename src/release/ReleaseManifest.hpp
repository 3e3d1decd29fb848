#pragma once

#include <string>
#include <vector>

namespace remembrances {

struct AssetDescriptor {
    std::string filename;
    std::string download_url;
};

// Release metadata as returned by the GitHub releases API.
struct ReleaseManifest {
    std::string tag;
    std::vector<AssetDescriptor> assets;

    // Parses the API JSON. Throws InstallError on malformed JSON or a
    // missing tag_name; assets without a download URL are skipped.
    static ReleaseManifest fromJson(const std::string& json_text);

    // First asset whose name is `filename` or whose URL ends in
    // "/<filename>"; nullptr if none.
    const AssetDescriptor* find(const std::string& filename) const;

    std::vector<std::string> embeddedAssetNames() const;
};

}
