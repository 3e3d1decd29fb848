#pragma once

#include "platform/PlatformIdentifier.hpp"
#include "release/ReleaseManifest.hpp"
#include "release/VariantPreference.hpp"

#include <optional>
#include <string>
#include <vector>

namespace remembrances {

enum class AssetVariant {
    DARWIN_EMBEDDED,
    CUDA_PORTABLE_EMBEDDED,
    CUDA_EMBEDDED,
    CPU_EMBEDDED,
    CPU              // only reached as the fallback for CPU_EMBEDDED
};

std::string assetVariantToString(AssetVariant variant);

struct AssetResolution {
    enum class Status {
        RESOLVED,
        NO_MAPPING,       // platform/preference has no asset at all
        NOT_IN_CATALOG    // mapped, but the release does not carry it
    };

    Status status = Status::NO_MAPPING;
    AssetDescriptor asset;
    AssetVariant variant = AssetVariant::CPU_EMBEDDED;
    bool used_fallback = false;
    std::vector<std::string> tried;   // filenames looked up, in order

    bool ok() const { return status == Status::RESOLVED; }
};

class AssetSelector {
public:
    static constexpr const char* kDefaultAppName = "remembrances-mcp";

    // Total mapping over (tuple, preference); nullopt means no asset exists
    // for this combination.
    static std::optional<AssetVariant> selectVariant(const PlatformTuple& tuple,
                                                     const VariantPreference& pref);

    static std::string filenameFor(AssetVariant variant,
                                   const std::string& app = kDefaultAppName);

    static std::optional<std::string> selectFilename(const PlatformTuple& tuple,
                                                     const VariantPreference& pref,
                                                     const std::string& app = kDefaultAppName);

    // The single defined substitution: CPU_EMBEDDED -> CPU.
    static std::optional<AssetVariant> fallbackFor(AssetVariant variant);

    // Looks the selected filename up in the catalog, applying the fallback
    // at most once.
    static AssetResolution resolve(const PlatformTuple& tuple,
                                   const VariantPreference& pref,
                                   const ReleaseManifest& manifest,
                                   const std::string& app = kDefaultAppName);

private:
    AssetSelector() = delete;
};

}
