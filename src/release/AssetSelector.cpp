#include "release/AssetSelector.hpp"
#include "utils/Logger.hpp"

namespace remembrances {

std::string assetVariantToString(AssetVariant variant) {
    switch (variant) {
        case AssetVariant::DARWIN_EMBEDDED: return "darwin embedded";
        case AssetVariant::CUDA_PORTABLE_EMBEDDED: return "CUDA portable embedded";
        case AssetVariant::CUDA_EMBEDDED: return "CUDA embedded";
        case AssetVariant::CPU_EMBEDDED: return "CPU embedded";
        case AssetVariant::CPU: return "CPU";
        default: return "unknown";
    }
}

std::optional<AssetVariant> AssetSelector::selectVariant(const PlatformTuple& tuple,
                                                         const VariantPreference& pref) {
    if (tuple.isDarwinAarch64()) {
        return AssetVariant::DARWIN_EMBEDDED;
    }

    if (tuple.isLinuxAmd64()) {
        if (pref.want_nvidia) {
            return pref.want_portable ? AssetVariant::CUDA_PORTABLE_EMBEDDED
                                      : AssetVariant::CUDA_EMBEDDED;
        }
        return AssetVariant::CPU_EMBEDDED;
    }

    return std::nullopt;
}

std::string AssetSelector::filenameFor(AssetVariant variant, const std::string& app) {
    switch (variant) {
        case AssetVariant::DARWIN_EMBEDDED:
            return app + "-darwin-aarch64-embedded.zip";
        case AssetVariant::CUDA_PORTABLE_EMBEDDED:
            return app + "-embedded-cuda-portable-linux-x86_64.zip";
        case AssetVariant::CUDA_EMBEDDED:
            return app + "-embedded-cuda-linux-x86_64.zip";
        case AssetVariant::CPU_EMBEDDED:
            return app + "-embedded-cpu-linux-x86_64.zip";
        case AssetVariant::CPU:
            return app + "-cpu-linux-x86_64.zip";
    }
    return "";
}

std::optional<std::string> AssetSelector::selectFilename(const PlatformTuple& tuple,
                                                         const VariantPreference& pref,
                                                         const std::string& app) {
    auto variant = selectVariant(tuple, pref);
    if (!variant) {
        return std::nullopt;
    }
    return filenameFor(*variant, app);
}

std::optional<AssetVariant> AssetSelector::fallbackFor(AssetVariant variant) {
    if (variant == AssetVariant::CPU_EMBEDDED) {
        return AssetVariant::CPU;
    }
    return std::nullopt;
}

AssetResolution AssetSelector::resolve(const PlatformTuple& tuple,
                                       const VariantPreference& pref,
                                       const ReleaseManifest& manifest,
                                       const std::string& app) {
    AssetResolution resolution;

    auto variant = selectVariant(tuple, pref);
    if (!variant) {
        resolution.status = AssetResolution::Status::NO_MAPPING;
        return resolution;
    }

    std::string filename = filenameFor(*variant, app);
    resolution.variant = *variant;
    resolution.tried.push_back(filename);

    const AssetDescriptor* asset = manifest.find(filename);

    if (!asset) {
        auto fallback = fallbackFor(*variant);
        if (fallback) {
            std::string fallback_name = filenameFor(*fallback, app);
            LOG_WARN("CPU embedded asset not found. Falling back to standard CPU build (" +
                     fallback_name + ")");
            resolution.tried.push_back(fallback_name);
            resolution.variant = *fallback;
            resolution.used_fallback = true;
            asset = manifest.find(fallback_name);
        }
    }

    if (!asset) {
        resolution.status = AssetResolution::Status::NOT_IN_CATALOG;
        return resolution;
    }

    resolution.status = AssetResolution::Status::RESOLVED;
    resolution.asset = *asset;
    return resolution;
}

}
