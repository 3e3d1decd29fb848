#pragma once

#include "hardware/HardwareCapabilityProber.hpp"
#include "install/InstallLayout.hpp"
#include "pipeline/InstallerConfig.hpp"
#include "pipeline/Progress.hpp"
#include "platform/PlatformIdentifier.hpp"
#include "platform/SystemProbe.hpp"
#include "release/AssetSelector.hpp"
#include "release/ReleaseManifest.hpp"
#include "release/VariantPreference.hpp"
#include "runtime/RemediationPlanner.hpp"
#include "runtime/RuntimeDependencyValidator.hpp"
#include "utils/Prompter.hpp"

#include <optional>
#include <string>

namespace remembrances {

// Decisions taken for one run, in the order they were made.
struct InstallPlan {
    PlatformTuple platform;
    CapabilityProfile capabilities;
    VariantPreference preference;
    std::optional<std::string> selected_filename;
    AssetResolution asset;
};

struct InstallReport {
    InstallPlan plan;
    std::string version;
    InstallLayout layout;
    std::string binary_path;
    std::string config_path;
    std::optional<ValidationOutcome> validation;
    RemediationResult remediation;
    bool model_ready = false;
};

class Installer {
public:
    Installer(InstallerConfig config, SystemProbePtr system, PrompterPtr prompter);

    // Full installation. Throws InstallError on any terminal condition.
    InstallReport run();

    // Identification, probing and preference only; no network, no files.
    InstallPlan detect();

    // Individual stages
    PlatformTuple identifyPlatform();
    CapabilityProfile probeCapabilities(const PlatformTuple& platform);
    VariantPreference choosePreference(const PlatformTuple& platform,
                                       const CapabilityProfile& capabilities);
    AssetResolution resolveAsset(InstallPlan& plan, const ReleaseManifest& manifest);

    // Only acts on the linux NVIDIA install: validates the CUDA runtime next
    // to `bin_dir` and remediates if libraries are missing.
    std::optional<ValidationOutcome> verifyGpuRuntime(const InstallPlan& plan,
                                                      const std::string& bin_dir,
                                                      RemediationResult& remediation);

    static void printSummary(const InstallReport& report, const InstallerConfig& config);

private:
    void reportEmbeddedAssets(const ReleaseManifest& manifest);
    bool shouldDownloadModel();

    InstallerConfig config_;
    SystemProbePtr system_;
    PrompterPtr prompter_;
    Progress progress_;
};

}
