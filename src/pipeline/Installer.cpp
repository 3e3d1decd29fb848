#include "pipeline/Installer.hpp"
#include "install/ArchiveExtractor.hpp"
#include "install/ConfigWriter.hpp"
#include "install/Downloader.hpp"
#include "install/FileInstaller.hpp"
#include "install/ModelDownloader.hpp"
#include "install/ReleaseClient.hpp"
#include "install/ShellSetup.hpp"
#include "utils/InstallError.hpp"
#include "utils/Logger.hpp"
#include "utils/TempDir.hpp"

#include <nlohmann/json.hpp>
#include <iostream>

namespace remembrances {

namespace {

constexpr int kTotalSteps = 10;

std::string joinNames(const std::vector<std::string>& names) {
    std::string out;
    for (const auto& n : names) {
        if (!out.empty()) {
            out += ", ";
        }
        out += n;
    }
    return out;
}

}

Installer::Installer(InstallerConfig config, SystemProbePtr system, PrompterPtr prompter)
    : config_(std::move(config))
    , system_(std::move(system))
    , prompter_(std::move(prompter))
    , progress_(kTotalSteps) {
}

PlatformTuple Installer::identifyPlatform() {
    PlatformTuple platform = PlatformIdentifier::identifyHost(*system_);
    LOG_STEP("Detected OS: " + osToString(platform.os) + " (" + platform.raw_os + ")");
    LOG_STEP("Detected architecture: " + archToString(platform.arch) + " (" + platform.raw_arch + ")");

    if (!PlatformIdentifier::isSupported(platform)) {
        throw InstallError(PlatformIdentifier::rejectionReason(platform));
    }
    return platform;
}

CapabilityProfile Installer::probeCapabilities(const PlatformTuple& platform) {
    HardwareCapabilityProber prober(system_);
    CapabilityProfile capabilities = prober.probe(platform);
    HardwareCapabilityProber::printCapabilities(platform, capabilities);
    return capabilities;
}

VariantPreference Installer::choosePreference(const PlatformTuple& platform,
                                              const CapabilityProfile& capabilities) {
    if (prompter_ && prompter_->isInteractive() && platform.isLinuxAmd64()) {
        LOG_STEP("Installer wizard");
    }

    VariantPreference preference = VariantPreferenceResolver::resolve(
        platform, capabilities, config_.overrides, prompter_.get());

    if (platform.isLinuxAmd64()) {
        LOG_KV("Build", preference.want_nvidia ? "NVIDIA/CUDA" : "CPU");
        if (preference.want_nvidia) {
            LOG_KV("Portable", preference.want_portable ? "yes" : "no");
        }
    }
    return preference;
}

AssetResolution Installer::resolveAsset(InstallPlan& plan, const ReleaseManifest& manifest) {
    plan.selected_filename = AssetSelector::selectFilename(plan.platform, plan.preference, config_.app_name);
    if (!plan.selected_filename) {
        throw InstallError("Could not determine a release filename for this platform.");
    }

    plan.asset = AssetSelector::resolve(plan.platform, plan.preference, manifest, config_.app_name);
    if (!plan.asset.ok()) {
        throw InstallError("Could not find download URL for asset: " + joinNames(plan.asset.tried) +
                           " (no downloadable asset for this platform/variant)");
    }

    LOG_STEP("Selected asset: " + plan.asset.asset.filename + " (" +
             assetVariantToString(plan.asset.variant) + ")");
    return plan.asset;
}

void Installer::reportEmbeddedAssets(const ReleaseManifest& manifest) {
    auto embedded = manifest.embeddedAssetNames();
    if (embedded.empty()) {
        LOG_WARN("No embedded assets detected in the release metadata. Will try best-effort selection.");
        return;
    }
    LOG_STEP("Embedded assets available in this release:");
    for (const auto& name : embedded) {
        LOG_INFO("  - " + name);
    }
}

std::optional<ValidationOutcome> Installer::verifyGpuRuntime(const InstallPlan& plan,
                                                             const std::string& bin_dir,
                                                             RemediationResult& remediation) {
    if (!plan.platform.isLinuxAmd64() || !plan.preference.want_nvidia) {
        return std::nullopt;
    }

    RuntimeDependencyValidator validator(system_);
    std::string library = validator.locateNativeLibrary(bin_dir);
    ValidationOutcome outcome = validator.validate(library);

    if (outcome.status == ValidationOutcome::Status::RESOLVABLE) {
        if (plan.capabilities.cuda_major_version) {
            LOG_SUCCESS("CUDA runtime detected (CUDA " +
                        std::to_string(*plan.capabilities.cuda_major_version) +
                        ".x and required libs present).");
        } else {
            LOG_SUCCESS("CUDA runtime detected (required libs present).");
        }
        return outcome;
    }

    LOG_WARN("NVIDIA build selected but the CUDA runtime libraries it needs were not found "
             "in the system loader paths.");
    for (const auto& lib : outcome.missing_libs) {
        LOG_WARN("Missing CUDA runtime library: " + lib);
    }

    RemediationSettings settings;
    settings.bundle_url = config_.cuda_bundle_url;
    settings.target_lib_dir = config_.resolvedCudaLibDir();
    settings.skip = config_.skip_cuda_libs;

    RemediationPlan fix = RemediationPlanner::plan(outcome, settings);
    if (fix.action == RemediationPlan::Action::INSTALL_BUNDLE) {
        LOG_WARN("Downloading CUDA runtime bundle and configuring LD_LIBRARY_PATH...");
    }

    RemediationPlanner planner(system_);
    remediation = planner.execute(fix);
    if (!remediation.ok) {
        LOG_ERROR("CUDA runtime installation failed: " + remediation.error);
        LOG_WARN("The application is installed but GPU acceleration will not work "
                 "until the CUDA 12 runtime is available.");
    }
    return outcome;
}

bool Installer::shouldDownloadModel() {
    if (config_.download_model == Override::NO) {
        return false;
    }
    if (config_.download_model == Override::YES) {
        return true;
    }
    if (!prompter_) {
        return true;
    }
    return prompter_->askYesNo("Do you want to download the GGUF embedding model (~260MB)?", true);
}

InstallPlan Installer::detect() {
    InstallPlan plan;

    progress_.step("Detecting platform");
    plan.platform = identifyPlatform();

    progress_.step("Detecting CPU/GPU capabilities");
    plan.capabilities = probeCapabilities(plan.platform);

    progress_.step("Choosing build (wizard)");
    plan.preference = choosePreference(plan.platform, plan.capabilities);
    plan.selected_filename =
        AssetSelector::selectFilename(plan.platform, plan.preference, config_.app_name);
    if (plan.selected_filename) {
        LOG_KV("Asset", *plan.selected_filename);
    }
    return plan;
}

InstallReport Installer::run() {
    InstallReport report;
    InstallPlan& plan = report.plan;

    if (config_.home.empty()) {
        throw InstallError("HOME is not set; cannot determine installation directories.");
    }

    progress_.step("Detecting platform");
    plan.platform = identifyPlatform();

    progress_.step("Fetching latest release metadata");
    ReleaseClient client(system_, config_.repository);
    ReleaseManifest manifest = client.fetch(config_.version);
    report.version = manifest.tag;
    LOG_SUCCESS("Selected release: " + manifest.tag);
    reportEmbeddedAssets(manifest);

    progress_.step("Detecting CPU/GPU capabilities");
    plan.capabilities = probeCapabilities(plan.platform);

    progress_.step("Choosing build (wizard)");
    plan.preference = choosePreference(plan.platform, plan.capabilities);

    progress_.step("Preparing install directories");
    report.layout = InstallLayout::forPlatform(plan.platform.os, config_.home, config_.install_prefix);
    resolveAsset(plan, manifest);

    progress_.step("Downloading & extracting release");
    TempDir download_dir("remembrances-release");
    std::string archive = (download_dir.path() / "release.zip").string();

    LOG_STEP("Downloading release...");
    Downloader downloader(system_);
    if (!downloader.downloadFile(plan.asset.asset.download_url, archive)) {
        throw InstallError("Failed to download " + plan.asset.asset.download_url);
    }
    LOG_SUCCESS("Download complete");

    LOG_STEP("Extracting files...");
    ArchiveExtractor extractor(system_);
    if (!extractor.extractZip(archive, download_dir.path().string())) {
        throw InstallError("Failed to extract " + plan.asset.asset.filename);
    }
    std::string extracted = ArchiveExtractor::extractedRoot(download_dir.path().string());

    progress_.step("Installing files");
    FileInstaller installer(report.layout, config_.app_name);
    report.binary_path = installer.install(extracted).binary_path;

    report.validation = verifyGpuRuntime(plan, report.layout.bin_dir, report.remediation);

    progress_.step("Creating configuration");
    ConfigWriter writer(report.layout);
    report.config_path = writer.write(AppConfigValues::forLayout(report.layout, config_.model_name));

    progress_.step("Optional: downloading GGUF model");
    if (shouldDownloadModel()) {
        ModelDownloader models(system_);
        report.model_ready = models.ensure({config_.model_name, config_.model_url},
                                           report.layout.models_dir);
    } else {
        LOG_WARN("Skipping GGUF model download; download it later manually or "
                 "configure Ollama/OpenAI instead");
    }

    progress_.step("Finalizing shell setup");
    ShellEnvironment env;
    env.home = config_.home;
    env.shell = system_->getEnv("SHELL").value_or("");
    env.os = plan.platform.os;
    ShellSetup shell(env);
    shell.apply(report.layout.bin_dir, report.remediation.needs_loader_path,
                report.remediation.target_lib_dir);

    return report;
}

void Installer::printSummary(const InstallReport& report, const InstallerConfig& config) {
    const InstallLayout& layout = report.layout;

    std::cout << "\n=== Remembrances-MCP Installation Complete! ===\n" << std::endl;
    std::cout << "Version installed:      " << report.version << std::endl;
    std::cout << "Installation directory: " << layout.install_dir << std::endl;
    std::cout << "Binary & libraries:     " << layout.bin_dir << "/" << std::endl;
    if (report.remediation.needs_loader_path) {
        std::cout << "CUDA runtime libs:      " << report.remediation.target_lib_dir
                  << " (added to LD_LIBRARY_PATH)" << std::endl;
    }
    std::cout << "Configuration file:     " << report.config_path << std::endl;
    std::cout << "Database location:      " << layout.data_dir << "/remembrances.db" << std::endl;
    std::cout << "GGUF model:             " << layout.models_dir << "/" << config.model_name << std::endl;

    std::cout << "\nTo complete the installation, run one of the following:\n\n"
              << "  source ~/.bashrc     # If using bash\n"
              << "  source ~/.zshrc      # If using zsh\n\n"
              << "Or simply open a new terminal window.\n\n"
              << "To verify the installation:\n\n"
              << "  " << config.app_name << " --help\n" << std::endl;

    if (report.plan.platform.os == Os::DARWIN) {
        std::cout << "Add to ~/Library/Application Support/Claude/claude_desktop_config.json:" << std::endl;
    } else {
        std::cout << "Add to your MCP client configuration:" << std::endl;
    }

    nlohmann::json snippet = {
        {"mcpServers", {
            {"remembrances", {
                {"command", layout.bin_dir + "/" + config.app_name}
            }}
        }}
    };
    std::cout << "\n" << snippet.dump(2) << "\n" << std::endl;

    std::cout << "For GPU acceleration (if available):\n"
              << "Edit " << report.config_path << " and set gguf-gpu-layers to a positive value\n"
              << "\nDocumentation: https://github.com/" << config.repository << "\n" << std::endl;
}

}
