#include "pipeline/Installer.hpp"
#include "pipeline/InstallerConfig.hpp"
#include "platform/LocalSystem.hpp"
#include "utils/InstallError.hpp"
#include "utils/Logger.hpp"
#include "utils/Prompter.hpp"

#include <filesystem>
#include <iostream>
#include <memory>
#include <string>

using namespace remembrances;

void printUsage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n"
              << "\nOptions:\n"
              << "  -c, --config <file>          Installer config (default: config/installer.yaml if present)\n"
              << "      --version <tag>          Release to install: latest or vX.Y.Z\n"
              << "      --nvidia <yes|no>        Force NVIDIA or CPU-only build (Linux only)\n"
              << "      --portable <yes|no>      Force portable/non-portable NVIDIA build\n"
              << "      --download-model <yes|no> Download the GGUF embedding model\n"
              << "      --skip-cuda-libs         Never download the CUDA runtime bundle\n"
              << "  -d, --detect                 Print detected platform, capabilities and asset, then exit\n"
              << "  -v, --verbose                Debug logging\n"
              << "  -h, --help                   Show this help message\n"
              << "\nEnvironment (non-interactive installs):\n"
              << "  REMEMBRANCES_VERSION, REMEMBRANCES_NVIDIA, REMEMBRANCES_PORTABLE,\n"
              << "  REMEMBRANCES_DOWNLOAD_MODEL, REMEMBRANCES_SKIP_CUDA_LIBS\n"
              << std::endl;
}

bool parseYesNo(const std::string& flag, const std::string& value, Override& target) {
    Override parsed = parseOverride(value);
    if (parsed == Override::UNSET) {
        std::cerr << "Invalid value for " << flag << ": " << value << " (use yes or no)\n";
        return false;
    }
    target = parsed;
    return true;
}

int main(int argc, char** argv) {
    std::string config_file;
    std::string version;
    PreferenceOverrides cli_overrides;
    Override download_model = Override::UNSET;
    bool skip_cuda_libs = false;
    bool detect_only = false;
    bool verbose = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        }
        else if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            config_file = argv[++i];
        }
        else if (arg == "--version" && i + 1 < argc) {
            version = argv[++i];
        }
        else if (arg == "--nvidia" && i + 1 < argc) {
            if (!parseYesNo(arg, argv[++i], cli_overrides.nvidia)) return 1;
        }
        else if (arg == "--portable" && i + 1 < argc) {
            if (!parseYesNo(arg, argv[++i], cli_overrides.portable)) return 1;
        }
        else if (arg == "--download-model" && i + 1 < argc) {
            if (!parseYesNo(arg, argv[++i], download_model)) return 1;
        }
        else if (arg == "--skip-cuda-libs") {
            skip_cuda_libs = true;
        }
        else if (arg == "-d" || arg == "--detect") {
            detect_only = true;
        }
        else if (arg == "-v" || arg == "--verbose") {
            verbose = true;
        }
        else {
            std::cerr << "Unknown option: " << arg << "\n";
            printUsage(argv[0]);
            return 1;
        }
    }

    auto system = std::make_shared<LocalSystem>();

    try {
        if (config_file.empty()) {
            std::error_code ec;
            if (std::filesystem::exists("config/installer.yaml", ec)) {
                config_file = "config/installer.yaml";
            }
        }

        InstallerConfig config = config_file.empty() ? InstallerConfig()
                                                     : InstallerConfig::loadFile(config_file);
        config.applyEnvironment(*system);

        // Command line beats environment and file
        if (!version.empty()) config.version = version;
        if (cli_overrides.nvidia != Override::UNSET) config.overrides.nvidia = cli_overrides.nvidia;
        if (cli_overrides.portable != Override::UNSET) config.overrides.portable = cli_overrides.portable;
        if (download_model != Override::UNSET) config.download_model = download_model;
        if (skip_cuda_libs) config.skip_cuda_libs = true;

        Logger::instance().setLevel(verbose ? LogLevel::DEBUG : config.log_level);
        Logger::instance().setTimestamps(verbose);

        if (detect_only) {
            Installer installer(config, system, nullptr);
            installer.detect();
            return 0;
        }

        bool interactive = system->stdinIsTerminal();
        if (!interactive) {
            LOG_WARN("Running in non-interactive mode (piped input detected)");
            LOG_WARN("Using default values for all prompts");
            LOG_WARN("Set environment variables to customize: REMEMBRANCES_VERSION, "
                     "REMEMBRANCES_NVIDIA, REMEMBRANCES_PORTABLE, REMEMBRANCES_DOWNLOAD_MODEL");
        }
        auto prompter = std::make_shared<TerminalPrompter>(interactive, std::cin, std::cout);

        Installer installer(config, system, prompter);
        InstallReport report = installer.run();
        Installer::printSummary(report, config);
    } catch (const InstallError& e) {
        LOG_ERROR(e.what());
        return 1;
    } catch (const std::exception& e) {
        LOG_ERROR(std::string("Unexpected error: ") + e.what());
        return 1;
    }

    return 0;
}
