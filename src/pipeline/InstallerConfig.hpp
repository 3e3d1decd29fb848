#pragma once

#include "platform/SystemProbe.hpp"
#include "release/VariantPreference.hpp"
#include "utils/Logger.hpp"

#include <string>

namespace remembrances {

struct InstallerConfig {
    std::string app_name = "remembrances-mcp";

    // Release source
    std::string repository = "madeindigio/remembrances-mcp";
    std::string version = "latest";

    // Variant overrides (REMEMBRANCES_NVIDIA / REMEMBRANCES_PORTABLE)
    PreferenceOverrides overrides;

    // CUDA runtime remediation
    std::string cuda_bundle_url =
        "https://github.com/madeindigio/remembrances-mcp/releases/download/v1.16.4/cuda-libs-linux-x64.tar.xz";
    std::string cuda_lib_dir;           // empty = $HOME/.local/lib
    bool skip_cuda_libs = false;

    // Embedding model
    std::string model_name = "nomic-embed-text-v1.5.Q4_K_M.gguf";
    std::string model_url =
        "https://huggingface.co/nomic-ai/nomic-embed-text-v1.5-GGUF/resolve/main/"
        "nomic-embed-text-v1.5.Q4_K_M.gguf?download=true";
    Override download_model = Override::UNSET;

    std::string install_prefix;         // empty = per-OS default
    std::string home;                   // empty = $HOME
    LogLevel log_level = LogLevel::INFO;

    // Values present in the YAML file replace the defaults. Throws
    // InstallError if the file cannot be parsed.
    static InstallerConfig loadFile(const std::string& path);

    // REMEMBRANCES_* variables and $HOME; environment beats the file.
    void applyEnvironment(SystemProbe& system);

    std::string resolvedCudaLibDir() const;
};

}
