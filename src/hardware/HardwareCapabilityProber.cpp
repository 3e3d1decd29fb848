#include "hardware/HardwareCapabilityProber.hpp"
#include "utils/Logger.hpp"
#include "utils/StringUtils.hpp"

#include <cctype>

namespace remembrances {

HardwareCapabilityProber::HardwareCapabilityProber(SystemProbePtr system)
    : system_(system)
    , linker_cache_(system) {
}

ProbeChain<bool> HardwareCapabilityProber::gpuChain() {
    ProbeChain<bool> chain("nvidia-gpu");

    // A driver that is installed but not loaded makes nvidia-smi fail;
    // that counts as no GPU.
    chain.add("nvidia-smi", [this]() -> std::optional<bool> {
        if (!system_->commandExists(kGpuTool)) {
            return false;
        }
        return runGpuTool().ok();
    });

    return chain;
}

ProbeChain<int> HardwareCapabilityProber::cudaVersionChain() {
    ProbeChain<int> chain("cuda-major-version");

    chain.add("nvidia-smi", [this]() -> std::optional<int> {
        if (!system_->commandExists(kGpuTool)) {
            return std::nullopt;
        }
        CommandResult result = runGpuTool();
        if (!result.started) {
            return std::nullopt;
        }
        return parseCudaVersion(result.output);
    });

    chain.add("ldconfig", [this]() -> std::optional<int> {
        auto found = linker_cache_.contains(kCudaRuntimeSoname);
        if (found && *found) {
            return 12;
        }
        return std::nullopt;
    });

    chain.add("well-known-paths", [this]() -> std::optional<int> {
        if (system_->fileExists("/usr/local/cuda/lib64/libcudart.so.12") ||
            system_->fileExists("/usr/local/cuda/lib64/libcudart.so.12.0")) {
            return 12;
        }
        return std::nullopt;
    });

    return chain;
}

ProbeChain<bool> HardwareCapabilityProber::cpuFlagChain(const std::string& flag) {
    ProbeChain<bool> chain("cpu-flag-" + flag);

    chain.add("cpuinfo", [this, flag]() -> std::optional<bool> {
        auto cpuinfo = readCpuInfo();
        if (!cpuinfo) {
            return std::nullopt;
        }
        return cpuinfoHasFlag(*cpuinfo, flag);
    });

    return chain;
}

std::optional<std::string> HardwareCapabilityProber::readCpuInfo() {
    if (!cpuinfo_read_) {
        cpuinfo_ = system_->readFile(kCpuInfoPath);
        cpuinfo_read_ = true;
        if (!cpuinfo_) {
            LOG_WARN(std::string(kCpuInfoPath) + " not readable, assuming no AVX2/AVX-512");
        }
    }
    return cpuinfo_;
}

CommandResult HardwareCapabilityProber::runGpuTool() {
    if (!gpu_tool_result_) {
        gpu_tool_result_ = system_->run({kGpuTool});
    }
    return *gpu_tool_result_;
}

bool HardwareCapabilityProber::hasNvidiaGpu() {
    auto outcome = gpuChain().resolve();
    LOG_DEBUG("NVIDIA GPU: " + triStateToString(toTriState(outcome.value)) +
              (outcome.decided_by.empty() ? "" : " via " + outcome.decided_by));
    return outcome.value.value_or(false);
}

std::optional<int> HardwareCapabilityProber::cudaMajorVersion() {
    auto outcome = cudaVersionChain().resolve();
    if (outcome.value) {
        LOG_DEBUG("CUDA " + std::to_string(*outcome.value) + " detected via " + outcome.decided_by);
    }
    return outcome.value;
}

bool HardwareCapabilityProber::hasCpuFlag(const std::string& flag) {
    auto outcome = cpuFlagChain(flag).resolve();
    LOG_DEBUG("CPU flag " + flag + ": " + triStateToString(toTriState(outcome.value)));
    return outcome.value.value_or(false);
}

CapabilityProfile HardwareCapabilityProber::probe(const PlatformTuple& tuple) {
    CapabilityProfile profile;

    if (!tuple.isLinuxAmd64()) {
        LOG_DEBUG("Skipping capability probing on " + osToString(tuple.os) + "/" +
                  archToString(tuple.arch));
        return profile;
    }

    profile.probed = true;
    profile.has_nvidia_gpu = hasNvidiaGpu();
    profile.cuda_major_version = cudaMajorVersion();
    if (!profile.cuda_major_version) {
        LOG_WARN("CUDA version unknown/not found");
    }
    profile.has_avx2 = hasCpuFlag("avx2");
    profile.has_avx512 = hasCpuFlag("avx512f");

    return profile;
}

std::optional<int> HardwareCapabilityProber::parseCudaVersion(const std::string& smi_output) {
    const std::string marker = "CUDA Version:";

    for (const auto& line : splitLines(smi_output)) {
        size_t pos = line.find(marker);
        if (pos == std::string::npos) {
            continue;
        }

        // Only the first "CUDA Version" line counts
        size_t i = pos + marker.size();
        while (i < line.size() && std::isspace(static_cast<unsigned char>(line[i]))) {
            ++i;
        }
        size_t start = i;
        while (i < line.size() && std::isdigit(static_cast<unsigned char>(line[i]))) {
            ++i;
        }
        if (i == start || i - start > 4 || i >= line.size() || line[i] != '.') {
            return std::nullopt;
        }
        return std::stoi(line.substr(start, i - start));
    }
    return std::nullopt;
}

bool HardwareCapabilityProber::cpuinfoHasFlag(const std::string& cpuinfo, const std::string& flag) {
    const std::string wanted = toLower(flag);

    for (const auto& raw : splitLines(cpuinfo)) {
        std::string line = toLower(raw);
        if (!startsWith(line, "flags")) {
            continue;
        }
        size_t colon = line.find(':');
        if (colon == std::string::npos) {
            continue;
        }
        if (containsToken(line.substr(colon + 1), wanted)) {
            return true;
        }
    }
    return false;
}

void HardwareCapabilityProber::printCapabilities(const PlatformTuple& tuple,
                                                 const CapabilityProfile& profile) {
    LOG_STEP("Detected capabilities:");
    LOG_KV("NVIDIA GPU", profile.has_nvidia_gpu ? "true" : "false");
    if (profile.cuda_major_version) {
        LOG_KV("CUDA version", std::to_string(*profile.cuda_major_version) + ".x (detected)");
    } else {
        LOG_KV("CUDA version", "unknown/not found");
    }
    if (tuple.os == Os::LINUX) {
        LOG_KV("AVX2", profile.has_avx2 ? "true" : "false");
        LOG_KV("AVX-512", profile.has_avx512 ? "true" : "false");
    }
}

}
