#pragma once

#include "hardware/ProbeChain.hpp"
#include "platform/PlatformIdentifier.hpp"
#include "platform/SystemProbe.hpp"
#include "runtime/LinkerCache.hpp"

#include <optional>
#include <string>

namespace remembrances {

struct CapabilityProfile {
    bool has_nvidia_gpu = false;
    std::optional<int> cuda_major_version;
    bool has_avx2 = false;
    bool has_avx512 = false;

    // false when the platform was not probed at all
    bool probed = false;
};

class HardwareCapabilityProber {
public:
    explicit HardwareCapabilityProber(SystemProbePtr system);

    // Probes only on (linux, amd64); every other tuple gets the empty
    // profile and no system query is made.
    CapabilityProfile probe(const PlatformTuple& tuple);

    // Individual facts (read-only, never throw)
    bool hasNvidiaGpu();
    std::optional<int> cudaMajorVersion();
    bool hasCpuFlag(const std::string& flag);

    // "CUDA Version: 12.2" -> 12
    static std::optional<int> parseCudaVersion(const std::string& smi_output);

    // Whole-word, case-insensitive match on the "flags" lines of /proc/cpuinfo
    static bool cpuinfoHasFlag(const std::string& cpuinfo, const std::string& flag);

    static void printCapabilities(const PlatformTuple& tuple, const CapabilityProfile& profile);

    static constexpr const char* kGpuTool = "nvidia-smi";
    static constexpr const char* kCpuInfoPath = "/proc/cpuinfo";
    static constexpr const char* kCudaRuntimeSoname = "libcudart.so.12";

private:
    ProbeChain<bool> gpuChain();
    ProbeChain<int> cudaVersionChain();
    ProbeChain<bool> cpuFlagChain(const std::string& flag);

    std::optional<std::string> readCpuInfo();

    // nvidia-smi output is read once and shared by the GPU and CUDA chains
    CommandResult runGpuTool();

    SystemProbePtr system_;
    LinkerCache linker_cache_;
    std::optional<std::string> cpuinfo_;
    bool cpuinfo_read_ = false;
    std::optional<CommandResult> gpu_tool_result_;
};

}
