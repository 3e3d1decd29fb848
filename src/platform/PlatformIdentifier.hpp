#pragma once

#include "platform/SystemProbe.hpp"
#include <string>

namespace remembrances {

enum class Os {
    LINUX,
    DARWIN,
    UNSUPPORTED
};

enum class Arch {
    AMD64,
    AARCH64,
    UNSUPPORTED
};

inline std::string osToString(Os os) {
    switch (os) {
        case Os::LINUX: return "linux";
        case Os::DARWIN: return "darwin";
        default: return "unsupported";
    }
}

inline std::string archToString(Arch arch) {
    switch (arch) {
        case Arch::AMD64: return "amd64";
        case Arch::AARCH64: return "aarch64";
        default: return "unsupported";
    }
}

struct PlatformTuple {
    Os os = Os::UNSUPPORTED;
    Arch arch = Arch::UNSUPPORTED;

    // uname values as reported, kept for messages
    std::string raw_os;
    std::string raw_arch;

    bool isLinuxAmd64() const { return os == Os::LINUX && arch == Arch::AMD64; }
    bool isDarwinAarch64() const { return os == Os::DARWIN && arch == Arch::AARCH64; }
};

class PlatformIdentifier {
public:
    static Os parseOs(const std::string& raw_os);
    static Arch parseArch(const std::string& raw_arch);

    static PlatformTuple identify(const std::string& raw_os, const std::string& raw_arch);
    static PlatformTuple identifyHost(SystemProbe& system);

    // Only (linux, amd64) and (darwin, aarch64) can be installed.
    static bool isSupported(const PlatformTuple& tuple);

    // User-facing reason the tuple cannot be installed; empty if supported.
    static std::string rejectionReason(const PlatformTuple& tuple);

private:
    PlatformIdentifier() = delete;
};

}
