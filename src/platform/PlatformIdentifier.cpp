#include "platform/PlatformIdentifier.hpp"
#include "utils/StringUtils.hpp"

namespace remembrances {

Os PlatformIdentifier::parseOs(const std::string& raw_os) {
    std::string os = toLower(trim(raw_os));
    if (startsWith(os, "linux")) {
        return Os::LINUX;
    }
    if (startsWith(os, "darwin")) {
        return Os::DARWIN;
    }
    return Os::UNSUPPORTED;
}

Arch PlatformIdentifier::parseArch(const std::string& raw_arch) {
    std::string arch = toLower(trim(raw_arch));
    if (arch == "x86_64" || arch == "amd64") {
        return Arch::AMD64;
    }
    if (arch == "arm64" || arch == "aarch64") {
        return Arch::AARCH64;
    }
    return Arch::UNSUPPORTED;
}

PlatformTuple PlatformIdentifier::identify(const std::string& raw_os, const std::string& raw_arch) {
    PlatformTuple tuple;
    tuple.os = parseOs(raw_os);
    tuple.arch = parseArch(raw_arch);
    tuple.raw_os = raw_os;
    tuple.raw_arch = raw_arch;
    return tuple;
}

PlatformTuple PlatformIdentifier::identifyHost(SystemProbe& system) {
    UnameInfo info = system.uname();
    return identify(info.sysname, info.machine);
}

bool PlatformIdentifier::isSupported(const PlatformTuple& tuple) {
    return tuple.isLinuxAmd64() || tuple.isDarwinAarch64();
}

std::string PlatformIdentifier::rejectionReason(const PlatformTuple& tuple) {
    if (tuple.os == Os::UNSUPPORTED) {
        return "Unsupported operating system: " + tuple.raw_os +
               ". This installer supports Linux and macOS only.";
    }
    if (tuple.arch == Arch::UNSUPPORTED) {
        return "Unsupported architecture: " + tuple.raw_arch +
               ". This installer supports amd64 and aarch64/arm64 only.";
    }
    if (tuple.os == Os::DARWIN && tuple.arch != Arch::AARCH64) {
        return "Unsupported macOS architecture: " + tuple.raw_arch +
               ". Only Apple Silicon (aarch64/arm64) is supported.";
    }
    if (tuple.os == Os::LINUX && tuple.arch != Arch::AMD64) {
        return "Unsupported Linux architecture: " + tuple.raw_arch +
               ". Only x86_64 (amd64) is supported.";
    }
    return "";
}

}
