#include "runtime/LinkerCache.hpp"
#include "utils/Logger.hpp"
#include "utils/StringUtils.hpp"

namespace remembrances {

LinkerCache::LinkerCache(SystemProbePtr system)
    : system_(std::move(system)) {
}

std::string LinkerCache::findLdconfig() {
    if (system_->commandExists("ldconfig")) {
        return "ldconfig";
    }
    // Often outside an unprivileged user's PATH
    if (system_->fileExists("/sbin/ldconfig")) {
        return "/sbin/ldconfig";
    }
    return "";
}

std::optional<std::string> LinkerCache::listing() {
    if (cached_) {
        return cached_;
    }

    std::string ldconfig = findLdconfig();
    if (ldconfig.empty()) {
        LOG_DEBUG("ldconfig not found, linker cache unavailable");
        return std::nullopt;
    }

    CommandResult result = system_->run({ldconfig, "-p"});
    if (!result.ok()) {
        LOG_DEBUG("ldconfig -p failed (exit " + std::to_string(result.exit_code) + ")");
        return std::nullopt;
    }

    cached_ = result.output;
    return cached_;
}

std::optional<bool> LinkerCache::contains(const std::string& soname) {
    auto text = listing();
    if (!text) {
        return std::nullopt;
    }
    return listingContains(*text, soname);
}

bool LinkerCache::listingContains(const std::string& listing, const std::string& soname) {
    return containsToken(listing, soname);
}

}
