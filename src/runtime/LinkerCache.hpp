#pragma once

#include "platform/SystemProbe.hpp"
#include <optional>
#include <string>

namespace remembrances {

// Read access to the dynamic linker cache (`ldconfig -p`).
class LinkerCache {
public:
    explicit LinkerCache(SystemProbePtr system);

    // Listing text, or nullopt when ldconfig is unavailable or fails.
    // The first successful listing is reused.
    std::optional<std::string> listing();

    // Indeterminate (nullopt) when there is no listing to look in.
    std::optional<bool> contains(const std::string& soname);

    static bool listingContains(const std::string& listing, const std::string& soname);

private:
    std::string findLdconfig();

    SystemProbePtr system_;
    std::optional<std::string> cached_;
};

}
