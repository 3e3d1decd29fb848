#pragma once

#include "platform/SystemProbe.hpp"
#include <string>

namespace remembrances {

class ArchiveExtractor {
public:
    explicit ArchiveExtractor(SystemProbePtr system);

    // Both throw InstallError when the archive tool is missing and return
    // false when extraction itself fails.
    bool extractZip(const std::string& archive, const std::string& destination);
    bool extractTarXz(const std::string& archive, const std::string& destination);

    // First top-level directory under `extraction_dir`, or `extraction_dir`
    // itself when the archive had no top-level folder.
    static std::string extractedRoot(const std::string& extraction_dir);

private:
    SystemProbePtr system_;
};

}
