#pragma once

#include "install/InstallLayout.hpp"
#include <string>

namespace remembrances {

struct FileInstallReport {
    std::string binary_path;        // installed binary
    std::string release_dir;        // directory the binary was found in
    int library_count = 0;
    int sample_config_count = 0;
};

// Copies an extracted release into the install layout.
class FileInstaller {
public:
    FileInstaller(InstallLayout layout, std::string app_name);

    // Binary at the top level of `src_dir`, else the first match found
    // recursively; empty if there is none.
    std::string findBinary(const std::string& src_dir) const;

    // Throws InstallError when the binary is missing or cannot be copied.
    FileInstallReport install(const std::string& src_dir);

    void createDirectories();

private:
    int copySharedLibraries(const std::string& release_dir);
    int copySampleConfigs(const std::string& src_dir, const std::string& release_dir);

    InstallLayout layout_;
    std::string app_name_;
};

}
