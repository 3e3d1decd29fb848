#pragma once

#include "platform/PlatformIdentifier.hpp"
#include <string>

namespace remembrances {

// Where the application, its config and its data live.
struct InstallLayout {
    std::string install_dir;
    std::string config_dir;
    std::string data_dir;
    std::string bin_dir;        // binary and bundled shared libraries
    std::string models_dir;

    // Linux: ~/.local/share/remembrances + ~/.config/remembrances
    // macOS: ~/Library/Application Support/remembrances for everything
    // A non-empty `prefix` replaces install_dir and data_dir.
    static InstallLayout forPlatform(Os os, const std::string& home, const std::string& prefix = "");
};

}
