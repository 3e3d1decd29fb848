#include "install/InstallLayout.hpp"

namespace remembrances {

InstallLayout InstallLayout::forPlatform(Os os, const std::string& home, const std::string& prefix) {
    InstallLayout layout;

    if (os == Os::DARWIN) {
        std::string base = home + "/Library/Application Support/remembrances";
        layout.install_dir = base;
        layout.config_dir = base;
        layout.data_dir = base;
    } else {
        layout.install_dir = home + "/.local/share/remembrances";
        layout.config_dir = home + "/.config/remembrances";
        layout.data_dir = home + "/.local/share/remembrances";
    }

    if (!prefix.empty()) {
        layout.install_dir = prefix;
        layout.data_dir = prefix;
    }

    layout.bin_dir = layout.install_dir + "/bin";
    layout.models_dir = layout.install_dir + "/models";
    return layout;
}

}
