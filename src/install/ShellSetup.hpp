#pragma once

#include "platform/PlatformIdentifier.hpp"
#include <string>
#include <vector>

namespace remembrances {

struct ShellEnvironment {
    std::string home;
    std::string shell;      // $SHELL
    Os os = Os::LINUX;
};

// Makes the install discoverable from new shells: PATH for the binary and,
// when runtime libraries were added, LD_LIBRARY_PATH for their directory.
class ShellSetup {
public:
    explicit ShellSetup(ShellEnvironment env);

    // ~/.bashrc unless only ~/.zshrc exists; ~/.zshrc when present or zsh
    // is the login shell; ~/.bash_profile on macOS when present.
    std::vector<std::string> shellConfigFiles() const;

    static std::string pathLine(const std::string& bin_dir);
    static std::string loaderPathLine(const std::string& lib_dir);

    // Appends the missing lines to every config file; returns the files that
    // changed. Existing entries are left alone.
    std::vector<std::string> apply(const std::string& bin_dir,
                                   bool needs_loader_path,
                                   const std::string& lib_dir);

private:
    ShellEnvironment env_;
};

}
