#include "install/ShellSetup.hpp"
#include "utils/Logger.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace remembrances {

namespace {

std::string readAll(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return "";
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

bool hasLoaderPathFor(const std::string& content, const std::string& lib_dir) {
    std::istringstream iss(content);
    std::string line;
    while (std::getline(iss, line)) {
        if (line.find("LD_LIBRARY_PATH=") != std::string::npos &&
            line.find(lib_dir) != std::string::npos) {
            return true;
        }
    }
    return false;
}

}

ShellSetup::ShellSetup(ShellEnvironment env)
    : env_(std::move(env)) {
}

std::vector<std::string> ShellSetup::shellConfigFiles() const {
    std::vector<std::string> files;
    std::error_code ec;

    const std::string bashrc = env_.home + "/.bashrc";
    const std::string zshrc = env_.home + "/.zshrc";
    const std::string bash_profile = env_.home + "/.bash_profile";

    if (fs::exists(bashrc, ec) || !fs::exists(zshrc, ec)) {
        files.push_back(bashrc);
    }
    if (fs::exists(zshrc, ec) || env_.shell == "/bin/zsh" || env_.shell == "/usr/bin/zsh") {
        files.push_back(zshrc);
    }
    if (env_.os == Os::DARWIN && fs::exists(bash_profile, ec)) {
        files.push_back(bash_profile);
    }
    return files;
}

std::string ShellSetup::pathLine(const std::string& bin_dir) {
    return "export PATH=\"$PATH:" + bin_dir + "\"";
}

std::string ShellSetup::loaderPathLine(const std::string& lib_dir) {
    return "export LD_LIBRARY_PATH=\"" + lib_dir + ":${LD_LIBRARY_PATH:-}\"";
}

std::vector<std::string> ShellSetup::apply(const std::string& bin_dir,
                                           bool needs_loader_path,
                                           const std::string& lib_dir) {
    LOG_STEP("Setting up PATH...");
    std::vector<std::string> changed;

    for (const auto& config : shellConfigFiles()) {
        std::string content = readAll(config);
        std::ostringstream additions;

        if (content.find(bin_dir) == std::string::npos) {
            additions << "\n# Remembrances-MCP\n" << pathLine(bin_dir) << "\n";
            LOG_SUCCESS("Added to " + config);
        } else {
            LOG_WARN("PATH already configured in " + config);
        }

        if (needs_loader_path) {
            if (!hasLoaderPathFor(content, lib_dir)) {
                additions << loaderPathLine(lib_dir) << "\n";
                LOG_SUCCESS("Added LD_LIBRARY_PATH to " + config);
            } else {
                LOG_WARN("LD_LIBRARY_PATH already configured in " + config);
            }
        }

        std::string text = additions.str();
        if (text.empty()) {
            continue;
        }

        std::ofstream out(config, std::ios::app);
        if (!out.is_open()) {
            LOG_ERROR("Cannot write " + config + ", add manually: " + pathLine(bin_dir));
            continue;
        }
        out << text;
        changed.push_back(config);
    }

    return changed;
}

}
