#include "platform/LocalSystem.hpp"
#include "utils/Logger.hpp"
#include "utils/StringUtils.hpp"

#include <sys/utsname.h>
#include <sys/wait.h>
#include <unistd.h>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace remembrances {

namespace {

int decodeStatus(int status) {
    if (status == -1) {
        return -1;
    }
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    return 128 + (WIFSIGNALED(status) ? WTERMSIG(status) : 0);
}

}

UnameInfo LocalSystem::uname() {
    UnameInfo info;
    struct utsname buf;
    if (::uname(&buf) == 0) {
        info.sysname = buf.sysname;
        info.machine = buf.machine;
    } else {
        LOG_WARN("uname() failed, platform will be reported as unsupported");
    }
    return info;
}

CommandResult LocalSystem::run(const std::vector<std::string>& argv) {
    CommandResult result;
    if (argv.empty()) {
        return result;
    }

    std::string command = joinCommand(argv) + " 2>/dev/null";
    LOG_DEBUG("exec: " + command);

    FILE* pipe = popen(command.c_str(), "r");
    if (!pipe) {
        return result;
    }

    char buffer[4096];
    size_t n = 0;
    while ((n = fread(buffer, 1, sizeof(buffer), pipe)) > 0) {
        result.output.append(buffer, n);
    }

    result.started = true;
    result.exit_code = decodeStatus(pclose(pipe));
    // 127 is what /bin/sh reports when the program itself is missing
    if (result.exit_code == 127) {
        result.started = false;
    }
    return result;
}

int LocalSystem::runAttached(const std::vector<std::string>& argv) {
    if (argv.empty()) {
        return -1;
    }

    std::string command = joinCommand(argv);
    LOG_DEBUG("exec: " + command);

    std::fflush(stdout);
    return decodeStatus(std::system(command.c_str()));
}

bool LocalSystem::commandExists(const std::string& name) {
    if (name.find('/') != std::string::npos) {
        return access(name.c_str(), X_OK) == 0;
    }

    const char* path_env = std::getenv("PATH");
    if (!path_env) {
        return false;
    }

    std::stringstream ss(path_env);
    std::string dir;
    while (std::getline(ss, dir, ':')) {
        if (dir.empty()) {
            dir = ".";
        }
        std::string candidate = dir + "/" + name;
        std::error_code ec;
        if (fs::is_regular_file(candidate, ec) && access(candidate.c_str(), X_OK) == 0) {
            return true;
        }
    }
    return false;
}

bool LocalSystem::fileExists(const std::string& path) {
    std::error_code ec;
    return fs::exists(path, ec);
}

std::optional<std::string> LocalSystem::readFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::nullopt;
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

std::vector<std::string> LocalSystem::listDirectory(const std::string& path) {
    std::vector<std::string> names;
    std::error_code ec;
    fs::directory_iterator it(path, ec);
    if (ec) {
        return names;
    }
    for (const auto& entry : it) {
        names.push_back(entry.path().filename().string());
    }
    return names;
}

std::optional<std::string> LocalSystem::getEnv(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    if (!value) {
        return std::nullopt;
    }
    return std::string(value);
}

bool LocalSystem::stdinIsTerminal() {
    return isatty(STDIN_FILENO) == 1;
}

}
