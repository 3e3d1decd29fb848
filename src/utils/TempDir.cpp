#include "utils/TempDir.hpp"
#include "utils/InstallError.hpp"
#include "utils/Logger.hpp"

#include <stdlib.h>
#include <vector>

namespace fs = std::filesystem;

namespace remembrances {

TempDir::TempDir(const std::string& name_prefix) {
    std::string pattern = (fs::temp_directory_path() / (name_prefix + ".XXXXXX")).string();
    std::vector<char> buffer(pattern.begin(), pattern.end());
    buffer.push_back('\0');

    if (mkdtemp(buffer.data()) == nullptr) {
        throw InstallError("Failed to create temporary directory from " + pattern);
    }
    path_ = buffer.data();
}

TempDir::~TempDir() {
    std::error_code ec;
    fs::remove_all(path_, ec);
    if (ec) {
        LOG_WARN("Could not remove temporary directory " + path_.string() + ": " + ec.message());
    }
}

}
