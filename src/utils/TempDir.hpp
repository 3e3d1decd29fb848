#pragma once

#include <filesystem>
#include <string>

namespace remembrances {

// Owns a freshly created directory under the system temp path and removes it
// (recursively) on destruction.
class TempDir {
public:
    explicit TempDir(const std::string& name_prefix = "remembrances");
    ~TempDir();

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

}
