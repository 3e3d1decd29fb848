#include "install/FileInstaller.hpp"
#include "utils/InstallError.hpp"
#include "utils/Logger.hpp"
#include "utils/StringUtils.hpp"

#include <filesystem>

namespace fs = std::filesystem;

namespace remembrances {

namespace {

bool isLibraryName(const std::string& name) {
    return endsWith(name, ".so") || name.find(".so.") != std::string::npos ||
           endsWith(name, ".dylib");
}

std::string findFileRecursive(const std::string& root, const std::string& name) {
    std::error_code ec;
    for (fs::recursive_directory_iterator it(root, ec), end; !ec && it != end; it.increment(ec)) {
        if (it->is_regular_file(ec) && it->path().filename() == name) {
            return it->path().string();
        }
    }
    return "";
}

}

FileInstaller::FileInstaller(InstallLayout layout, std::string app_name)
    : layout_(std::move(layout))
    , app_name_(std::move(app_name)) {
}

void FileInstaller::createDirectories() {
    for (const auto& dir : {layout_.bin_dir, layout_.config_dir, layout_.data_dir, layout_.models_dir}) {
        std::error_code ec;
        fs::create_directories(dir, ec);
        if (ec) {
            throw InstallError("Cannot create directory " + dir + ": " + ec.message());
        }
    }
}

std::string FileInstaller::findBinary(const std::string& src_dir) const {
    fs::path direct = fs::path(src_dir) / app_name_;
    std::error_code ec;
    if (fs::is_regular_file(direct, ec)) {
        return direct.string();
    }
    return findFileRecursive(src_dir, app_name_);
}

int FileInstaller::copySharedLibraries(const std::string& release_dir) {
    int count = 0;
    std::error_code ec;
    for (fs::directory_iterator it(release_dir, ec), end; !ec && it != end; it.increment(ec)) {
        if (!it->is_regular_file(ec)) {
            continue;
        }
        std::string name = it->path().filename().string();
        if (!isLibraryName(name)) {
            continue;
        }

        std::error_code copy_ec;
        fs::copy_file(it->path(), fs::path(layout_.bin_dir) / name,
                      fs::copy_options::overwrite_existing, copy_ec);
        if (copy_ec) {
            throw InstallError("Failed to copy " + name + ": " + copy_ec.message());
        }
        ++count;
    }
    return count;
}

int FileInstaller::copySampleConfigs(const std::string& src_dir, const std::string& release_dir) {
    int count = 0;
    for (const char* sample : {"config.sample.yaml", "config.sample.gguf.yaml"}) {
        std::string path = (fs::path(release_dir) / sample).string();
        std::error_code ec;
        if (!fs::is_regular_file(path, ec)) {
            path = findFileRecursive(src_dir, sample);
        }
        if (path.empty()) {
            continue;
        }

        std::error_code copy_ec;
        fs::copy_file(path, fs::path(layout_.config_dir) / sample,
                      fs::copy_options::overwrite_existing, copy_ec);
        if (copy_ec) {
            LOG_WARN("Could not copy " + std::string(sample) + ": " + copy_ec.message());
            continue;
        }
        ++count;
    }
    return count;
}

FileInstallReport FileInstaller::install(const std::string& src_dir) {
    LOG_STEP("Installing to " + layout_.install_dir + "...");
    createDirectories();

    FileInstallReport report;
    std::string bin_path = findBinary(src_dir);
    if (bin_path.empty()) {
        LOG_WARN("Debug hint: extracted dir was: " + src_dir);
        throw InstallError("Binary not found in release");
    }

    report.release_dir = fs::path(bin_path).parent_path().string();
    LOG_STEP("Using release directory: " + report.release_dir);

    fs::path target = fs::path(layout_.bin_dir) / app_name_;
    std::error_code ec;
    fs::copy_file(bin_path, target, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        throw InstallError("Failed to install binary to " + target.string() + ": " + ec.message());
    }
    fs::permissions(target,
                    fs::perms::owner_exec | fs::perms::group_exec | fs::perms::others_exec,
                    fs::perm_options::add, ec);
    if (ec) {
        LOG_WARN("Could not mark " + target.string() + " executable: " + ec.message());
    }
    report.binary_path = target.string();
    LOG_SUCCESS("Binary installed to " + report.binary_path);

    // Libraries go next to the binary, which looks there first
    report.library_count = copySharedLibraries(report.release_dir);
    if (report.library_count > 0) {
        LOG_SUCCESS(std::to_string(report.library_count) + " shared libraries installed to " +
                    layout_.bin_dir + "/");
    }

    report.sample_config_count = copySampleConfigs(src_dir, report.release_dir);
    return report;
}

}
