#include "runtime/RemediationPlanner.hpp"
#include "install/ArchiveExtractor.hpp"
#include "install/Downloader.hpp"
#include "utils/InstallError.hpp"
#include "utils/Logger.hpp"
#include "utils/StringUtils.hpp"
#include "utils/TempDir.hpp"

#include <filesystem>

namespace fs = std::filesystem;

namespace remembrances {

RemediationPlanner::RemediationPlanner(SystemProbePtr system)
    : system_(std::move(system)) {
}

RemediationPlan RemediationPlanner::plan(const ValidationOutcome& outcome,
                                         const RemediationSettings& settings) {
    RemediationPlan plan;
    plan.bundle_url = settings.bundle_url;
    plan.target_lib_dir = settings.target_lib_dir;

    if (outcome.status != ValidationOutcome::Status::UNRESOLVABLE_MISSING_LIBS) {
        return plan;
    }

    plan.missing_libs = outcome.missing_libs;
    plan.action = settings.skip ? RemediationPlan::Action::SKIPPED
                                : RemediationPlan::Action::INSTALL_BUNDLE;
    return plan;
}

bool RemediationPlanner::isSharedObjectName(const std::string& filename) {
    return endsWith(filename, ".so") || filename.find(".so.") != std::string::npos;
}

int RemediationPlanner::copySharedObjects(const std::string& source_dir, const std::string& target_dir) {
    int copied = 0;
    std::error_code ec;
    fs::recursive_directory_iterator it(source_dir, ec), end;
    if (ec) {
        LOG_WARN("Cannot read " + source_dir + ": " + ec.message());
        return 0;
    }

    for (; it != end; it.increment(ec)) {
        if (ec) {
            LOG_WARN("Error while scanning " + source_dir + ": " + ec.message());
            break;
        }
        if (!it->is_regular_file(ec)) {
            continue;
        }
        std::string name = it->path().filename().string();
        if (!isSharedObjectName(name)) {
            continue;
        }

        std::error_code copy_ec;
        fs::copy_file(it->path(), fs::path(target_dir) / name,
                      fs::copy_options::overwrite_existing, copy_ec);
        if (copy_ec) {
            LOG_WARN("Failed to copy " + name + ": " + copy_ec.message());
            continue;
        }
        ++copied;
    }
    return copied;
}

RemediationResult RemediationPlanner::execute(const RemediationPlan& plan) {
    RemediationResult result;
    result.target_lib_dir = plan.target_lib_dir;

    if (plan.action == RemediationPlan::Action::NONE) {
        return result;
    }
    if (plan.action == RemediationPlan::Action::SKIPPED) {
        LOG_WARN("Skipping CUDA runtime libs download (REMEMBRANCES_SKIP_CUDA_LIBS=yes)");
        return result;
    }

    // Without tar the bundle can never be unpacked; that ends the install
    if (!system_->commandExists("tar")) {
        throw InstallError("tar is required to install CUDA libraries (tar.xz). Please install tar.");
    }

    try {
        std::error_code ec;
        fs::create_directories(plan.target_lib_dir, ec);
        if (ec) {
            throw InstallError("Cannot create " + plan.target_lib_dir + ": " + ec.message());
        }

        TempDir temp("remembrances-cuda");
        std::string archive = (temp.path() / kBundleArchiveName).string();

        LOG_STEP("Downloading CUDA runtime libraries (CUDA 12+) ...");
        Downloader downloader(system_);
        if (!downloader.downloadFile(plan.bundle_url, archive)) {
            throw InstallError("Failed to download CUDA runtime bundle from " + plan.bundle_url);
        }

        LOG_STEP("Extracting CUDA runtime libraries...");
        ArchiveExtractor extractor(system_);
        if (!extractor.extractTarXz(archive, temp.path().string())) {
            throw InstallError("Failed to extract " + archive);
        }

        result.copied = copySharedObjects(temp.path().string(), plan.target_lib_dir);
    } catch (const InstallError& e) {
        result.ok = false;
        result.error = e.what();
        return result;
    } catch (const fs::filesystem_error& e) {
        result.ok = false;
        result.error = e.what();
        return result;
    }

    if (result.copied > 0) {
        LOG_SUCCESS("Installed " + std::to_string(result.copied) + " CUDA libraries to " +
                    plan.target_lib_dir);
        result.needs_loader_path = true;
    } else {
        LOG_WARN("No .so CUDA libraries found in the archive; the bundle format may have changed");
    }
    return result;
}

}
