#pragma once

#include "platform/SystemProbe.hpp"
#include "runtime/RuntimeDependencyValidator.hpp"

#include <string>

namespace remembrances {

struct RemediationSettings {
    std::string bundle_url;
    std::string target_lib_dir;     // e.g. ~/.local/lib
    bool skip = false;
};

struct RemediationPlan {
    enum class Action {
        NONE,
        SKIPPED,
        INSTALL_BUNDLE
    };

    Action action = Action::NONE;
    std::string bundle_url;
    std::string target_lib_dir;
    std::vector<std::string> missing_libs;
};

struct RemediationResult {
    bool ok = true;
    int copied = 0;
    // The loader search path must include target_lib_dir for future launches
    bool needs_loader_path = false;
    std::string target_lib_dir;
    std::string error;
};

class RemediationPlanner {
public:
    explicit RemediationPlanner(SystemProbePtr system);

    static RemediationPlan plan(const ValidationOutcome& outcome, const RemediationSettings& settings);

    // Downloads and unpacks the runtime bundle and copies every *.so / *.so.*
    // it contains into the target directory. Download and extraction
    // failures are reported in the result; the installed application is
    // left untouched. Throws InstallError when tar is not installed.
    RemediationResult execute(const RemediationPlan& plan);

    // Copies shared objects found anywhere under `source_dir`; returns count.
    static int copySharedObjects(const std::string& source_dir, const std::string& target_dir);

    static bool isSharedObjectName(const std::string& filename);

    static constexpr const char* kBundleArchiveName = "cuda-libs-linux-x64.tar.xz";

private:
    SystemProbePtr system_;
};

}
