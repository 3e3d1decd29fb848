#include "runtime/RuntimeDependencyValidator.hpp"
#include "utils/Logger.hpp"
#include "utils/StringUtils.hpp"

#include <algorithm>

namespace remembrances {

ValidationOutcome ValidationOutcome::resolvable(const std::string& strategy) {
    ValidationOutcome outcome;
    outcome.status = Status::RESOLVABLE;
    outcome.strategy = strategy;
    return outcome;
}

ValidationOutcome ValidationOutcome::missing(std::vector<std::string> libs, const std::string& strategy) {
    ValidationOutcome outcome;
    outcome.status = Status::UNRESOLVABLE_MISSING_LIBS;
    outcome.missing_libs = std::move(libs);
    outcome.strategy = strategy;
    return outcome;
}

ValidationOutcome ValidationOutcome::indeterminate(const std::string& strategy) {
    ValidationOutcome outcome;
    outcome.status = Status::INDETERMINATE;
    outcome.strategy = strategy;
    return outcome;
}

std::string validationStatusToString(ValidationOutcome::Status status) {
    switch (status) {
        case ValidationOutcome::Status::RESOLVABLE: return "resolvable";
        case ValidationOutcome::Status::UNRESOLVABLE_MISSING_LIBS: return "missing libraries";
        default: return "indeterminate";
    }
}

const std::vector<std::string>& RuntimeDependencyValidator::requiredLibraries() {
    static const std::vector<std::string> libs = {
        "libcudart.so.12",
        "libcublas.so.12",
        "libcublasLt.so.12"
    };
    return libs;
}

const std::vector<std::string>& RuntimeDependencyValidator::librarySearchDirs() {
    static const std::vector<std::string> dirs = {
        "/usr/local/cuda/lib64",
        "/usr/lib/x86_64-linux-gnu",
        "/lib/x86_64-linux-gnu",
        "/usr/lib64",
        "/lib64",
        "/usr/lib",
        "/lib"
    };
    return dirs;
}

RuntimeDependencyValidator::RuntimeDependencyValidator(SystemProbePtr system)
    : system_(system)
    , linker_cache_(system) {
}

ValidationOutcome RuntimeDependencyValidator::parseLddOutput(const std::string& ldd_output) {
    const auto& required = requiredLibraries();
    std::vector<bool> mentioned(required.size(), false);
    std::vector<bool> not_found(required.size(), false);

    for (const auto& line : splitLines(ldd_output)) {
        for (size_t i = 0; i < required.size(); ++i) {
            if (!containsToken(line, required[i])) {
                continue;
            }
            mentioned[i] = true;
            if (line.find("not found") != std::string::npos) {
                not_found[i] = true;
            }
        }
    }

    std::vector<std::string> missing;
    for (size_t i = 0; i < required.size(); ++i) {
        if (not_found[i]) {
            missing.push_back(required[i]);
        }
    }
    if (!missing.empty()) {
        return ValidationOutcome::missing(missing, "ldd");
    }

    // Not linked against CUDA, or ldd gave nothing usable
    if (std::none_of(mentioned.begin(), mentioned.end(), [](bool m) { return m; })) {
        return ValidationOutcome::indeterminate("ldd");
    }

    return ValidationOutcome::resolvable("ldd");
}

ValidationOutcome RuntimeDependencyValidator::checkWithLdd(const std::string& library_path) {
    if (library_path.empty() || !system_->fileExists(library_path)) {
        LOG_DEBUG("Native library not found, skipping ldd check");
        return ValidationOutcome::indeterminate("ldd");
    }
    if (!system_->commandExists("ldd")) {
        LOG_DEBUG("ldd not available, skipping direct resolution check");
        return ValidationOutcome::indeterminate("ldd");
    }

    // ldd output may be localized; only "not found" is relied on
    CommandResult result = system_->run({"ldd", library_path});
    if (!result.started) {
        return ValidationOutcome::indeterminate("ldd");
    }
    return parseLddOutput(result.output);
}

bool RuntimeDependencyValidator::sharedLibraryExists(const std::string& soname) {
    auto cached = linker_cache_.contains(soname);
    if (cached && *cached) {
        return true;
    }

    for (const auto& dir : librarySearchDirs()) {
        for (const auto& name : system_->listDirectory(dir)) {
            if (name == soname || startsWith(name, soname + ".")) {
                LOG_DEBUG("Found " + soname + " as " + dir + "/" + name);
                return true;
            }
        }
    }
    return false;
}

ValidationOutcome RuntimeDependencyValidator::checkPresence() {
    std::vector<std::string> missing;
    for (const auto& soname : requiredLibraries()) {
        if (!sharedLibraryExists(soname)) {
            missing.push_back(soname);
        }
    }

    if (missing.empty()) {
        return ValidationOutcome::resolvable("presence");
    }
    return ValidationOutcome::missing(missing, "presence");
}

ValidationOutcome RuntimeDependencyValidator::validate(const std::string& library_path) {
    ValidationOutcome direct = checkWithLdd(library_path);
    if (direct.isDefinite()) {
        LOG_DEBUG("Runtime dependencies " + validationStatusToString(direct.status) + " (ldd)");
        return direct;
    }

    ValidationOutcome presence = checkPresence();
    LOG_DEBUG("Runtime dependencies " + validationStatusToString(presence.status) + " (presence)");
    return presence;
}

std::string RuntimeDependencyValidator::locateNativeLibrary(const std::string& bin_dir) {
    if (!bin_dir.empty()) {
        std::string candidate = bin_dir + "/" + kNativeLibraryName;
        if (system_->fileExists(candidate)) {
            return candidate;
        }
    }
    std::string local = std::string("./") + kNativeLibraryName;
    if (system_->fileExists(local)) {
        return local;
    }
    return "";
}

}
