#pragma once

#include "platform/SystemProbe.hpp"
#include "runtime/LinkerCache.hpp"

#include <string>
#include <vector>

namespace remembrances {

struct ValidationOutcome {
    enum class Status {
        RESOLVABLE,
        UNRESOLVABLE_MISSING_LIBS,
        INDETERMINATE
    };

    Status status = Status::INDETERMINATE;
    std::vector<std::string> missing_libs;
    std::string strategy;   // which check produced the answer

    bool isDefinite() const { return status != Status::INDETERMINATE; }

    static ValidationOutcome resolvable(const std::string& strategy);
    static ValidationOutcome missing(std::vector<std::string> libs, const std::string& strategy);
    static ValidationOutcome indeterminate(const std::string& strategy);
};

std::string validationStatusToString(ValidationOutcome::Status status);

// Decides whether the dynamic loader can resolve the CUDA 12 runtime
// libraries the installed native library needs.
//
// 1. ldd on the library: authoritative when it names a CUDA SONAME.
// 2. presence of every SONAME in the linker cache or a common library dir.
class RuntimeDependencyValidator {
public:
    explicit RuntimeDependencyValidator(SystemProbePtr system);

    ValidationOutcome validate(const std::string& library_path);

    ValidationOutcome checkWithLdd(const std::string& library_path);
    ValidationOutcome checkPresence();

    // Linker cache first, then kLibrarySearchDirs in order; exact name or
    // a dotted version suffix (libcublas.so.12.6.4.1).
    bool sharedLibraryExists(const std::string& soname);

    // Interprets `ldd` output for the required SONAMEs.
    static ValidationOutcome parseLddOutput(const std::string& ldd_output);

    // <bin_dir>/libllama.so, else ./libllama.so; empty if neither exists.
    std::string locateNativeLibrary(const std::string& bin_dir);

    static const std::vector<std::string>& requiredLibraries();
    static const std::vector<std::string>& librarySearchDirs();

    static constexpr const char* kNativeLibraryName = "libllama.so";

private:
    SystemProbePtr system_;
    LinkerCache linker_cache_;
};

}
