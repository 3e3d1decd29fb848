#include "runtime/LinkerCache.hpp"
#include "runtime/RemediationPlanner.hpp"
#include "runtime/RuntimeDependencyValidator.hpp"
#include "utils/InstallError.hpp"
#include "utils/TempDir.hpp"
#include "FakeSystem.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>

namespace fs = std::filesystem;
using namespace remembrances;
using testing::FakeSystem;

static const char* kLibPath = "/home/user/.local/share/remembrances/bin/libllama.so";

static const char* kLddMissing =
    "\tlinux-vdso.so.1 (0x00007ffd5a1f5000)\n"
    "\tlibcudart.so.12 => not found\n"
    "\tlibcublas.so.12 => not found\n"
    "\tlibcublasLt.so.12 => /usr/local/cuda/lib64/libcublasLt.so.12 (0x00007f0d2c000000)\n"
    "\tlibc.so.6 => /lib/x86_64-linux-gnu/libc.so.6 (0x00007f0d2be00000)\n";

static const char* kLddResolved =
    "\tlibcudart.so.12 => /usr/local/cuda/lib64/libcudart.so.12 (0x00007f0d2c800000)\n"
    "\tlibcublas.so.12 => /usr/local/cuda/lib64/libcublas.so.12 (0x00007f0d2a000000)\n"
    "\tlibcublasLt.so.12 => /usr/local/cuda/lib64/libcublasLt.so.12 (0x00007f0d20000000)\n";

static const char* kLddCpuOnly =
    "\tlibstdc++.so.6 => /lib/x86_64-linux-gnu/libstdc++.so.6 (0x00007f0d2c000000)\n"
    "\tlibc.so.6 => /lib/x86_64-linux-gnu/libc.so.6 (0x00007f0d2be00000)\n";

void testParseLdd() {
    std::cout << "Testing ldd output parsing..." << std::endl;

    ValidationOutcome outcome = RuntimeDependencyValidator::parseLddOutput(kLddMissing);
    assert(outcome.status == ValidationOutcome::Status::UNRESOLVABLE_MISSING_LIBS);
    assert(outcome.missing_libs.size() == 2);
    assert(outcome.missing_libs[0] == "libcudart.so.12");
    assert(outcome.missing_libs[1] == "libcublas.so.12");
    assert(outcome.strategy == "ldd");

    outcome = RuntimeDependencyValidator::parseLddOutput(kLddResolved);
    assert(outcome.status == ValidationOutcome::Status::RESOLVABLE);

    outcome = RuntimeDependencyValidator::parseLddOutput(kLddCpuOnly);
    assert(outcome.status == ValidationOutcome::Status::INDETERMINATE);
    assert(!outcome.isDefinite());

    outcome = RuntimeDependencyValidator::parseLddOutput("");
    assert(outcome.status == ValidationOutcome::Status::INDETERMINATE);

    std::cout << "  PASSED" << std::endl;
}

void testLddIsAuthoritative() {
    std::cout << "Testing ldd answer is used when definite..." << std::endl;

    auto system = std::make_shared<FakeSystem>();
    system->commands = {"ldd", "ldconfig"};
    system->files[kLibPath] = "";
    system->respond(std::string("ldd ") + kLibPath, 0, kLddMissing);
    // The cache claims everything is there; ldd must win
    system->respond("ldconfig -p",
                    0,
                    "\tlibcudart.so.12 (libc6,x86-64) => /opt/x/libcudart.so.12\n"
                    "\tlibcublas.so.12 (libc6,x86-64) => /opt/x/libcublas.so.12\n"
                    "\tlibcublasLt.so.12 (libc6,x86-64) => /opt/x/libcublasLt.so.12\n");

    RuntimeDependencyValidator validator(system);
    ValidationOutcome outcome = validator.validate(kLibPath);
    assert(outcome.status == ValidationOutcome::Status::UNRESOLVABLE_MISSING_LIBS);
    assert(outcome.strategy == "ldd");
    assert(!system->ran("ldconfig"));

    std::cout << "  PASSED" << std::endl;
}

void testFallThroughToPresence() {
    std::cout << "Testing fall-through to presence check..." << std::endl;

    // No library on disk: ldd is skipped
    auto system = std::make_shared<FakeSystem>();
    system->commands = {"ldd", "ldconfig"};
    system->respond("ldconfig -p", 0,
                    "\tlibcudart.so.12 (libc6,x86-64) => /usr/lib/x86_64-linux-gnu/libcudart.so.12\n");
    system->directories["/usr/local/cuda/lib64"] = {"libcublas.so.12.6.4.1", "libcublasLt.so.12"};

    RuntimeDependencyValidator validator(system);
    ValidationOutcome outcome = validator.validate(kLibPath);
    assert(outcome.status == ValidationOutcome::Status::RESOLVABLE);
    assert(outcome.strategy == "presence");
    assert(!system->ran("ldd"));

    // ldd runs but says nothing about CUDA
    auto cpu_linked = std::make_shared<FakeSystem>();
    cpu_linked->commands = {"ldd"};
    cpu_linked->files[kLibPath] = "";
    cpu_linked->respond(std::string("ldd ") + kLibPath, 0, kLddCpuOnly);

    RuntimeDependencyValidator second(cpu_linked);
    outcome = second.validate(kLibPath);
    assert(cpu_linked->ran("ldd"));
    assert(outcome.strategy == "presence");
    assert(outcome.status == ValidationOutcome::Status::UNRESOLVABLE_MISSING_LIBS);
    assert(outcome.missing_libs.size() == 3);

    std::cout << "  PASSED" << std::endl;
}

void testVersionedSuffixMatching() {
    std::cout << "Testing versioned library name matching..." << std::endl;

    auto system = std::make_shared<FakeSystem>();
    system->directories["/usr/lib64"] = {"libcudart.so.120", "libcudart.so.12.4.127"};
    system->directories["/lib"] = {"libcublas.so.120"};

    RuntimeDependencyValidator validator(system);
    assert(validator.sharedLibraryExists("libcudart.so.12"));
    assert(!validator.sharedLibraryExists("libcublas.so.12"));

    assert(LinkerCache::listingContains("\tlibcublasLt.so.12 (libc6,x86-64) => /x\n", "libcublasLt.so.12"));
    assert(!LinkerCache::listingContains("\tlibcublasLt.so.12 (libc6,x86-64) => /x\n", "libcublas.so.12"));

    std::cout << "  PASSED" << std::endl;
}

void testLocateNativeLibrary() {
    std::cout << "Testing native library lookup..." << std::endl;

    auto system = std::make_shared<FakeSystem>();
    RuntimeDependencyValidator validator(system);
    assert(validator.locateNativeLibrary("/opt/bin").empty());

    system->files["./libllama.so"] = "";
    assert(validator.locateNativeLibrary("/opt/bin") == "./libllama.so");

    system->files["/opt/bin/libllama.so"] = "";
    assert(validator.locateNativeLibrary("/opt/bin") == "/opt/bin/libllama.so");

    std::cout << "  PASSED" << std::endl;
}

void testPlan() {
    std::cout << "Testing remediation planning..." << std::endl;

    RemediationSettings settings;
    settings.bundle_url = "https://example.com/cuda-libs-linux-x64.tar.xz";
    settings.target_lib_dir = "/home/user/.local/lib";

    RemediationPlan plan = RemediationPlanner::plan(ValidationOutcome::resolvable("ldd"), settings);
    assert(plan.action == RemediationPlan::Action::NONE);

    plan = RemediationPlanner::plan(ValidationOutcome::indeterminate("ldd"), settings);
    assert(plan.action == RemediationPlan::Action::NONE);

    ValidationOutcome missing = ValidationOutcome::missing({"libcudart.so.12"}, "presence");
    plan = RemediationPlanner::plan(missing, settings);
    assert(plan.action == RemediationPlan::Action::INSTALL_BUNDLE);
    assert(plan.missing_libs.size() == 1);
    assert(plan.bundle_url == settings.bundle_url);

    settings.skip = true;
    plan = RemediationPlanner::plan(missing, settings);
    assert(plan.action == RemediationPlan::Action::SKIPPED);

    auto system = std::make_shared<FakeSystem>();
    RemediationPlanner planner(system);
    RemediationResult result = planner.execute(plan);
    assert(result.ok);
    assert(result.copied == 0);
    assert(!result.needs_loader_path);
    assert(system->executed.empty());

    std::cout << "  PASSED" << std::endl;
}

static RemediationPlan installPlan(const std::string& target) {
    RemediationPlan plan;
    plan.action = RemediationPlan::Action::INSTALL_BUNDLE;
    plan.bundle_url = "https://example.com/cuda-libs-linux-x64.tar.xz";
    plan.target_lib_dir = target;
    plan.missing_libs = {"libcudart.so.12"};
    return plan;
}

void testExecuteCopiesLibraries() {
    std::cout << "Testing bundle installation..." << std::endl;

    TempDir work("remembrances-test");
    std::string target = (work.path() / "lib").string();

    auto system = std::make_shared<FakeSystem>();
    system->commands = {"curl", "tar"};
    system->on_run = [](const std::vector<std::string>& argv) {
        if (argv.size() < 5 || argv[0] != "tar") {
            return;
        }
        fs::path root = fs::path(argv[4]) / "cuda-libs" / "lib64";
        fs::create_directories(root);
        std::ofstream(root / "libcudart.so.12") << "x";
        std::ofstream(root / "libcublas.so.12.6.4.1") << "x";
        std::ofstream(root / "libcublasLt.so") << "x";
        std::ofstream(root / "README.txt") << "x";
    };

    RemediationPlanner planner(system);
    RemediationResult result = planner.execute(installPlan(target));

    assert(result.ok);
    assert(result.copied == 3);
    assert(result.needs_loader_path);
    assert(fs::exists(fs::path(target) / "libcudart.so.12"));
    assert(fs::exists(fs::path(target) / "libcublas.so.12.6.4.1"));
    assert(!fs::exists(fs::path(target) / "README.txt"));
    assert(system->ran("curl -fL"));

    std::cout << "  PASSED" << std::endl;
}

void testExecuteFailures() {
    std::cout << "Testing bundle installation failures..." << std::endl;

    TempDir work("remembrances-test");
    std::string target = (work.path() / "lib").string();

    // tar missing: thrown, nothing downloaded
    auto no_tar = std::make_shared<FakeSystem>();
    no_tar->commands = {"curl"};
    bool threw = false;
    try {
        RemediationPlanner(no_tar).execute(installPlan(target));
    } catch (const InstallError& e) {
        threw = std::string(e.what()).find("tar") != std::string::npos;
    }
    assert(threw);
    assert(no_tar->executed.empty());

    // Download fails: reported in the result
    auto offline = std::make_shared<FakeSystem>();
    offline->commands = {"curl", "tar"};
    offline->attached_exit = 22;
    RemediationResult result = RemediationPlanner(offline).execute(installPlan(target));
    assert(!result.ok);
    assert(!result.needs_loader_path);
    assert(!offline->ran("tar"));

    // Archive without shared objects
    auto empty_bundle = std::make_shared<FakeSystem>();
    empty_bundle->commands = {"curl", "tar"};
    result = RemediationPlanner(empty_bundle).execute(installPlan(target));
    assert(result.ok);
    assert(result.copied == 0);
    assert(!result.needs_loader_path);

    std::cout << "  PASSED" << std::endl;
}

void testSharedObjectNames() {
    std::cout << "Testing shared object name filter..." << std::endl;

    assert(RemediationPlanner::isSharedObjectName("libcudart.so"));
    assert(RemediationPlanner::isSharedObjectName("libcudart.so.12"));
    assert(RemediationPlanner::isSharedObjectName("libcublas.so.12.6.4.1"));
    assert(!RemediationPlanner::isSharedObjectName("libcudart.a"));
    assert(!RemediationPlanner::isSharedObjectName("notes.software"));

    std::cout << "  PASSED" << std::endl;
}

int main() {
    std::cout << "\n=== Runtime Validation Tests ===" << std::endl;

    testParseLdd();
    testLddIsAuthoritative();
    testFallThroughToPresence();
    testVersionedSuffixMatching();
    testLocateNativeLibrary();
    testPlan();
    testExecuteCopiesLibraries();
    testExecuteFailures();
    testSharedObjectNames();

    std::cout << "\n=== All Tests Passed ===" << std::endl;
    return 0;
}
