#include "release/AssetSelector.hpp"
#include "release/ReleaseManifest.hpp"
#include "release/VariantPreference.hpp"
#include "utils/InstallError.hpp"
#include "utils/Prompter.hpp"

#include <cassert>
#include <deque>
#include <iostream>
#include <sstream>

using namespace remembrances;

// Records questions and answers them from a queue
class ScriptedPrompter : public Prompter {
public:
    std::deque<bool> answers;
    std::vector<std::string> asked;

    bool askYesNo(const std::string& question, bool default_yes) override {
        asked.push_back(question);
        if (answers.empty()) {
            return default_yes;
        }
        bool answer = answers.front();
        answers.pop_front();
        return answer;
    }

    bool isInteractive() const override { return true; }
};

static PlatformTuple linuxAmd64() {
    return PlatformIdentifier::identify("Linux", "x86_64");
}

static PlatformTuple darwinArm64() {
    return PlatformIdentifier::identify("Darwin", "arm64");
}

static ReleaseManifest manifestWith(const std::vector<std::string>& names) {
    ReleaseManifest manifest;
    manifest.tag = "v1.16.4";
    for (const auto& name : names) {
        manifest.assets.push_back(
            {name, "https://github.com/madeindigio/remembrances-mcp/releases/download/v1.16.4/" + name});
    }
    return manifest;
}

void testSelectionTable() {
    std::cout << "Testing asset selection table..." << std::endl;

    VariantPreference pref;

    // macOS ignores the preference entirely
    for (bool nvidia : {false, true}) {
        for (bool portable : {false, true}) {
            pref.want_nvidia = nvidia;
            pref.want_portable = portable;
            auto name = AssetSelector::selectFilename(darwinArm64(), pref);
            assert(name && *name == "remembrances-mcp-darwin-aarch64-embedded.zip");
        }
    }

    pref = {true, true};
    assert(*AssetSelector::selectFilename(linuxAmd64(), pref) ==
           "remembrances-mcp-embedded-cuda-portable-linux-x86_64.zip");

    pref = {true, false};
    assert(*AssetSelector::selectFilename(linuxAmd64(), pref) ==
           "remembrances-mcp-embedded-cuda-linux-x86_64.zip");

    pref = {false, true};
    assert(*AssetSelector::selectFilename(linuxAmd64(), pref) ==
           "remembrances-mcp-embedded-cpu-linux-x86_64.zip");

    pref = {false, false};
    assert(*AssetSelector::selectFilename(linuxAmd64(), pref) ==
           "remembrances-mcp-embedded-cpu-linux-x86_64.zip");

    assert(!AssetSelector::selectFilename(PlatformIdentifier::identify("Linux", "aarch64"), pref));
    assert(!AssetSelector::selectFilename(PlatformIdentifier::identify("Darwin", "x86_64"), pref));

    assert(AssetSelector::filenameFor(AssetVariant::CPU, "custom-app") == "custom-app-cpu-linux-x86_64.zip");
    assert(assetVariantToString(AssetVariant::CUDA_PORTABLE_EMBEDDED) == "CUDA portable embedded");
    assert(assetVariantToString(AssetVariant::CPU) == "CPU");

    std::cout << "  PASSED" << std::endl;
}

void testManifestParsing() {
    std::cout << "Testing release manifest parsing..." << std::endl;

    const std::string json = R"({
        "tag_name": "v1.16.4",
        "assets": [
            {"name": "remembrances-mcp-embedded-cpu-linux-x86_64.zip",
             "browser_download_url": "https://example.com/dl/remembrances-mcp-embedded-cpu-linux-x86_64.zip"},
            {"browser_download_url": "https://example.com/dl/remembrances-mcp-darwin-aarch64-embedded.zip"},
            {"name": "checksums.txt"},
            "garbage"
        ]
    })";

    ReleaseManifest manifest = ReleaseManifest::fromJson(json);
    assert(manifest.tag == "v1.16.4");
    assert(manifest.assets.size() == 2);
    assert(manifest.assets[1].filename == "remembrances-mcp-darwin-aarch64-embedded.zip");

    const AssetDescriptor* cpu = manifest.find("remembrances-mcp-embedded-cpu-linux-x86_64.zip");
    assert(cpu != nullptr);
    assert(cpu->download_url == "https://example.com/dl/remembrances-mcp-embedded-cpu-linux-x86_64.zip");
    assert(manifest.find("checksums.txt") == nullptr);
    assert(manifest.find("") == nullptr);
    assert(manifest.embeddedAssetNames().size() == 2);

    std::cout << "  PASSED" << std::endl;
}

void testManifestErrors() {
    std::cout << "Testing release manifest errors..." << std::endl;

    bool threw = false;
    try {
        ReleaseManifest::fromJson("<html>rate limited</html>");
    } catch (const InstallError&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        ReleaseManifest::fromJson(R"({"message": "Not Found"})");
    } catch (const InstallError& e) {
        threw = std::string(e.what()).find("tag") != std::string::npos;
    }
    assert(threw);

    threw = false;
    try {
        ReleaseManifest::fromJson("[1, 2, 3]");
    } catch (const InstallError&) {
        threw = true;
    }
    assert(threw);

    std::cout << "  PASSED" << std::endl;
}

void testCpuFallback() {
    std::cout << "Testing CPU fallback..." << std::endl;

    VariantPreference pref{false, true};
    ReleaseManifest manifest = manifestWith({"remembrances-mcp-cpu-linux-x86_64.zip"});

    AssetResolution res = AssetSelector::resolve(linuxAmd64(), pref, manifest);
    assert(res.ok());
    assert(res.used_fallback);
    assert(res.variant == AssetVariant::CPU);
    assert(res.asset.filename == "remembrances-mcp-cpu-linux-x86_64.zip");
    assert(res.tried.size() == 2);

    // Embedded build present: no substitution
    manifest = manifestWith({"remembrances-mcp-cpu-linux-x86_64.zip",
                             "remembrances-mcp-embedded-cpu-linux-x86_64.zip"});
    res = AssetSelector::resolve(linuxAmd64(), pref, manifest);
    assert(res.ok());
    assert(!res.used_fallback);
    assert(res.variant == AssetVariant::CPU_EMBEDDED);
    assert(res.tried.size() == 1);

    std::cout << "  PASSED" << std::endl;
}

void testNoFallbackForCuda() {
    std::cout << "Testing CUDA assets have no fallback..." << std::endl;

    VariantPreference pref{true, false};
    ReleaseManifest manifest = manifestWith({"remembrances-mcp-embedded-cpu-linux-x86_64.zip",
                                             "remembrances-mcp-cpu-linux-x86_64.zip"});

    AssetResolution res = AssetSelector::resolve(linuxAmd64(), pref, manifest);
    assert(!res.ok());
    assert(res.status == AssetResolution::Status::NOT_IN_CATALOG);
    assert(res.tried.size() == 1);
    assert(!res.used_fallback);

    assert(!AssetSelector::fallbackFor(AssetVariant::CUDA_EMBEDDED));
    assert(!AssetSelector::fallbackFor(AssetVariant::CPU));

    // Fallback taken once, then the search stops
    pref = {false, false};
    res = AssetSelector::resolve(linuxAmd64(), pref, manifestWith({}));
    assert(res.status == AssetResolution::Status::NOT_IN_CATALOG);
    assert(res.tried.size() == 2);

    res = AssetSelector::resolve(PlatformIdentifier::identify("Linux", "aarch64"), pref, manifest);
    assert(res.status == AssetResolution::Status::NO_MAPPING);
    assert(res.tried.empty());

    std::cout << "  PASSED" << std::endl;
}

void testParseOverride() {
    std::cout << "Testing override parsing..." << std::endl;

    assert(parseOverride("yes") == Override::YES);
    assert(parseOverride("YES") == Override::YES);
    assert(parseOverride(" y ") == Override::YES);
    assert(parseOverride("true") == Override::YES);
    assert(parseOverride("no") == Override::NO);
    assert(parseOverride("N") == Override::NO);
    assert(parseOverride("0") == Override::NO);
    assert(parseOverride("") == Override::UNSET);
    assert(parseOverride("maybe") == Override::UNSET);

    std::cout << "  PASSED" << std::endl;
}

void testOverridesWin() {
    std::cout << "Testing overrides beat defaults and answers..." << std::endl;

    CapabilityProfile gpu_box;
    gpu_box.probed = true;
    gpu_box.has_nvidia_gpu = true;
    gpu_box.has_avx512 = true;

    PreferenceOverrides overrides;
    overrides.nvidia = Override::NO;

    ScriptedPrompter prompter;
    prompter.answers = {true, true};

    VariantPreference pref = VariantPreferenceResolver::resolve(linuxAmd64(), gpu_box, overrides, &prompter);
    assert(!pref.want_nvidia);
    // Neither field is asked: nvidia is forced, portable only matters with nvidia
    assert(prompter.asked.empty());

    CapabilityProfile cpu_box;
    cpu_box.probed = true;
    overrides = PreferenceOverrides();
    overrides.nvidia = Override::YES;
    overrides.portable = Override::NO;
    pref = VariantPreferenceResolver::resolve(linuxAmd64(), cpu_box, overrides, nullptr);
    assert(pref.want_nvidia);
    assert(!pref.want_portable);
    assert(*AssetSelector::selectFilename(linuxAmd64(), pref) ==
           "remembrances-mcp-embedded-cuda-linux-x86_64.zip");

    std::cout << "  PASSED" << std::endl;
}

void testWizard() {
    std::cout << "Testing interactive wizard..." << std::endl;

    CapabilityProfile gpu_box;
    gpu_box.probed = true;
    gpu_box.has_nvidia_gpu = true;

    ScriptedPrompter prompter;
    prompter.answers = {true, false};
    VariantPreference pref = VariantPreferenceResolver::resolve(linuxAmd64(), gpu_box,
                                                                PreferenceOverrides(), &prompter);
    assert(prompter.asked.size() == 2);
    assert(pref.want_nvidia);
    assert(!pref.want_portable);

    // Declining NVIDIA skips the portable question
    ScriptedPrompter decline;
    decline.answers = {false};
    pref = VariantPreferenceResolver::resolve(linuxAmd64(), gpu_box, PreferenceOverrides(), &decline);
    assert(decline.asked.size() == 1);
    assert(!pref.want_nvidia);

    // No GPU, no questions
    CapabilityProfile cpu_box;
    cpu_box.probed = true;
    ScriptedPrompter silent;
    pref = VariantPreferenceResolver::resolve(linuxAmd64(), cpu_box, PreferenceOverrides(), &silent);
    assert(silent.asked.empty());
    assert(!pref.want_nvidia);

    // Never on macOS
    pref = VariantPreferenceResolver::resolve(darwinArm64(), CapabilityProfile(),
                                              PreferenceOverrides(), &silent);
    assert(silent.asked.empty());

    std::cout << "  PASSED" << std::endl;
}

void testTerminalPrompter() {
    std::cout << "Testing terminal prompter..." << std::endl;

    std::istringstream in("y\n\nNO\nwhat\n");
    std::ostringstream out;
    TerminalPrompter prompter(true, in, out);

    assert(prompter.askYesNo("First?", false));
    // Empty reply takes the default
    assert(!prompter.askYesNo("Second?", false));
    assert(!prompter.askYesNo("Third?", true));
    // Unrecognized reply takes the default
    assert(prompter.askYesNo("Fourth?", true));
    // Input exhausted: default
    assert(!prompter.askYesNo("Fifth?", false));
    assert(out.str().find("First? [y/N]") != std::string::npos);

    std::istringstream unused("n\n");
    std::ostringstream quiet;
    TerminalPrompter batch(false, unused, quiet);
    assert(!batch.isInteractive());
    assert(batch.askYesNo("Install?", true));
    assert(quiet.str().empty());

    std::cout << "  PASSED" << std::endl;
}

int main() {
    std::cout << "\n=== Asset Selection Tests ===" << std::endl;

    testSelectionTable();
    testManifestParsing();
    testManifestErrors();
    testCpuFallback();
    testNoFallbackForCuda();
    testParseOverride();
    testOverridesWin();
    testWizard();
    testTerminalPrompter();

    std::cout << "\n=== All Tests Passed ===" << std::endl;
    return 0;
}
