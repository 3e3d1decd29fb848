#include "release/VariantPreference.hpp"
#include "utils/Logger.hpp"
#include "utils/StringUtils.hpp"

namespace remembrances {

Override parseOverride(const std::string& value) {
    std::string v = toLower(trim(value));
    if (v == "yes" || v == "y" || v == "true" || v == "1") {
        return Override::YES;
    }
    if (v == "no" || v == "n" || v == "false" || v == "0") {
        return Override::NO;
    }
    return Override::UNSET;
}

std::string overrideToString(Override value) {
    switch (value) {
        case Override::YES: return "yes";
        case Override::NO: return "no";
        default: return "unset";
    }
}

VariantPreference VariantPreferenceResolver::defaults(const PlatformTuple& tuple,
                                                      const CapabilityProfile& profile) {
    VariantPreference pref;
    if (tuple.os == Os::LINUX) {
        pref.want_nvidia = profile.has_nvidia_gpu;
        // AVX-512 machines get the non-portable build
        pref.want_portable = !profile.has_avx512;
    }
    return pref;
}

VariantPreference VariantPreferenceResolver::resolve(const PlatformTuple& tuple,
                                                     const CapabilityProfile& profile,
                                                     const PreferenceOverrides& overrides,
                                                     Prompter* prompter) {
    VariantPreference pref = defaults(tuple, profile);

    if (prompter && tuple.isLinuxAmd64()) {
        if (overrides.nvidia == Override::UNSET) {
            if (profile.has_nvidia_gpu) {
                pref.want_nvidia = prompter->askYesNo("Install NVIDIA/CUDA build?", true);
            } else {
                pref.want_nvidia = false;
            }
        }

        if (overrides.portable == Override::UNSET) {
            bool nvidia_after_override = overrides.nvidia == Override::UNSET
                ? pref.want_nvidia
                : overrides.nvidia == Override::YES;
            if (nvidia_after_override) {
                pref.want_portable = prompter->askYesNo(
                    "Use portable build (recommended unless your CPU supports AVX-512)?",
                    pref.want_portable);
            }
        }
    }

    if (overrides.nvidia != Override::UNSET) {
        pref.want_nvidia = overrides.nvidia == Override::YES;
        LOG_INFO("NVIDIA build forced to " + overrideToString(overrides.nvidia));
    }
    if (overrides.portable != Override::UNSET) {
        pref.want_portable = overrides.portable == Override::YES;
        LOG_INFO("Portable build forced to " + overrideToString(overrides.portable));
    }

    return pref;
}

}
