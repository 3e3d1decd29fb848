#pragma once

#include "hardware/HardwareCapabilityProber.hpp"
#include "platform/PlatformIdentifier.hpp"
#include "utils/Prompter.hpp"

#include <string>

namespace remembrances {

struct VariantPreference {
    bool want_nvidia = false;
    bool want_portable = false;
};

// Three-valued user intent from the environment or the command line.
enum class Override {
    UNSET,
    YES,
    NO
};

// "yes"/"no" (case-insensitive, also y/n/true/false/1/0); anything else,
// including empty, is UNSET.
Override parseOverride(const std::string& value);
std::string overrideToString(Override value);

struct PreferenceOverrides {
    Override nvidia = Override::UNSET;
    Override portable = Override::UNSET;
};

// Builds the final preference: computed default, then the wizard answer,
// then an explicit override, which always wins.
class VariantPreferenceResolver {
public:
    static VariantPreference defaults(const PlatformTuple& tuple, const CapabilityProfile& profile);

    // The wizard only runs on (linux, amd64). A field with an override set is
    // never asked. `prompter` may be null (no wizard).
    static VariantPreference resolve(const PlatformTuple& tuple,
                                     const CapabilityProfile& profile,
                                     const PreferenceOverrides& overrides,
                                     Prompter* prompter);

private:
    VariantPreferenceResolver() = delete;
};

}
