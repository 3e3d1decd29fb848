#pragma once

#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace remembrances {

enum class TriState {
    YES,
    NO,
    INDETERMINATE
};

inline TriState toTriState(const std::optional<bool>& value) {
    if (!value) {
        return TriState::INDETERMINATE;
    }
    return *value ? TriState::YES : TriState::NO;
}

inline std::string triStateToString(TriState state) {
    switch (state) {
        case TriState::YES: return "true";
        case TriState::NO: return "false";
        default: return "indeterminate";
    }
}

template <typename T>
struct ProbeOutcome {
    std::optional<T> value;     // nullopt if no strategy was definite
    std::string decided_by;     // name of the strategy that answered
};

// Ordered list of independent strategies for a single fact. Each strategy
// returns a definite value or nullopt (indeterminate); resolve() returns the
// first definite answer and does not run the strategies after it.
template <typename T>
class ProbeChain {
public:
    using Strategy = std::function<std::optional<T>()>;

    explicit ProbeChain(std::string fact)
        : fact_(std::move(fact)) {
    }

    ProbeChain& add(std::string name, Strategy strategy) {
        strategies_.emplace_back(std::move(name), std::move(strategy));
        return *this;
    }

    ProbeOutcome<T> resolve() const {
        ProbeOutcome<T> outcome;
        for (const auto& entry : strategies_) {
            std::optional<T> value = entry.second();
            if (value) {
                outcome.value = value;
                outcome.decided_by = entry.first;
                return outcome;
            }
        }
        return outcome;
    }

    const std::string& fact() const { return fact_; }
    size_t size() const { return strategies_.size(); }

private:
    std::string fact_;
    std::vector<std::pair<std::string, Strategy>> strategies_;
};

}
