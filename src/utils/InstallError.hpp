#pragma once

#include <stdexcept>
#include <string>

namespace remembrances {

// Terminal installer failure. Raised by the pipeline and its collaborators,
// caught once in main().
class InstallError : public std::runtime_error {
public:
    explicit InstallError(const std::string& message)
        : std::runtime_error(message) {
    }
};

}
