#include "pipeline/Progress.hpp"
#include "utils/Logger.hpp"

namespace remembrances {

Progress::Progress(int total_steps)
    : total_(total_steps > 0 ? total_steps : 1)
    , current_(0) {
}

int Progress::percent() const {
    return (current_ * 100) / total_;
}

void Progress::step(const std::string& label) {
    if (current_ < total_) {
        ++current_;
    }
    LOG_INFO("[" + std::to_string(percent()) + "%] " + label);
}

}
