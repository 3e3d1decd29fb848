#pragma once

#include <string>

namespace remembrances {

// "[pct%] step" lines for a fixed number of installer steps.
class Progress {
public:
    explicit Progress(int total_steps);

    void step(const std::string& label);
    int current() const { return current_; }
    int percent() const;

private:
    int total_;
    int current_;
};

}
