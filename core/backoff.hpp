// filename: core/backoff.hpp
#pragma once
#include <chrono>

// Exponential backoff: min * factor^attempt, capped at max.
class Backoff {
public:
    Backoff(std::chrono::milliseconds min, std::chrono::milliseconds max, double factor);

    // delay for the current attempt, then advances
    std::chrono::milliseconds next();
    void reset() noexcept { attempt_ = 0; }
    unsigned attempts() const noexcept { return attempt_; }

private:
    std::chrono::milliseconds min_;
    std::chrono::milliseconds max_;
    double factor_;
    unsigned attempt_ = 0;
};
