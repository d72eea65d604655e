// filename: src/backoff.cpp
#include <core/backoff.hpp>
#include <algorithm>
#include <cmath>

Backoff::Backoff(std::chrono::milliseconds min, std::chrono::milliseconds max, double factor)
    : min_(min), max_(std::max(min, max)), factor_(factor < 1.0 ? 1.0 : factor) {}

std::chrono::milliseconds Backoff::next() {
    const double ms = static_cast<double>(min_.count()) * std::pow(factor_, attempt_);
    ++attempt_;
    if (!std::isfinite(ms) || ms >= static_cast<double>(max_.count())) return max_;
    return std::chrono::milliseconds(static_cast<std::chrono::milliseconds::rep>(ms));
}
