// rolling_statistics.hpp
// Trailing-window Rolling Statistics for the spread z-score
// Implements numerically stable rolling mean / sample standard deviation

#pragma once

#include <cmath>
#include <deque>
#include <optional>
#include <algorithm>
#include <string>
#include "../core/exceptions.hpp"

namespace pairs_arb {

// ============================================================================
// Rolling Statistics over a fixed trailing window
// ============================================================================

class RollingStatistics {
private:
    size_t window_size_;
    std::deque<double> values_;

    // Cached statistics, recomputed on every update
    double sum_ = 0.0;
    double mean_ = 0.0;
    double variance_ = 0.0;
    double std_dev_ = 0.0;

    // Standard deviation below this fraction of the window's magnitude is zero
    static constexpr double kRelativeZeroTolerance = 1e-12;

public:
    explicit RollingStatistics(size_t window_size)
        : window_size_(window_size) {
        if (window_size_ < 2) {
            throw ConfigurationException("Rolling window must hold at least 2 values, got " +
                                         std::to_string(window_size_));
        }
    }

    void update(double value) {
        values_.push_back(value);
        if (values_.size() > window_size_) {
            values_.pop_front();
        }

        // Re-sum from the window so a long run cannot accumulate drift
        const double n = static_cast<double>(values_.size());
        sum_ = 0.0;
        for (double v : values_) sum_ += v;
        mean_ = sum_ / n;

        if (values_.size() > 1) {
            // Two-pass sample variance (n - 1)
            double ss = 0.0;
            for (double v : values_) {
                double d = v - mean_;
                ss += d * d;
            }
            variance_ = ss / (n - 1.0);
            std_dev_ = std::sqrt(variance_);
        } else {
            variance_ = 0.0;
            std_dev_ = 0.0;
        }
    }

    double getMean() const { return mean_; }
    double getStdDev() const { return std_dev_; }
    size_t getCount() const { return values_.size(); }
    size_t getWindowSize() const { return window_size_; }
    bool isFull() const { return values_.size() == window_size_; }

    // True when the window is full but its dispersion is numerically zero
    bool isDegenerate() const {
        if (!isFull()) return false;
        double scale = std::max(1.0, std::abs(mean_));
        return std_dev_ <= kRelativeZeroTolerance * scale;
    }

    // Z-score of the latest value; empty until the window is full or when std is zero
    std::optional<double> getZScore() const {
        if (!isFull() || isDegenerate()) return std::nullopt;
        return (values_.back() - mean_) / std_dev_;
    }

    void reset() {
        values_.clear();
        sum_ = 0.0;
        mean_ = 0.0;
        variance_ = 0.0;
        std_dev_ = 0.0;
    }
};

} // namespace pairs_arb
