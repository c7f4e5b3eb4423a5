// statistics.hpp
// Descriptive statistics shared by the screener, signal builder and metrics

#pragma once

#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>
#include <vector>

namespace pairs_arb {

// ============================================================================
// Statistical Helper Functions
// ============================================================================

class StatisticalUtils {
public:
    static constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

    static double mean(const std::vector<double>& values) {
        if (values.empty()) return kNaN;
        return std::accumulate(values.begin(), values.end(), 0.0) / values.size();
    }

    // Sample variance (n - 1); NaN below two observations
    static double sampleVariance(const std::vector<double>& values) {
        if (values.size() < 2) return kNaN;
        double m = mean(values);
        double sum_sq_diff = 0.0;
        for (double v : values) {
            double diff = v - m;
            sum_sq_diff += diff * diff;
        }
        return sum_sq_diff / static_cast<double>(values.size() - 1);
    }

    static double sampleStdDev(const std::vector<double>& values) {
        double var = sampleVariance(values);
        return std::isnan(var) ? kNaN : std::sqrt(var);
    }

    // Pearson correlation; NaN when either side has zero variance
    static double pearsonCorrelation(const std::vector<double>& x, const std::vector<double>& y) {
        if (x.size() != y.size() || x.size() < 2) return kNaN;

        double mean_x = mean(x);
        double mean_y = mean(y);
        double sxy = 0.0, sxx = 0.0, syy = 0.0;
        for (size_t i = 0; i < x.size(); ++i) {
            double dx = x[i] - mean_x;
            double dy = y[i] - mean_y;
            sxy += dx * dy;
            sxx += dx * dx;
            syy += dy * dy;
        }
        if (sxx <= 0.0 || syy <= 0.0) return kNaN;

        double corr = sxy / std::sqrt(sxx * syy);
        // Clamp to [-1, 1] to handle numerical errors
        return std::max(-1.0, std::min(1.0, corr));
    }

    // Standard normal CDF
    static double normalCDF(double x) {
        return 0.5 * std::erfc(-x / std::sqrt(2.0));
    }
};

} // namespace pairs_arb
