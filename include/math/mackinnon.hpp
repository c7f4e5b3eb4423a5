// mackinnon.hpp
// MacKinnon response surfaces for unit-root and Engle-Granger cointegration tests
// p-values: MacKinnon (1994) approximate asymptotic distribution
// critical values: MacKinnon (2010) finite-sample response surface

#pragma once

#include <array>
#include <cmath>
#include <string>
#include "statistics.hpp"
#include "../core/exceptions.hpp"

namespace pairs_arb {

// ============================================================================
// MacKinnon tables, constant-only deterministic case
// Row index = number of variables in the cointegrating regression - 1
// (row 0 is the plain ADF test with a constant, row 1 Engle-Granger with two series)
// ============================================================================

class MacKinnon {
private:
    static constexpr size_t kMaxVariables = 2;

    // Statistic range of the response surface; beyond it p saturates at 0 / 1
    static constexpr std::array<double, kMaxVariables> TAU_MIN = {-18.83, -18.86};
    static constexpr std::array<double, kMaxVariables> TAU_MAX = {2.74, 0.92};
    // Switch point between the small-p and large-p polynomials
    static constexpr std::array<double, kMaxVariables> TAU_STAR = {-1.61, -2.62};

    // p = Phi(c0 + c1 * tau + c2 * tau^2) for tau <= TAU_STAR
    static constexpr std::array<std::array<double, 3>, kMaxVariables> SMALL_P = {{
        {{2.1659, 1.4412, 0.038269}},
        {{2.92, 1.5012, 0.039796}},
    }};

    // p = Phi(c0 + c1 * tau + c2 * tau^2 + c3 * tau^3) for tau > TAU_STAR
    static constexpr std::array<std::array<double, 4>, kMaxVariables> LARGE_P = {{
        {{1.7339, 0.93202, -0.12745, -0.010368}},
        {{2.1945, 0.64695, -0.29198, -0.042377}},
    }};

    struct CriticalValueCoeffs {
        double tau_inf;
        double tau_1;
        double tau_2;
        double tau_3;
    };

    // MacKinnon (2010) Table 2, constant case: 1%, 5%, 10%
    static constexpr std::array<std::array<CriticalValueCoeffs, 3>, kMaxVariables> CRITICAL = {{
        {{{-3.43035, -6.5393, -16.786, -79.433},
          {-2.86154, -2.8903, -4.234, -40.040},
          {-2.56677, -1.5384, -2.809, 0.0}}},
        {{{-3.89644, -10.9519, -22.527, 0.0},
          {-3.33613, -6.1101, -6.823, 0.0},
          {-3.04445, -4.2412, -2.720, 0.0}}},
    }};

    static size_t rowFor(size_t num_variables) {
        if (num_variables < 1 || num_variables > kMaxVariables) {
            throw DegenerateStatisticException("MacKinnon tables cover 1 or 2 variables, got " +
                                               std::to_string(num_variables));
        }
        return num_variables - 1;
    }

public:
    struct CriticalValues {
        double one_percent;
        double five_percent;
        double ten_percent;
    };

    // Approximate p-value of a Dickey-Fuller type statistic
    static double pValue(double tau, size_t num_variables) {
        size_t row = rowFor(num_variables);
        if (std::isnan(tau)) return StatisticalUtils::kNaN;
        if (tau > TAU_MAX[row]) return 1.0;
        if (tau < TAU_MIN[row]) return 0.0;

        double z;
        if (tau <= TAU_STAR[row]) {
            const auto& c = SMALL_P[row];
            z = c[0] + tau * (c[1] + tau * c[2]);
        } else {
            const auto& c = LARGE_P[row];
            z = c[0] + tau * (c[1] + tau * (c[2] + tau * c[3]));
        }
        return StatisticalUtils::normalCDF(z);
    }

    // Finite-sample critical values for sample size `nobs`
    static CriticalValues criticalValues(size_t nobs, size_t num_variables) {
        size_t row = rowFor(num_variables);
        double inv = 1.0 / static_cast<double>(nobs);
        auto at = [&](size_t level) {
            const auto& c = CRITICAL[row][level];
            return c.tau_inf + inv * (c.tau_1 + inv * (c.tau_2 + inv * c.tau_3));
        };
        return {at(0), at(1), at(2)};
    }
};

} // namespace pairs_arb
