// ols.hpp
// Ordinary least squares on dense design matrices (Eigen)
// Used by the ADF regressions, which carry a variable number of lag columns

#pragma once

#include <cmath>
#include <limits>
#include <Eigen/Dense>

namespace pairs_arb {

// ============================================================================
// OLS fit with coefficient standard errors and Gaussian log-likelihood
// ============================================================================

struct OlsResult {
    Eigen::VectorXd params;
    Eigen::VectorXd std_errors;
    Eigen::VectorXd residuals;
    double ssr = 0.0;        // sum of squared residuals
    double llf = 0.0;        // Gaussian log-likelihood
    double aic = 0.0;        // -2 llf + 2 k
    long nobs = 0;
    long k = 0;
    bool ok = false;         // false on rank deficiency or nobs <= k

    double tValue(long i) const {
        if (!ok || std_errors(i) <= 0.0) return std::numeric_limits<double>::quiet_NaN();
        return params(i) / std_errors(i);
    }
};

inline OlsResult fitOls(const Eigen::MatrixXd& X, const Eigen::VectorXd& y) {
    OlsResult result;
    result.nobs = X.rows();
    result.k = X.cols();
    if (result.nobs <= result.k || result.k == 0) {
        return result;
    }

    Eigen::ColPivHouseholderQR<Eigen::MatrixXd> qr(X);
    if (qr.rank() < result.k) {
        return result;
    }

    result.params = qr.solve(y);
    result.residuals = y - X * result.params;
    result.ssr = result.residuals.squaredNorm();

    const double n = static_cast<double>(result.nobs);
    const double sigma2 = result.ssr / (n - static_cast<double>(result.k));
    Eigen::MatrixXd xtx = X.transpose() * X;
    Eigen::MatrixXd xtx_inv = xtx.ldlt().solve(Eigen::MatrixXd::Identity(result.k, result.k));
    result.std_errors = (sigma2 * xtx_inv.diagonal()).cwiseMax(0.0).cwiseSqrt();

    constexpr double kLog2Pi = 1.8378770664093453;
    result.llf = -0.5 * n * (kLog2Pi + std::log(result.ssr / n) + 1.0);
    result.aic = -2.0 * result.llf + 2.0 * static_cast<double>(result.k);
    result.ok = std::isfinite(result.llf);
    return result;
}

} // namespace pairs_arb
