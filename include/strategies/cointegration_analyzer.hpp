// cointegration_analyzer.hpp
// Cointegration Analysis for Statistical Arbitrage Pairs Trading
// Implements the Engle-Granger two-step test, Augmented Dickey-Fuller test and half-life calculations

#pragma once

#include <vector>
#include <cmath>
#include <limits>
#include <optional>
#include <algorithm>
#include <Eigen/Dense>
#include "../core/exceptions.hpp"
#include "../math/mackinnon.hpp"
#include "../math/ols.hpp"
#include "../math/statistics.hpp"

namespace pairs_arb {

// ============================================================================
// Cointegration Analyzer for Pairs Trading
// ============================================================================

class CointegrationAnalyzer {
public:
    // Deterministic terms of the ADF regression
    enum class Trend {
        NONE,       // Engle-Granger residuals: already demeaned by the levels regression
        CONSTANT
    };

    struct AdfConfig {
        std::optional<int> max_lag;   // upper bound of the lag search, or the fixed lag
        bool autolag;                 // choose the lag by AIC over 0..max_lag

        AdfConfig() : max_lag(std::nullopt), autolag(true) {}

        static AdfConfig getDefault() { return AdfConfig(); }
    };

    struct RegressionResult {
        double intercept = 0.0;
        double hedge_ratio = 0.0;
        double residual_std = 0.0;     // sample std (n - 1) of the residuals
        double r_squared = 0.0;
        std::vector<double> residuals;
    };

    struct ADFResult {
        double statistic = StatisticalUtils::kNaN;
        int used_lag = 0;
        size_t nobs = 0;               // observations in the final regression
        double p_value = StatisticalUtils::kNaN;
        MacKinnon::CriticalValues critical{StatisticalUtils::kNaN, StatisticalUtils::kNaN,
                                           StatisticalUtils::kNaN};
        bool valid = false;
    };

    struct CointegrationResult {
        double hedge_ratio;        // Optimal hedge ratio from OLS
        double intercept;
        double residual_std;
        double r_squared;
        double adf_statistic;      // ADF test statistic on the residuals
        int used_lag;
        double p_value;            // MacKinnon approximate p-value
        MacKinnon::CriticalValues critical;
        bool is_cointegrated;      // p_value < significance level
        double half_life;          // Mean reversion half-life in periods
        size_t sample_size;        // Number of observations used
    };

private:
    AdfConfig config_;

    // R^2 above this means the two series are numerically colinear and the
    // residual carries no information; the test then reports adf = -inf.
    static constexpr double kColinearRSquared = 1.0 - 100.0 * 1.4901161193847656e-08;

    static size_t defaultMaxLag(size_t nobs, size_t ntrend) {
        long by_size = static_cast<long>(std::ceil(12.0 * std::pow(static_cast<double>(nobs) / 100.0, 0.25)));
        long by_half = static_cast<long>(nobs / 2) - static_cast<long>(ntrend) - 1;
        return static_cast<size_t>(std::max(0L, std::min(by_size, by_half)));
    }

    // Rows t = lag .. m-1 of the ADF design on x (m = len(diff x)):
    //   dx[t] = gamma * x[t] + sum_i phi_i * dx[t - i] (+ c)
    static void buildDesign(const std::vector<double>& x, const std::vector<double>& dx,
                            size_t lag, size_t columns, bool constant,
                            Eigen::MatrixXd& X, Eigen::VectorXd& y) {
        size_t rows = dx.size() - lag;
        size_t width = columns + (constant ? 1 : 0);
        X.resize(rows, width);
        y.resize(rows);
        for (size_t r = 0; r < rows; ++r) {
            size_t t = r + lag;
            y(r) = dx[t];
            X(r, 0) = x[t];
            for (size_t i = 1; i < columns; ++i) {
                X(r, i) = dx[t - i];
            }
            if (constant) {
                X(r, columns) = 1.0;
            }
        }
    }

public:
    explicit CointegrationAnalyzer(const AdfConfig& config = AdfConfig::getDefault())
        : config_(config) {}

    const AdfConfig& getConfig() const { return config_; }

    // OLS with intercept: y = intercept + hedge_ratio * x + e
    RegressionResult fitLevels(const std::vector<double>& y, const std::vector<double>& x) const {
        if (y.size() != x.size()) {
            throw DataException("Regression inputs differ in length: " + std::to_string(y.size()) +
                                " vs " + std::to_string(x.size()));
        }
        if (y.size() < 3) {
            throw DegenerateStatisticException("Regression needs at least 3 observations, got " +
                                               std::to_string(y.size()));
        }

        const double n = static_cast<double>(y.size());
        double mean_x = StatisticalUtils::mean(x);
        double mean_y = StatisticalUtils::mean(y);

        double sxx = 0.0, sxy = 0.0, syy = 0.0;
        for (size_t i = 0; i < x.size(); ++i) {
            double dx = x[i] - mean_x;
            double dy = y[i] - mean_y;
            sxx += dx * dx;
            sxy += dx * dy;
            syy += dy * dy;
        }
        if (sxx <= 1e-24 * n * std::max(1.0, mean_x * mean_x)) {
            throw DegenerateStatisticException("Regressor has zero variance");
        }

        RegressionResult result;
        result.hedge_ratio = sxy / sxx;
        result.intercept = mean_y - result.hedge_ratio * mean_x;
        result.residuals.reserve(y.size());
        double ssr = 0.0;
        for (size_t i = 0; i < y.size(); ++i) {
            double e = y[i] - result.intercept - result.hedge_ratio * x[i];
            result.residuals.push_back(e);
            ssr += e * e;
        }
        result.residual_std = StatisticalUtils::sampleStdDev(result.residuals);
        result.r_squared = (syy > 0.0) ? 1.0 - ssr / syy : 1.0;
        return result;
    }

    // Augmented Dickey-Fuller test. The p-value and critical values are filled
    // in for Trend::CONSTANT only; Engle-Granger uses its own tables.
    ADFResult adfTest(const std::vector<double>& series, Trend trend = Trend::CONSTANT) const {
        ADFResult result;
        if (series.size() < 4) {
            return result;
        }

        const bool constant = (trend == Trend::CONSTANT);
        const size_t ntrend = constant ? 1 : 0;

        std::vector<double> dx(series.size() - 1);
        for (size_t i = 1; i < series.size(); ++i) {
            dx[i - 1] = series[i] - series[i - 1];
        }

        size_t max_lag = config_.max_lag ? static_cast<size_t>(std::max(0, *config_.max_lag))
                                         : defaultMaxLag(series.size(), ntrend);
        // Keep at least a few degrees of freedom in the widest regression
        while (max_lag > 0 && dx.size() <= max_lag + max_lag + 1 + ntrend + 1) {
            --max_lag;
        }

        size_t best_lag = max_lag;
        if (config_.autolag) {
            // All candidates share the sample of the widest regression
            Eigen::MatrixXd X_full;
            Eigen::VectorXd y_full;
            buildDesign(series, dx, max_lag, max_lag + 1, false, X_full, y_full);

            double best_aic = std::numeric_limits<double>::infinity();
            bool found = false;
            for (size_t lag = 0; lag <= max_lag; ++lag) {
                Eigen::MatrixXd X(X_full.rows(), lag + 1 + ntrend);
                X.leftCols(lag + 1) = X_full.leftCols(lag + 1);
                if (constant) {
                    X.col(lag + 1).setOnes();
                }
                OlsResult fit = fitOls(X, y_full);
                if (fit.ok && fit.aic < best_aic) {
                    best_aic = fit.aic;
                    best_lag = lag;
                    found = true;
                }
            }
            if (!found) {
                return result;
            }
        }

        Eigen::MatrixXd X;
        Eigen::VectorXd y;
        buildDesign(series, dx, best_lag, best_lag + 1, constant, X, y);
        OlsResult fit = fitOls(X, y);
        if (!fit.ok) {
            return result;
        }

        result.statistic = fit.tValue(0);
        result.used_lag = static_cast<int>(best_lag);
        result.nobs = static_cast<size_t>(fit.nobs);
        result.valid = !std::isnan(result.statistic);
        if (constant && result.valid) {
            result.p_value = MacKinnon::pValue(result.statistic, 1);
            result.critical = MacKinnon::criticalValues(result.nobs, 1);
        }
        return result;
    }

    // Engle-Granger: regress y on x in levels, then test the residual for a unit root
    CointegrationResult testCointegration(const std::vector<double>& y,
                                          const std::vector<double>& x,
                                          double significance_level = 0.05) const {
        RegressionResult regression = fitLevels(y, x);

        CointegrationResult result;
        result.hedge_ratio = regression.hedge_ratio;
        result.intercept = regression.intercept;
        result.residual_std = regression.residual_std;
        result.r_squared = regression.r_squared;
        result.sample_size = y.size();
        result.critical = MacKinnon::criticalValues(y.size() - 1, 2);
        result.half_life = calculateHalfLife(regression.residuals);

        if (regression.r_squared >= kColinearRSquared) {
            result.adf_statistic = -std::numeric_limits<double>::infinity();
            result.used_lag = 0;
            result.p_value = 0.0;
        } else {
            ADFResult adf = adfTest(regression.residuals, Trend::NONE);
            result.adf_statistic = adf.statistic;
            result.used_lag = adf.used_lag;
            result.p_value = adf.valid ? MacKinnon::pValue(adf.statistic, 2) : StatisticalUtils::kNaN;
        }

        result.is_cointegrated = (result.p_value < significance_level);
        return result;
    }

    // Calculate half-life of mean reversion using Ornstein-Uhlenbeck process
    static double calculateHalfLife(const std::vector<double>& spread) {
        if (spread.size() < 3) return 0.0;

        // Model: y_t - y_{t-1} = lambda * (mu - y_{t-1}) + e
        // OLS regression: dy_t = a + b * y_{t-1} + e, with b = -lambda
        // Half-life = ln(2) / lambda
        std::vector<double> spread_changes;
        std::vector<double> lagged_spread;
        spread_changes.reserve(spread.size() - 1);
        lagged_spread.reserve(spread.size() - 1);

        for (size_t i = 1; i < spread.size(); ++i) {
            spread_changes.push_back(spread[i] - spread[i - 1]);
            lagged_spread.push_back(spread[i - 1]);
        }

        double mean_change = StatisticalUtils::mean(spread_changes);
        double mean_lag = StatisticalUtils::mean(lagged_spread);

        double numerator = 0.0;
        double denominator = 0.0;
        for (size_t i = 0; i < spread_changes.size(); ++i) {
            double x_diff = lagged_spread[i] - mean_lag;
            double y_diff = spread_changes[i] - mean_change;
            numerator += x_diff * y_diff;
            denominator += x_diff * x_diff;
        }

        if (std::abs(denominator) < 1e-10) return 0.0;

        double beta = numerator / denominator;
        if (beta < 0.0) {
            double lambda = -beta;
            if (lambda > 1e-12) {
                return std::log(2.0) / lambda;
            }
        }

        return 0.0;  // No mean reversion detected
    }
};

} // namespace pairs_arb
