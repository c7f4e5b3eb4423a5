// signal_builder.hpp
// Spread and Rolling Z-score Construction for one Instrument Pair
// spread = price_a - beta * price_b, z-score over a trailing window (no lookahead)

#pragma once

#include <cmath>
#include <iostream>
#include <optional>
#include <string>
#include <vector>
#include "cointegration_analyzer.hpp"
#include "rolling_statistics.hpp"
#include "../core/exceptions.hpp"
#include "../data/price_table.hpp"

namespace pairs_arb {

struct SignalPoint {
    Timestamp timestamp;
    double price_a;
    double price_b;
    double spread;
    std::optional<double> zscore;   // empty before a full window or on zero rolling std
};

struct SignalSeries {
    InstrumentId instrument_a;
    InstrumentId instrument_b;
    double hedge_ratio = 0.0;
    size_t window = 0;
    std::vector<SignalPoint> points;

    size_t size() const { return points.size(); }
    bool empty() const { return points.empty(); }

    size_t countDefined() const {
        size_t n = 0;
        for (const auto& p : points) {
            if (p.zscore) ++n;
        }
        return n;
    }
};

// ============================================================================
// Signal Builder
// ============================================================================

class SignalBuilder {
public:
    struct SignalConfig {
        size_t rolling_window;
        bool verbose;

        SignalConfig()
            : rolling_window(60)
            , verbose(false) {}

        static SignalConfig getDefault() { return SignalConfig(); }
    };

private:
    SignalConfig config_;

    // Mid prices at the timestamps both series share
    static void intersect(const PriceSeries& a, const PriceSeries& b,
                          std::vector<Timestamp>& timestamps,
                          std::vector<double>& prices_a, std::vector<double>& prices_b) {
        const auto& pa = a.getPoints();
        const auto& pb = b.getPoints();
        size_t i = 0, j = 0;
        while (i < pa.size() && j < pb.size()) {
            if (pa[i].timestamp < pb[j].timestamp) {
                ++i;
            } else if (pb[j].timestamp < pa[i].timestamp) {
                ++j;
            } else {
                timestamps.push_back(pa[i].timestamp);
                prices_a.push_back(pa[i].mid);
                prices_b.push_back(pb[j].mid);
                ++i;
                ++j;
            }
        }
    }

public:
    explicit SignalBuilder(const SignalConfig& config = SignalConfig::getDefault())
        : config_(config) {
        if (config_.rolling_window < 2) {
            throw ConfigurationException("rolling_window must be at least 2, got " +
                                         std::to_string(config_.rolling_window));
        }
    }

    const SignalConfig& getConfig() const { return config_; }

    // Signal with a hedge ratio from the screener
    SignalSeries build(const PriceSeries& a, const PriceSeries& b, double hedge_ratio) const {
        if (!std::isfinite(hedge_ratio)) {
            throw DegenerateStatisticException("Non-finite hedge ratio for " +
                                               a.getInstrumentId() + "/" + b.getInstrumentId());
        }
        a.validate();
        b.validate();

        std::vector<Timestamp> timestamps;
        std::vector<double> prices_a, prices_b;
        intersect(a, b, timestamps, prices_a, prices_b);

        SignalSeries signal;
        signal.instrument_a = a.getInstrumentId();
        signal.instrument_b = b.getInstrumentId();
        signal.hedge_ratio = hedge_ratio;
        signal.window = config_.rolling_window;
        signal.points.reserve(timestamps.size());

        RollingStatistics rolling(config_.rolling_window);
        size_t degenerate = 0;
        for (size_t i = 0; i < timestamps.size(); ++i) {
            double spread = prices_a[i] - hedge_ratio * prices_b[i];
            rolling.update(spread);
            if (rolling.isDegenerate()) ++degenerate;
            signal.points.push_back({timestamps[i], prices_a[i], prices_b[i], spread,
                                     rolling.getZScore()});
        }

        if (config_.verbose) {
            std::cout << "[Signal] " << signal.instrument_a << "/" << signal.instrument_b
                      << " beta=" << hedge_ratio << " points=" << signal.size()
                      << " defined=" << signal.countDefined()
                      << " zero_std=" << degenerate << std::endl;
        }
        return signal;
    }

    // Signal for a user-chosen pair: beta from OLS over the shared timestamps
    SignalSeries build(const PriceSeries& a, const PriceSeries& b) const {
        a.validate();
        b.validate();
        std::vector<Timestamp> timestamps;
        std::vector<double> prices_a, prices_b;
        intersect(a, b, timestamps, prices_a, prices_b);

        CointegrationAnalyzer analyzer;
        auto fit = analyzer.fitLevels(prices_a, prices_b);
        if (config_.verbose) {
            std::cout << "[Signal] fitted hedge ratio " << fit.hedge_ratio << " (intercept "
                      << fit.intercept << ", r2 " << fit.r_squared << ")" << std::endl;
        }
        return build(a, b, fit.hedge_ratio);
    }
};

} // namespace pairs_arb
