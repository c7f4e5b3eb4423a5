// metrics_aggregator.hpp
// Trade-ledger performance metrics and the text report built from them
// Reduces realized trade P&L into summary statistics and a cumulative equity curve

#pragma once

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>
#include "../core/timestamp.hpp"
#include "../math/statistics.hpp"
#include "../portfolio/trade_ledger.hpp"

namespace pairs_arb {

// ============================================================================
// Metrics Aggregator
// ============================================================================

class MetricsAggregator {
public:
    struct MetricsConfig {
        double annualization_factor;   // periods per year applied to the per-trade Sharpe

        MetricsConfig()
            : annualization_factor(252.0) {}

        static MetricsConfig getDefault() { return MetricsConfig(); }
    };

    struct EquityPoint {
        Timestamp timestamp;
        double cumulative_pnl;
    };

    // NaN marks a ratio or average that does not exist for the ledger
    struct PerformanceSummary {
        size_t total_trades = 0;
        size_t winning_trades = 0;
        size_t losing_trades = 0;
        double win_rate = StatisticalUtils::kNaN;
        double average_pnl = StatisticalUtils::kNaN;
        double total_pnl = 0.0;
        double best_trade = StatisticalUtils::kNaN;
        double worst_trade = StatisticalUtils::kNaN;
        double pnl_std = StatisticalUtils::kNaN;
        double sharpe_ratio = StatisticalUtils::kNaN;
        double max_drawdown = 0.0;
    };

    struct MetricsResult {
        PerformanceSummary summary;
        std::vector<EquityPoint> equity_curve;
    };

private:
    MetricsConfig config_;

public:
    explicit MetricsAggregator(const MetricsConfig& config = MetricsConfig::getDefault())
        : config_(config) {}

    const MetricsConfig& getConfig() const { return config_; }

    // Running sum of realized P&L ordered by exit timestamp
    static std::vector<EquityPoint> buildEquityCurve(const TradeLedger& ledger) {
        std::vector<const Trade*> ordered;
        ordered.reserve(ledger.size());
        for (const auto& t : ledger.getTrades()) {
            ordered.push_back(&t);
        }
        std::stable_sort(ordered.begin(), ordered.end(), [](const Trade* l, const Trade* r) {
            return l->exit_timestamp < r->exit_timestamp;
        });

        std::vector<EquityPoint> curve;
        curve.reserve(ordered.size());
        double cumulative = 0.0;
        for (const Trade* t : ordered) {
            cumulative += t->realized_pnl;
            curve.push_back({t->exit_timestamp, cumulative});
        }
        return curve;
    }

    // Largest peak-to-trough fall of the cumulative P&L, starting from zero
    static double calculateMaxDrawdown(const std::vector<EquityPoint>& curve) {
        double peak = 0.0;
        double max_dd = 0.0;
        for (const auto& p : curve) {
            peak = std::max(peak, p.cumulative_pnl);
            max_dd = std::max(max_dd, peak - p.cumulative_pnl);
        }
        return max_dd;
    }

    MetricsResult aggregate(const TradeLedger& ledger) const {
        MetricsResult result;
        result.equity_curve = buildEquityCurve(ledger);

        PerformanceSummary& s = result.summary;
        s.total_trades = ledger.size();
        if (ledger.empty()) {
            return result;
        }

        std::vector<double> pnls = ledger.getPnls();
        for (double p : pnls) {
            s.total_pnl += p;
            if (p > 0.0) s.winning_trades++;
            else if (p < 0.0) s.losing_trades++;
        }
        s.win_rate = static_cast<double>(s.winning_trades) / static_cast<double>(s.total_trades);
        s.average_pnl = StatisticalUtils::mean(pnls);
        s.best_trade = *std::max_element(pnls.begin(), pnls.end());
        s.worst_trade = *std::min_element(pnls.begin(), pnls.end());
        s.pnl_std = StatisticalUtils::sampleStdDev(pnls);
        if (!std::isnan(s.pnl_std) && s.pnl_std > 0.0) {
            s.sharpe_ratio = s.average_pnl / s.pnl_std * std::sqrt(config_.annualization_factor);
        }
        s.max_drawdown = calculateMaxDrawdown(result.equity_curve);
        return result;
    }
};

// ============================================================================
// Performance Report Generator
// ============================================================================

class PerformanceReport {
private:
    std::ostringstream report_;

    void addSection(const std::string& title) {
        report_ << "\n" << std::string(70, '=') << "\n";
        report_ << title << "\n";
        report_ << std::string(70, '=') << "\n\n";
    }

    static std::string formatValue(double value, int precision = 4) {
        if (std::isnan(value)) return "n/a";
        std::ostringstream out;
        out << std::fixed << std::setprecision(precision) << value;
        return out.str();
    }

public:
    void addTradeStatistics(const std::string& pair_name,
                            const MetricsAggregator::PerformanceSummary& s) {
        addSection("TRADE STATISTICS: " + pair_name);

        report_ << "Total Trades:       " << s.total_trades << "\n";
        report_ << "Winning / Losing:   " << s.winning_trades << " / " << s.losing_trades << "\n";
        report_ << "Win Rate:           "
                << (std::isnan(s.win_rate) ? std::string("n/a") : formatValue(s.win_rate * 100, 2) + "%")
                << "\n";
        report_ << "Average P&L:        " << formatValue(s.average_pnl, 2) << "\n";
        report_ << "Total P&L:          " << formatValue(s.total_pnl, 2) << "\n";
        report_ << "Best / Worst Trade: " << formatValue(s.best_trade, 2) << " / "
                << formatValue(s.worst_trade, 2) << "\n";
        report_ << "Sharpe Ratio:       " << formatValue(s.sharpe_ratio) << "\n";
        report_ << "Max Drawdown:       " << formatValue(s.max_drawdown, 2) << "\n";
    }

    void addNote(const std::string& note) {
        report_ << "\nNote: " << note << "\n";
    }

    std::string getReport() const {
        return report_.str();
    }

    void print() const {
        std::cout << getReport();
    }
};

} // namespace pairs_arb
