// pipeline.hpp
// Pairs Pipeline: end-to-end orchestration of load, screening, signal, backtest and metrics
// Owns the price table and configuration; records per-stage wall-clock timings

#pragma once

#include <chrono>
#include <iostream>
#include <optional>
#include <string>
#include <utility>
#include "../config/config_loader.hpp"
#include "../core/exceptions.hpp"
#include "../data/csv_price_loader.hpp"
#include "../data/price_table.hpp"
#include "../data/result_writer.hpp"
#include "../data/return_computer.hpp"
#include "../strategies/pair_screener.hpp"
#include "../strategies/pair_trading_engine.hpp"
#include "../strategies/signal_builder.hpp"
#include "../validation/metrics_aggregator.hpp"

namespace pairs_arb {

// ============================================================================
// Pairs Pipeline
// ============================================================================

class PairsPipeline {
public:
    struct StageTimings {
        double load_ms = 0.0;
        double returns_ms = 0.0;
        double screening_ms = 0.0;
        double signal_ms = 0.0;
        double strategy_ms = 0.0;
        double metrics_ms = 0.0;

        double total() const {
            return load_ms + returns_ms + screening_ms + signal_ms + strategy_ms + metrics_ms;
        }
    };

    struct PipelineResult {
        PairScreener::ScreeningReport screening;
        std::optional<std::pair<InstrumentId, InstrumentId>> selected_pair;
        std::optional<SignalSeries> signal;
        std::optional<PairTradingEngine::RunResult> backtest;
        std::optional<MetricsAggregator::MetricsResult> metrics;
        StageTimings timings;
    };

private:
    using Clock = std::chrono::high_resolution_clock;

    PipelineConfig config_;
    PriceTable prices_;
    bool loaded_ = false;
    double load_ms_ = 0.0;

    static double elapsedMs(Clock::time_point start) {
        return std::chrono::duration<double, std::milli>(Clock::now() - start).count();
    }

    // Screener beta when the screener produced this exact direction
    std::optional<double> screenedHedgeRatio(const PairScreener::ScreeningReport& report,
                                             const InstrumentId& a, const InstrumentId& b) const {
        for (const auto& c : report.candidates) {
            if (c.instrument_a == a && c.instrument_b == b) {
                return c.hedge_ratio;
            }
        }
        return std::nullopt;
    }

public:
    explicit PairsPipeline(const PipelineConfig& config) : config_(config) {
        ConfigLoader::validate(config_);
    }

    const PipelineConfig& getConfig() const { return config_; }
    const PriceTable& getPriceTable() const { return prices_; }

    void loadData() {
        if (config_.data_path.empty()) {
            throw ConfigurationException("No price data file given");
        }
        auto start = Clock::now();
        CsvPriceLoader loader(config_.data);
        prices_ = loader.loadCsv(config_.data_path);
        load_ms_ = elapsedMs(start);
        loaded_ = true;
    }

    void setPriceTable(PriceTable prices) {
        prices_ = std::move(prices);
        prices_.validate();
        loaded_ = true;
        load_ms_ = 0.0;
    }

    PipelineResult run() const {
        if (!loaded_) {
            throw DataException("Pipeline has no price data loaded");
        }
        if (prices_.empty()) {
            throw DataException("Price table is empty");
        }

        PipelineResult result;
        result.timings.load_ms = load_ms_;

        auto start = Clock::now();
        ReturnMatrix returns = ReturnComputer::compute(prices_);
        result.timings.returns_ms = elapsedMs(start);

        start = Clock::now();
        PairScreener screener(config_.screening);
        result.screening = screener.screen(returns, prices_);
        result.timings.screening_ms = elapsedMs(start);

        if (config_.screen_only) {
            return result;
        }

        std::optional<double> hedge_ratio;
        if (config_.pair) {
            const auto& [a, b] = *config_.pair;
            if (!prices_.contains(a) || !prices_.contains(b)) {
                throw DataException("Selected pair " + a + "/" + b + " is not in the price data");
            }
            result.selected_pair = *config_.pair;
            hedge_ratio = screenedHedgeRatio(result.screening, a, b);
        } else if (!result.screening.candidates.empty()) {
            const auto& top = result.screening.candidates.front();
            result.selected_pair = std::make_pair(top.instrument_a, top.instrument_b);
            hedge_ratio = top.hedge_ratio;
        } else {
            if (config_.verbose) {
                std::cout << "[Pipeline] no pair selected, stopping after screening" << std::endl;
            }
            return result;
        }

        const auto& [a, b] = *result.selected_pair;
        const PriceSeries& series_a = prices_.getSeries(a);
        const PriceSeries& series_b = prices_.getSeries(b);

        start = Clock::now();
        SignalBuilder builder(config_.signal);
        result.signal = hedge_ratio ? builder.build(series_a, series_b, *hedge_ratio)
                                    : builder.build(series_a, series_b);
        result.timings.signal_ms = elapsedMs(start);

        start = Clock::now();
        PairTradingEngine engine(config_.strategy);
        result.backtest = engine.run(*result.signal, series_a, series_b);
        result.timings.strategy_ms = elapsedMs(start);

        start = Clock::now();
        MetricsAggregator aggregator(config_.metrics);
        result.metrics = aggregator.aggregate(result.backtest->ledger);
        result.timings.metrics_ms = elapsedMs(start);

        if (config_.verbose) {
            std::cout << "[Pipeline] " << a << "/" << b << " trades=" << result.backtest->ledger.size()
                      << " total " << result.timings.total() << " ms" << std::endl;
        }
        return result;
    }

    // No-op without an output directory
    std::vector<std::string> writeResults(const PipelineResult& result) const {
        if (config_.output.directory.empty()) {
            return {};
        }
        ResultWriter writer(config_.output.directory);
        writer.writeScreening(result.screening);
        if (result.selected_pair && result.signal && result.backtest) {
            const auto& [a, b] = *result.selected_pair;
            if (config_.output.write_signals) {
                writer.writeSignals(*result.signal);
            }
            writer.writeTrades(a, b, result.backtest->ledger);
            if (config_.output.write_equity && result.metrics) {
                writer.writeEquity(a, b, result.metrics->equity_curve);
            }
        }
        return writer.getWrittenFiles();
    }
};

} // namespace pairs_arb
