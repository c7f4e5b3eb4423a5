// pair_trading_engine.hpp
// Bar-by-bar Pair Trading State Machine
// FLAT -> LONG_SPREAD / SHORT_SPREAD -> FLAT on z-score crossings, one position at a time

#pragma once

#include <cmath>
#include <iostream>
#include <limits>
#include <optional>
#include <string>
#include <vector>
#include "signal_builder.hpp"
#include "../core/exceptions.hpp"
#include "../core/market_types.hpp"
#include "../data/price_table.hpp"
#include "../execution/fill_model.hpp"
#include "../portfolio/trade_ledger.hpp"

namespace pairs_arb {

// One evaluation step: the signal plus both legs' quotes at the same timestamp
struct StrategyBar {
    Timestamp timestamp;
    std::optional<double> zscore;
    PricePoint quote_a;
    PricePoint quote_b;
};

// ============================================================================
// Pair Trading Engine
// ============================================================================

class PairTradingEngine {
public:
    struct EngineConfig {
        double z_entry;
        double z_exit;
        double notional_per_leg;
        bool close_at_end;             // force-close an open position on the final bar
        FillModel::ExecutionConfig execution;
        bool verbose;

        EngineConfig()
            : z_entry(2.0)
            , z_exit(0.5)
            , notional_per_leg(100000.0)
            , close_at_end(false)
            , execution(FillModel::ExecutionConfig::getDefault())
            , verbose(false) {}

        static EngineConfig getDefault() { return EngineConfig(); }
    };

    struct OpenPosition {
        PositionState direction;
        Timestamp entry_timestamp;
        double entry_price_a;
        double entry_price_b;
        double quantity_a;
        double quantity_b;
        double entry_zscore;
    };

    struct EngineState {
        InstrumentId instrument_a;
        InstrumentId instrument_b;
        PositionState position = PositionState::FLAT;
        std::optional<OpenPosition> open;
    };

    struct StepResult {
        EngineState state;
        std::optional<Trade> trade;
    };

    struct EngineStats {
        size_t bars_processed = 0;
        size_t bars_without_signal = 0;
        size_t entries = 0;
        size_t exits = 0;
        size_t forced_exits = 0;
        FillModel::ExecutionStats execution;
    };

    struct RunResult {
        TradeLedger ledger;
        EngineStats stats;
        EngineState final_state;
    };

private:
    EngineConfig config_;

    static StepResult openPosition(const EngineState& state, const StrategyBar& bar,
                                   const EngineConfig& config, PositionState direction, double z) {
        FillModel fills(config.execution);
        // LONG_SPREAD buys A and sells B; SHORT_SPREAD the reverse
        Side side_a = (direction == PositionState::LONG_SPREAD) ? Side::BUY : Side::SELL;
        Side side_b = (direction == PositionState::LONG_SPREAD) ? Side::SELL : Side::BUY;

        OpenPosition position;
        position.direction = direction;
        position.entry_timestamp = bar.timestamp;
        position.entry_price_a = fills.fillPrice(bar.quote_a, side_a, Leg::A, state.instrument_a);
        position.entry_price_b = fills.fillPrice(bar.quote_b, side_b, Leg::B, state.instrument_b);
        position.quantity_a = config.notional_per_leg / position.entry_price_a;
        position.quantity_b = config.notional_per_leg / position.entry_price_b;
        position.entry_zscore = z;

        StepResult result{state, std::nullopt};
        result.state.position = direction;
        result.state.open = position;
        return result;
    }

    static StepResult closePosition(const EngineState& state, const StrategyBar& bar,
                                    const EngineConfig& config, double z, bool forced) {
        FillModel fills(config.execution);
        const OpenPosition& pos = *state.open;
        Side side_a = (pos.direction == PositionState::LONG_SPREAD) ? Side::SELL : Side::BUY;
        Side side_b = (pos.direction == PositionState::LONG_SPREAD) ? Side::BUY : Side::SELL;

        Trade trade;
        trade.entry_timestamp = pos.entry_timestamp;
        trade.exit_timestamp = bar.timestamp;
        trade.direction = pos.direction;
        trade.entry_price_a = pos.entry_price_a;
        trade.entry_price_b = pos.entry_price_b;
        trade.exit_price_a = fills.fillPrice(bar.quote_a, side_a, Leg::A, state.instrument_a);
        trade.exit_price_b = fills.fillPrice(bar.quote_b, side_b, Leg::B, state.instrument_b);
        trade.quantity_a = pos.quantity_a;
        trade.quantity_b = pos.quantity_b;
        trade.notional_per_leg = config.notional_per_leg;
        trade.commission = fills.commission(trade.exit_price_a, trade.quantity_a, Leg::A) +
                           fills.commission(trade.exit_price_b, trade.quantity_b, Leg::B);

        double leg_a = (trade.exit_price_a - trade.entry_price_a) * trade.quantity_a;
        double leg_b = (trade.exit_price_b - trade.entry_price_b) * trade.quantity_b;
        double gross = getPositionSign(pos.direction) * (leg_a - leg_b);
        trade.realized_pnl = gross - trade.commission;
        trade.entry_zscore = pos.entry_zscore;
        trade.exit_zscore = z;
        trade.forced_exit = forced;

        StepResult result{state, trade};
        result.state.position = PositionState::FLAT;
        result.state.open.reset();
        return result;
    }

    static void recordFill(FillModel::ExecutionStats& stats, double price, double mid, double quantity) {
        stats.fills++;
        stats.total_slippage += std::abs(price - mid) * quantity;
    }

    void logTransition(const EngineState& before, const StepResult& result, const StrategyBar& bar) const {
        if (!config_.verbose) return;
        if (result.trade) {
            const Trade& t = *result.trade;
            std::cout << "[Engine] " << formatTimestamp(bar.timestamp) << " close "
                      << getPositionStateName(t.direction) << (t.forced_exit ? " (forced)" : "")
                      << " pnl=" << t.realized_pnl << std::endl;
        } else if (before.position == PositionState::FLAT && result.state.position != PositionState::FLAT) {
            std::cout << "[Engine] " << formatTimestamp(bar.timestamp) << " open "
                      << getPositionStateName(result.state.position) << " z=" << *bar.zscore
                      << " a=" << result.state.open->entry_price_a
                      << " b=" << result.state.open->entry_price_b << std::endl;
        }
    }

public:
    explicit PairTradingEngine(const EngineConfig& config = EngineConfig::getDefault())
        : config_(config) {}

    const EngineConfig& getConfig() const { return config_; }

    static EngineState initialState(const InstrumentId& a, const InstrumentId& b) {
        EngineState state;
        state.instrument_a = a;
        state.instrument_b = b;
        return state;
    }

    // Pure transition: (state, bar) -> (state', trade closed on this bar, if any)
    static StepResult step(const EngineState& state, const StrategyBar& bar, const EngineConfig& config) {
        if (!bar.zscore) {
            return {state, std::nullopt};
        }
        const double z = *bar.zscore;

        switch (state.position) {
            case PositionState::FLAT:
                if (z < -config.z_entry) {
                    return openPosition(state, bar, config, PositionState::LONG_SPREAD, z);
                }
                if (z > config.z_entry) {
                    return openPosition(state, bar, config, PositionState::SHORT_SPREAD, z);
                }
                break;
            case PositionState::LONG_SPREAD:
                if (z >= config.z_exit) {
                    return closePosition(state, bar, config, z, false);
                }
                break;
            case PositionState::SHORT_SPREAD:
                if (z <= config.z_exit) {
                    return closePosition(state, bar, config, z, false);
                }
                break;
        }
        return {state, std::nullopt};
    }

    // Close whatever is open at this bar's quotes, signal or not
    static StepResult forceClose(const EngineState& state, const StrategyBar& bar, const EngineConfig& config) {
        if (state.position == PositionState::FLAT || !state.open) {
            return {state, std::nullopt};
        }
        double z = bar.zscore ? *bar.zscore : std::numeric_limits<double>::quiet_NaN();
        return closePosition(state, bar, config, z, true);
    }

    // Join the signal with both legs' quotes
    static std::string describeCoverage(const PriceSeries& series) {
        if (series.empty()) {
            return series.getInstrumentId() + " has no quotes";
        }
        auto range = series.getDateRange();
        return series.getInstrumentId() + " covers " + formatTimestamp(range.first) + " .. " +
               formatTimestamp(range.second);
    }

    static std::vector<StrategyBar> makeBars(const SignalSeries& signal,
                                             const PriceSeries& series_a,
                                             const PriceSeries& series_b) {
        std::vector<StrategyBar> bars;
        bars.reserve(signal.size());
        for (const auto& point : signal.points) {
            auto qa = series_a.find(point.timestamp);
            auto qb = series_b.find(point.timestamp);
            if (!qa || !qb) {
                const PriceSeries& missing = qa ? series_b : series_a;
                throw DataException("Missing quote for pair " + signal.instrument_a + "/" +
                                    signal.instrument_b + " at " + formatTimestamp(point.timestamp) +
                                    ": " + describeCoverage(missing));
            }
            bars.push_back({point.timestamp, point.zscore, *qa, *qb});
        }
        return bars;
    }

    RunResult run(const std::vector<StrategyBar>& bars, const InstrumentId& instrument_a,
                  const InstrumentId& instrument_b) const {
        RunResult result;
        EngineState state = initialState(instrument_a, instrument_b);

        for (const auto& bar : bars) {
            result.stats.bars_processed++;
            if (!bar.zscore) {
                result.stats.bars_without_signal++;
            }

            StepResult next = step(state, bar, config_);
            logTransition(state, next, bar);

            if (state.position == PositionState::FLAT && next.state.position != PositionState::FLAT) {
                result.stats.entries++;
                recordFill(result.stats.execution, next.state.open->entry_price_a, bar.quote_a.mid,
                           next.state.open->quantity_a);
                recordFill(result.stats.execution, next.state.open->entry_price_b, bar.quote_b.mid,
                           next.state.open->quantity_b);
            }
            if (next.trade) {
                const Trade& t = *next.trade;
                result.stats.exits++;
                recordFill(result.stats.execution, t.exit_price_a, bar.quote_a.mid, t.quantity_a);
                recordFill(result.stats.execution, t.exit_price_b, bar.quote_b.mid, t.quantity_b);
                result.stats.execution.total_commission += t.commission;
                result.ledger.append(t);
            }
            state = std::move(next.state);
        }

        if (config_.close_at_end && !bars.empty() && state.position != PositionState::FLAT) {
            const StrategyBar& last = bars.back();
            StepResult next = forceClose(state, last, config_);
            logTransition(state, next, last);
            if (next.trade) {
                const Trade& t = *next.trade;
                result.stats.exits++;
                result.stats.forced_exits++;
                recordFill(result.stats.execution, t.exit_price_a, last.quote_a.mid, t.quantity_a);
                recordFill(result.stats.execution, t.exit_price_b, last.quote_b.mid, t.quantity_b);
                result.stats.execution.total_commission += t.commission;
                result.ledger.append(t);
            }
            state = std::move(next.state);
        }

        if (config_.verbose) {
            std::cout << "[Engine] " << instrument_a << "/" << instrument_b
                      << " bars=" << result.stats.bars_processed
                      << " no_signal=" << result.stats.bars_without_signal
                      << " trades=" << result.ledger.size()
                      << " final=" << getPositionStateName(state.position) << std::endl;
        }
        result.final_state = std::move(state);
        return result;
    }

    RunResult run(const SignalSeries& signal, const PriceSeries& series_a,
                  const PriceSeries& series_b) const {
        return run(makeBars(signal, series_a, series_b), signal.instrument_a, signal.instrument_b);
    }
};

} // namespace pairs_arb
