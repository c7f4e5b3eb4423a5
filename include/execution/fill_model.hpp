// fill_model.hpp
// Slippage-adjusted Fill Prices and Commissions for the Pair Trading Engine
// Every fill crosses the quoted spread and pays a slippage penalty on top

#pragma once

#include <cmath>
#include <cstdint>
#include <string>
#include "../core/exceptions.hpp"
#include "../core/market_types.hpp"

namespace pairs_arb {

enum class Side { BUY, SELL };

enum class Leg { A, B };

enum class SlippageModel {
    FULL_SPREAD,   // buy at ask + (ask - bid), sell at bid - (ask - bid)
    TICK           // buy at ask + n ticks, sell at bid - n ticks
};

inline const char* getSlippageModelName(SlippageModel model) {
    switch (model) {
        case SlippageModel::FULL_SPREAD: return "full_spread";
        case SlippageModel::TICK: return "tick";
    }
    return "unknown";
}

inline SlippageModel parseSlippageModel(const std::string& name) {
    if (name == "full_spread") return SlippageModel::FULL_SPREAD;
    if (name == "tick") return SlippageModel::TICK;
    throw ConfigurationException("Unknown slippage model '" + name +
                                 "' (expected full_spread or tick)");
}

// ============================================================================
// Fill Model
// ============================================================================

class FillModel {
public:
    struct ExecutionConfig {
        SlippageModel slippage_model;

        // Tick model
        double slippage_ticks;
        double tick_size_a;
        double tick_size_b;

        // Round-trip commission charged on close, per leg
        double commission_rate_a;
        double commission_rate_b;
        double contract_size_a;
        double contract_size_b;

        ExecutionConfig()
            : slippage_model(SlippageModel::FULL_SPREAD)
            , slippage_ticks(1.0)
            , tick_size_a(0.01)
            , tick_size_b(0.01)
            , commission_rate_a(0.0)
            , commission_rate_b(0.0)
            , contract_size_a(1.0)
            , contract_size_b(1.0) {}

        static ExecutionConfig getDefault() {
            return ExecutionConfig();
        }
    };

    struct ExecutionStats {
        uint64_t fills = 0;
        double total_slippage = 0.0;     // sum of |fill - mid| * quantity
        double total_commission = 0.0;
    };

private:
    ExecutionConfig config_;

public:
    explicit FillModel(const ExecutionConfig& config = ExecutionConfig::getDefault())
        : config_(config) {}

    const ExecutionConfig& getConfig() const { return config_; }

    // Price adjustment paid against the trader on one fill
    double penalty(const PricePoint& quote, Leg leg) const {
        if (config_.slippage_model == SlippageModel::TICK) {
            double tick = (leg == Leg::A) ? config_.tick_size_a : config_.tick_size_b;
            return config_.slippage_ticks * tick;
        }
        return quote.spread();
    }

    // Throws DataException on an unusable quote or a non-positive fill
    double fillPrice(const PricePoint& quote, Side side, Leg leg,
                     const InstrumentId& instrument) const {
        if (!quote.validate()) {
            throw DataException("Cannot fill " + instrument + " at " +
                                formatTimestamp(quote.timestamp) + ": invalid quote (bid=" +
                                std::to_string(quote.bid) + ", ask=" + std::to_string(quote.ask) + ")");
        }
        double price = (side == Side::BUY) ? quote.ask + penalty(quote, leg)
                                           : quote.bid - penalty(quote, leg);
        if (!(price > 0.0) || !std::isfinite(price)) {
            throw DataException("Non-positive fill price for " + instrument + " at " +
                                formatTimestamp(quote.timestamp) + ": " + std::to_string(price));
        }
        return price;
    }

    // rate * exit_price * contract_size * quantity * 2 (round trip)
    double commission(double exit_price, double quantity, Leg leg) const {
        double rate = (leg == Leg::A) ? config_.commission_rate_a : config_.commission_rate_b;
        double contract = (leg == Leg::A) ? config_.contract_size_a : config_.contract_size_b;
        return rate * exit_price * contract * quantity * 2.0;
    }
};

} // namespace pairs_arb
