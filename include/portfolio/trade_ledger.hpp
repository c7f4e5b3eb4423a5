// trade_ledger.hpp
// Closed pair trades and the append-only ledger that records them
// Only realized P&L is tracked; open positions are never marked to market

#pragma once

#include <vector>
#include "../core/market_types.hpp"

namespace pairs_arb {

struct Trade {
    Timestamp entry_timestamp;
    Timestamp exit_timestamp;
    PositionState direction;        // LONG_SPREAD or SHORT_SPREAD
    double entry_price_a;
    double entry_price_b;
    double exit_price_a;
    double exit_price_b;
    double quantity_a;
    double quantity_b;
    double notional_per_leg;
    double commission;
    double realized_pnl;            // net of commission
    double entry_zscore;
    double exit_zscore;             // NaN on a forced exit without a signal
    bool forced_exit;
};

// ============================================================================
// Trade Ledger - append-only, ordered by close
// ============================================================================

class TradeLedger {
private:
    std::vector<Trade> trades_;

public:
    void append(const Trade& trade) { trades_.push_back(trade); }

    const std::vector<Trade>& getTrades() const { return trades_; }
    size_t size() const { return trades_.size(); }
    bool empty() const { return trades_.empty(); }
    const Trade& operator[](size_t i) const { return trades_[i]; }

    std::vector<double> getPnls() const {
        std::vector<double> pnls;
        pnls.reserve(trades_.size());
        for (const auto& t : trades_) {
            pnls.push_back(t.realized_pnl);
        }
        return pnls;
    }
};

} // namespace pairs_arb
