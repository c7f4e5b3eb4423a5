// market_types.hpp
// Basic Type Definitions for the Cointegrated Pairs Engine
// Quote observations, position states and their helpers

#pragma once

#include <chrono>
#include <cmath>
#include <string>
#include "timestamp.hpp"

namespace pairs_arb {

using InstrumentId = std::string;

// ============================================================================
// Price Observation - one normalized quote for one instrument
// ============================================================================

struct PricePoint {
    Timestamp timestamp;
    double bid;
    double ask;
    double mid;

    PricePoint() : timestamp(0), bid(0), ask(0), mid(0) {}
    PricePoint(Timestamp ts, double b, double a, double m)
        : timestamp(ts), bid(b), ask(a), mid(m) {}

    bool validate() const {
        return std::isfinite(bid) && std::isfinite(ask) && std::isfinite(mid) &&
               bid > 0 && ask > 0 && mid > 0 && bid <= ask;
    }

    double spread() const { return ask - bid; }
};

// ============================================================================
// Position State of the pair trading engine
// ============================================================================

enum class PositionState { FLAT, LONG_SPREAD, SHORT_SPREAD };

inline const char* getPositionStateName(PositionState state) {
    switch (state) {
        case PositionState::FLAT: return "FLAT";
        case PositionState::LONG_SPREAD: return "LONG_SPREAD";
        case PositionState::SHORT_SPREAD: return "SHORT_SPREAD";
    }
    return "UNKNOWN";
}

// +1 long spread (long A, short B), -1 short spread, 0 flat
inline int getPositionSign(PositionState state) {
    switch (state) {
        case PositionState::LONG_SPREAD: return 1;
        case PositionState::SHORT_SPREAD: return -1;
        case PositionState::FLAT: return 0;
    }
    return 0;
}

} // namespace pairs_arb
