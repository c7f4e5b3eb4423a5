// price_table.hpp
// Per-instrument price series and the price table that groups them
// Series keep their own timestamp grid; nothing is forward-filled

#pragma once

#include <algorithm>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "../core/exceptions.hpp"
#include "../core/market_types.hpp"

namespace pairs_arb {

// ============================================================================
// PriceSeries - ordered quotes for one instrument
// ============================================================================

class PriceSeries {
private:
    InstrumentId instrument_id_;
    std::vector<PricePoint> points_;

public:
    PriceSeries() = default;
    explicit PriceSeries(InstrumentId id) : instrument_id_(std::move(id)) {}
    PriceSeries(InstrumentId id, std::vector<PricePoint> points)
        : instrument_id_(std::move(id)), points_(std::move(points)) {}

    const InstrumentId& getInstrumentId() const { return instrument_id_; }
    const std::vector<PricePoint>& getPoints() const { return points_; }
    size_t size() const { return points_.size(); }
    bool empty() const { return points_.empty(); }
    const PricePoint& operator[](size_t i) const { return points_[i]; }

    void append(const PricePoint& point) { points_.push_back(point); }

    // Mid-only convenience for callers without a quote book
    void append(Timestamp ts, double mid) { points_.emplace_back(ts, mid, mid, mid); }

    // Binary search on the (sorted) timestamp grid
    std::optional<PricePoint> find(Timestamp ts) const {
        auto it = std::lower_bound(points_.begin(), points_.end(), ts,
                                   [](const PricePoint& p, Timestamp t) { return p.timestamp < t; });
        if (it == points_.end() || it->timestamp != ts) {
            return std::nullopt;
        }
        return *it;
    }

    // Throws DataException on non-increasing timestamps or invalid quotes
    void validate() const {
        for (size_t i = 0; i < points_.size(); ++i) {
            const auto& p = points_[i];
            if (!p.validate()) {
                throw DataException("Invalid quote for " + instrument_id_ + " at " +
                                    formatTimestamp(p.timestamp) + " (bid=" +
                                    std::to_string(p.bid) + ", ask=" + std::to_string(p.ask) +
                                    ", mid=" + std::to_string(p.mid) + ")");
            }
            if (i > 0 && points_[i - 1].timestamp >= p.timestamp) {
                throw DataException("Non-monotonic series for " + instrument_id_ + ": " +
                                    formatTimestamp(points_[i - 1].timestamp) + " followed by " +
                                    formatTimestamp(p.timestamp));
            }
        }
    }

    std::pair<Timestamp, Timestamp> getDateRange() const {
        if (points_.empty()) {
            return {Timestamp(0), Timestamp(0)};
        }
        return {points_.front().timestamp, points_.back().timestamp};
    }
};

// ============================================================================
// PriceTable - instrument id -> PriceSeries, iterated in id order
// ============================================================================

class PriceTable {
private:
    std::map<InstrumentId, PriceSeries> series_;

public:
    void addSeries(PriceSeries series) {
        InstrumentId id = series.getInstrumentId();
        if (id.empty()) {
            throw DataException("Price series without instrument id");
        }
        series_[id] = std::move(series);
    }

    void addObservation(const InstrumentId& id, const PricePoint& point) {
        auto it = series_.find(id);
        if (it == series_.end()) {
            it = series_.emplace(id, PriceSeries(id)).first;
        }
        it->second.append(point);
    }

    bool contains(const InstrumentId& id) const { return series_.count(id) > 0; }

    const PriceSeries& getSeries(const InstrumentId& id) const {
        auto it = series_.find(id);
        if (it == series_.end()) {
            throw DataException("Unknown instrument: " + id);
        }
        return it->second;
    }

    std::vector<InstrumentId> getInstruments() const {
        std::vector<InstrumentId> ids;
        ids.reserve(series_.size());
        for (const auto& [id, _] : series_) {
            ids.push_back(id);
        }
        return ids;
    }

    const std::map<InstrumentId, PriceSeries>& getAllSeries() const { return series_; }

    size_t size() const { return series_.size(); }
    bool empty() const { return series_.empty(); }

    size_t getTotalObservations() const {
        size_t total = 0;
        for (const auto& [_, s] : series_) {
            total += s.size();
        }
        return total;
    }

    void validate() const {
        for (const auto& [_, s] : series_) {
            s.validate();
        }
    }
};

} // namespace pairs_arb
