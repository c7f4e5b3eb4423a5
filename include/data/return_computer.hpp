// return_computer.hpp
// Log-return computation and the sparse return matrix
// Each instrument keeps its own timestamp column; missing cells are simply absent

#pragma once

#include <algorithm>
#include <cmath>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>
#include "price_table.hpp"
#include "../core/exceptions.hpp"

namespace pairs_arb {

// ============================================================================
// ReturnMatrix - sparse (timestamp, instrument) -> log-return
// ============================================================================

class ReturnMatrix {
public:
    struct ReturnPoint {
        Timestamp timestamp;
        double value;
    };
    using Column = std::vector<ReturnPoint>;

    // Two columns restricted to the timestamps they share
    struct AlignedColumns {
        std::vector<Timestamp> timestamps;
        std::vector<double> a;
        std::vector<double> b;
    };

private:
    std::map<InstrumentId, Column> columns_;

public:
    void setColumn(const InstrumentId& id, Column column) {
        columns_[id] = std::move(column);
    }

    bool contains(const InstrumentId& id) const { return columns_.count(id) > 0; }

    const Column& getColumn(const InstrumentId& id) const {
        auto it = columns_.find(id);
        if (it == columns_.end()) {
            throw DataException("No return column for instrument: " + id);
        }
        return it->second;
    }

    std::vector<InstrumentId> getInstruments() const {
        std::vector<InstrumentId> ids;
        ids.reserve(columns_.size());
        for (const auto& [id, _] : columns_) {
            ids.push_back(id);
        }
        return ids;
    }

    std::optional<double> getValue(Timestamp ts, const InstrumentId& id) const {
        auto it = columns_.find(id);
        if (it == columns_.end()) return std::nullopt;
        const auto& col = it->second;
        auto pos = std::lower_bound(col.begin(), col.end(), ts,
                                    [](const ReturnPoint& p, Timestamp t) { return p.timestamp < t; });
        if (pos == col.end() || pos->timestamp != ts) return std::nullopt;
        return pos->value;
    }

    // Union of all instruments' timestamps (the rows of the wide table)
    std::vector<Timestamp> getTimestamps() const {
        std::set<Timestamp> all;
        for (const auto& [_, col] : columns_) {
            for (const auto& p : col) all.insert(p.timestamp);
        }
        return std::vector<Timestamp>(all.begin(), all.end());
    }

    size_t size() const { return columns_.size(); }

    // Merge-join of two sorted columns
    AlignedColumns align(const InstrumentId& a, const InstrumentId& b) const {
        const Column& col_a = getColumn(a);
        const Column& col_b = getColumn(b);
        AlignedColumns aligned;
        size_t i = 0, j = 0;
        while (i < col_a.size() && j < col_b.size()) {
            if (col_a[i].timestamp < col_b[j].timestamp) {
                ++i;
            } else if (col_b[j].timestamp < col_a[i].timestamp) {
                ++j;
            } else {
                aligned.timestamps.push_back(col_a[i].timestamp);
                aligned.a.push_back(col_a[i].value);
                aligned.b.push_back(col_b[j].value);
                ++i;
                ++j;
            }
        }
        return aligned;
    }

    size_t overlapCount(const InstrumentId& a, const InstrumentId& b) const {
        const Column& col_a = getColumn(a);
        const Column& col_b = getColumn(b);
        size_t count = 0, i = 0, j = 0;
        while (i < col_a.size() && j < col_b.size()) {
            if (col_a[i].timestamp < col_b[j].timestamp) {
                ++i;
            } else if (col_b[j].timestamp < col_a[i].timestamp) {
                ++j;
            } else {
                ++count;
                ++i;
                ++j;
            }
        }
        return count;
    }
};

// ============================================================================
// ReturnComputer - per-instrument log-returns, no cross-instrument alignment
// ============================================================================

class ReturnComputer {
public:
    // r[t_i] = ln(mid[t_i]) - ln(mid[t_{i-1}]) using the instrument's own previous row
    static ReturnMatrix::Column computeLogReturns(const PriceSeries& series) {
        series.validate();

        ReturnMatrix::Column column;
        if (series.size() < 2) {
            return column;
        }
        column.reserve(series.size() - 1);

        const auto& points = series.getPoints();
        double prev_log = std::log(points[0].mid);
        for (size_t i = 1; i < points.size(); ++i) {
            double cur_log = std::log(points[i].mid);
            column.push_back({points[i].timestamp, cur_log - prev_log});
            prev_log = cur_log;
        }
        return column;
    }

    // Instruments with fewer than two observations get an empty column
    static ReturnMatrix compute(const PriceTable& table) {
        ReturnMatrix matrix;
        for (const auto& [id, series] : table.getAllSeries()) {
            matrix.setColumn(id, computeLogReturns(series));
        }
        return matrix;
    }
};

} // namespace pairs_arb
