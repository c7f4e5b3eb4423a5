// result_writer.hpp
// CSV output of screening results, signals, trades and equity curves
// Absent values (undefined z-score, NaN statistics) are written as empty fields

#pragma once

#include <cmath>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <limits>
#include <sstream>
#include <string>
#include <vector>
#include "../core/exceptions.hpp"
#include "../core/timestamp.hpp"
#include "../portfolio/trade_ledger.hpp"
#include "../strategies/pair_screener.hpp"
#include "../strategies/signal_builder.hpp"
#include "../validation/metrics_aggregator.hpp"

namespace pairs_arb {

class ResultWriter {
private:
    std::filesystem::path directory_;
    std::vector<std::string> written_;

    static std::string num(double value) {
        if (std::isnan(value)) return "";
        std::ostringstream out;
        out << std::setprecision(std::numeric_limits<double>::max_digits10) << value;
        return out.str();
    }

    // Opens `filename`, streams it through `write` and records it once it is flushed intact
    template <typename WriteFn>
    void writeFile(const std::string& filename, WriteFn write) {
        std::filesystem::path path = directory_ / filename;
        std::ofstream file(path);
        if (!file.is_open()) {
            throw DataException("Cannot write output file: " + path.string());
        }
        write(file);
        file.flush();
        checkStream(file, path.string());
        written_.push_back(path.string());
    }

public:
    explicit ResultWriter(const std::string& directory) : directory_(directory) {
        std::error_code ec;
        std::filesystem::create_directories(directory_, ec);
        if (ec) {
            throw DataException("Cannot create output directory " + directory + ": " + ec.message());
        }
    }

    static void checkStream(const std::ostream& out, const std::string& name) {
        if (!out) {
            throw DataException("Write failed for output file: " + name);
        }
    }

    static std::string pairSuffix(const InstrumentId& a, const InstrumentId& b) {
        return a + "_" + b;
    }

    // Streams are written by the file-free overloads so tests can capture them
    static void writeCandidates(std::ostream& out, const std::vector<PairScreener::PairCandidate>& candidates) {
        out << "rank,instrument_a,instrument_b,correlation,beta,intercept,residual_std,p_value,"
               "adf_statistic,used_lag,half_life,overlap_count\n";
        size_t rank = 1;
        for (const auto& c : candidates) {
            out << rank++ << ',' << c.instrument_a << ',' << c.instrument_b << ','
                << num(c.correlation) << ',' << num(c.hedge_ratio) << ',' << num(c.intercept) << ','
                << num(c.residual_std) << ',' << num(c.p_value) << ',' << num(c.adf_statistic) << ','
                << c.used_lag << ',' << num(c.half_life) << ',' << c.overlap_count << '\n';
        }
    }

    static void writeOutcomes(std::ostream& out, const std::vector<PairScreener::ScreeningOutcome>& outcomes) {
        out << "instrument_a,instrument_b,status,overlap_count,correlation,p_value\n";
        for (const auto& o : outcomes) {
            out << o.instrument_a << ',' << o.instrument_b << ','
                << PairScreener::getStatusName(o.status) << ',' << o.overlap_count << ','
                << num(o.correlation) << ',' << num(o.p_value) << '\n';
        }
    }

    static void writeSignals(std::ostream& out, const SignalSeries& signal) {
        out << "timestamp,price_a,price_b,spread,zscore\n";
        for (const auto& p : signal.points) {
            out << formatTimestamp(p.timestamp) << ',' << num(p.price_a) << ',' << num(p.price_b)
                << ',' << num(p.spread) << ',' << (p.zscore ? num(*p.zscore) : std::string()) << '\n';
        }
    }

    static void writeTrades(std::ostream& out, const TradeLedger& ledger) {
        out << "entry_timestamp,exit_timestamp,direction,entry_price_a,entry_price_b,exit_price_a,"
               "exit_price_b,quantity_a,quantity_b,notional_per_leg,commission,realized_pnl,"
               "entry_zscore,exit_zscore,forced_exit\n";
        for (const auto& t : ledger.getTrades()) {
            out << formatTimestamp(t.entry_timestamp) << ',' << formatTimestamp(t.exit_timestamp) << ','
                << getPositionStateName(t.direction) << ',' << num(t.entry_price_a) << ','
                << num(t.entry_price_b) << ',' << num(t.exit_price_a) << ',' << num(t.exit_price_b) << ','
                << num(t.quantity_a) << ',' << num(t.quantity_b) << ',' << num(t.notional_per_leg) << ','
                << num(t.commission) << ',' << num(t.realized_pnl) << ',' << num(t.entry_zscore) << ','
                << num(t.exit_zscore) << ',' << (t.forced_exit ? "true" : "false") << '\n';
        }
    }

    static void writeEquity(std::ostream& out, const std::vector<MetricsAggregator::EquityPoint>& curve) {
        out << "timestamp,cumulative_pnl\n";
        for (const auto& p : curve) {
            out << formatTimestamp(p.timestamp) << ',' << num(p.cumulative_pnl) << '\n';
        }
    }

    void writeScreening(const PairScreener::ScreeningReport& report) {
        writeFile("pairs.csv", [&](std::ostream& out) { writeCandidates(out, report.candidates); });
        writeFile("screening_outcomes.csv", [&](std::ostream& out) { writeOutcomes(out, report.outcomes); });
    }

    void writeSignals(const SignalSeries& signal) {
        writeFile("signals_" + pairSuffix(signal.instrument_a, signal.instrument_b) + ".csv",
                  [&](std::ostream& out) { writeSignals(out, signal); });
    }

    void writeTrades(const InstrumentId& a, const InstrumentId& b, const TradeLedger& ledger) {
        writeFile("trades_" + pairSuffix(a, b) + ".csv",
                  [&](std::ostream& out) { writeTrades(out, ledger); });
    }

    void writeEquity(const InstrumentId& a, const InstrumentId& b,
                     const std::vector<MetricsAggregator::EquityPoint>& curve) {
        writeFile("equity_" + pairSuffix(a, b) + ".csv",
                  [&](std::ostream& out) { writeEquity(out, curve); });
    }

    const std::vector<std::string>& getWrittenFiles() const { return written_; }
};

} // namespace pairs_arb
