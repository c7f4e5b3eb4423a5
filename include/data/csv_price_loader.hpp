// csv_price_loader.hpp
// CSV Loader for the normalized price table
// Reads timestamp / instrument / bid / ask / mid rows into a PriceTable

#pragma once

#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <iostream>
#include <map>
#include <sstream>
#include <string>
#include <unordered_map>
#include <vector>
#include "price_table.hpp"
#include "../core/exceptions.hpp"
#include "../core/timestamp.hpp"

namespace pairs_arb {

// ============================================================================
// CSV Price Loader for the Normalized Quote Table
// ============================================================================

class CsvPriceLoader {
public:
    struct CsvConfig {
        char delimiter;
        bool require_sorted;    // throw on per-instrument timestamps going backwards
        bool drop_duplicates;   // keep first (timestamp, instrument) row, else throw
        bool verbose;

        CsvConfig()
            : delimiter(',')
            , require_sorted(true)
            , drop_duplicates(true)
            , verbose(false) {}

        static CsvConfig getDefault() {
            return CsvConfig();
        }
    };

    struct LoadStats {
        size_t rows_read = 0;
        size_t rows_loaded = 0;
        size_t duplicates_dropped = 0;
        size_t instruments = 0;
    };

private:
    struct ColumnMap {
        int timestamp = -1;
        int instrument = -1;
        int bid = -1;
        int ask = -1;
        int mid = -1;
    };

    CsvConfig config_;
    LoadStats stats_;

    static std::string toLower(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return s;
    }

    std::vector<std::string> splitLine(const std::string& line) const {
        std::vector<std::string> tokens;
        std::stringstream ss(line);
        std::string token;
        while (std::getline(ss, token, config_.delimiter)) {
            // Trim whitespace and optional quotes
            token.erase(0, token.find_first_not_of(" \t\r\n"));
            token.erase(token.find_last_not_of(" \t\r\n") + 1);
            if (token.size() >= 2 && token.front() == '"' && token.back() == '"') {
                token = token.substr(1, token.size() - 2);
            }
            tokens.push_back(token);
        }
        // Trailing empty field ("a,b,")
        if (!line.empty() && line.back() == config_.delimiter) {
            tokens.emplace_back();
        }
        return tokens;
    }

    ColumnMap mapColumns(const std::vector<std::string>& header, const std::string& filepath) const {
        ColumnMap columns;
        for (size_t i = 0; i < header.size(); ++i) {
            std::string name = toLower(header[i]);
            int idx = static_cast<int>(i);
            if (name == "timestamp" || name == "time" || name == "datetime") {
                columns.timestamp = idx;
            } else if (name == "instrument_id" || name == "id" || name == "instrument") {
                columns.instrument = idx;
            } else if (name == "bid" || name == "bid_usd") {
                columns.bid = idx;
            } else if (name == "ask" || name == "ask_usd") {
                columns.ask = idx;
            } else if (name == "mid" || name == "mid_usd") {
                columns.mid = idx;
            }
        }

        std::string missing;
        if (columns.timestamp < 0) missing += " timestamp";
        if (columns.instrument < 0) missing += " instrument_id";
        if (columns.bid < 0) missing += " bid";
        if (columns.ask < 0) missing += " ask";
        if (!missing.empty()) {
            throw DataException("Missing required column(s)" + missing + " in " + filepath);
        }
        return columns;
    }

    static double parseNumber(const std::string& field, const char* name, const std::string& where) {
        if (field.empty()) {
            throw DataException(std::string("Empty ") + name + " at " + where);
        }
        size_t consumed = 0;
        double value = 0.0;
        try {
            value = std::stod(field, &consumed);
        } catch (const std::exception&) {
            throw DataException(std::string("Invalid ") + name + " '" + field + "' at " + where);
        }
        if (consumed != field.size() || !std::isfinite(value)) {
            throw DataException(std::string("Invalid ") + name + " '" + field + "' at " + where);
        }
        return value;
    }

public:
    CsvPriceLoader() : config_(CsvConfig::getDefault()) {}

    explicit CsvPriceLoader(const CsvConfig& config) : config_(config) {}

    PriceTable loadCsv(const std::string& filepath) {
        std::ifstream file(filepath);
        if (!file.is_open()) {
            throw DataException("Failed to open CSV file: " + filepath);
        }
        return load(file, filepath);
    }

    // Stream overload; `source` names the input in error messages
    PriceTable load(std::istream& input, const std::string& source = "<stream>") {
        stats_ = LoadStats{};

        std::string line;
        if (!std::getline(input, line)) {
            throw DataException("Empty CSV file: " + source);
        }
        ColumnMap columns = mapColumns(splitLine(line), source);
        int max_column = std::max({columns.timestamp, columns.instrument, columns.bid,
                                   columns.ask, columns.mid});

        std::map<InstrumentId, std::vector<PricePoint>> rows;
        size_t line_num = 1;
        while (std::getline(input, line)) {
            line_num++;
            if (line.empty() || line.find_first_not_of(" \t\r\n") == std::string::npos) continue;

            auto tokens = splitLine(line);
            std::string where = source + ":" + std::to_string(line_num);
            if (static_cast<int>(tokens.size()) <= max_column) {
                throw DataException("Invalid CSV format at " + where + " (expected at least " +
                                    std::to_string(max_column + 1) + " fields)");
            }
            stats_.rows_read++;

            const std::string& instrument = tokens[columns.instrument];
            if (instrument.empty()) {
                throw DataException("Missing instrument id at " + where);
            }

            PricePoint point;
            try {
                point.timestamp = parseTimestamp(tokens[columns.timestamp]);
            } catch (const DataException&) {
                throw DataException("Bad timestamp '" + tokens[columns.timestamp] + "' at " + where);
            }
            point.bid = parseNumber(tokens[columns.bid], "bid", where);
            point.ask = parseNumber(tokens[columns.ask], "ask", where);
            point.mid = (columns.mid >= 0) ? parseNumber(tokens[columns.mid], "mid", where)
                                           : (point.bid + point.ask) / 2.0;

            if (!point.validate()) {
                throw DataException("Invalid quote for " + instrument + " at " + where +
                                    " (bid=" + tokens[columns.bid] + ", ask=" +
                                    tokens[columns.ask] + ")");
            }

            auto& series_rows = rows[instrument];
            if (config_.require_sorted && !series_rows.empty() &&
                point.timestamp < series_rows.back().timestamp) {
                throw DataException("Non-monotonic timestamps for " + instrument + " at " + where +
                                    ": " + formatTimestamp(series_rows.back().timestamp) +
                                    " followed by " + formatTimestamp(point.timestamp));
            }
            series_rows.push_back(point);
        }

        if (rows.empty()) {
            throw DataException("No valid rows loaded from: " + source);
        }

        PriceTable table;
        for (auto& [instrument, points] : rows) {
            if (!config_.require_sorted) {
                std::stable_sort(points.begin(), points.end(),
                                 [](const PricePoint& a, const PricePoint& b) {
                                     return a.timestamp < b.timestamp;
                                 });
            }

            std::vector<PricePoint> unique_points;
            unique_points.reserve(points.size());
            for (const auto& p : points) {
                if (!unique_points.empty() && unique_points.back().timestamp == p.timestamp) {
                    if (!config_.drop_duplicates) {
                        throw DataException("Duplicate timestamp " + formatTimestamp(p.timestamp) +
                                            " for " + instrument + " in " + source);
                    }
                    stats_.duplicates_dropped++;
                    continue;
                }
                unique_points.push_back(p);
            }

            stats_.rows_loaded += unique_points.size();
            table.addSeries(PriceSeries(instrument, std::move(unique_points)));
        }
        stats_.instruments = table.size();

        if (stats_.duplicates_dropped > 0) {
            std::cerr << "[Loader] WARNING: dropped " << stats_.duplicates_dropped
                      << " duplicate (timestamp, instrument) rows from " << source << std::endl;
        }
        if (config_.verbose) {
            std::cout << "[Loader] " << source << ": " << stats_.rows_loaded << " rows, "
                      << stats_.instruments << " instruments" << std::endl;
        }

        table.validate();
        return table;
    }

    const LoadStats& getStats() const { return stats_; }
};

} // namespace pairs_arb
