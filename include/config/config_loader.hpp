// config_loader.hpp
// Pipeline configuration: aggregate of the component configs, YAML loading and validation
// Every threshold is checked here before any data is touched

#pragma once

#include <cmath>
#include <initializer_list>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <yaml-cpp/yaml.h>
#include "../core/exceptions.hpp"
#include "../data/csv_price_loader.hpp"
#include "../execution/fill_model.hpp"
#include "../strategies/pair_screener.hpp"
#include "../strategies/pair_trading_engine.hpp"
#include "../strategies/signal_builder.hpp"
#include "../validation/metrics_aggregator.hpp"

namespace pairs_arb {

struct OutputConfig {
    std::string directory;        // empty: no files written
    bool write_signals;
    bool write_equity;

    OutputConfig()
        : directory()
        , write_signals(true)
        , write_equity(true) {}

    static OutputConfig getDefault() { return OutputConfig(); }
};

struct PipelineConfig {
    std::string data_path;
    CsvPriceLoader::CsvConfig data;
    PairScreener::ScreenerConfig screening;
    SignalBuilder::SignalConfig signal;
    PairTradingEngine::EngineConfig strategy;
    MetricsAggregator::MetricsConfig metrics;
    OutputConfig output;

    // Explicit pair to trade; otherwise the top-ranked candidate
    std::optional<std::pair<InstrumentId, InstrumentId>> pair;
    bool screen_only;
    bool verbose;

    PipelineConfig()
        : screen_only(false)
        , verbose(false) {}

    static PipelineConfig getDefault() { return PipelineConfig(); }

    void setVerbose(bool on) {
        verbose = on;
        data.verbose = on;
        screening.verbose = on;
        signal.verbose = on;
        strategy.verbose = on;
    }
};

// ============================================================================
// Config Loader
// ============================================================================

class ConfigLoader {
private:
    static void checkKeys(const YAML::Node& node, const std::string& section,
                          std::initializer_list<const char*> allowed) {
        if (!node.IsMap()) {
            throw ConfigurationException("Section '" + section + "' must be a mapping");
        }
        std::set<std::string> known;
        for (const char* k : allowed) known.insert(k);
        for (const auto& entry : node) {
            std::string key = entry.first.as<std::string>();
            if (!known.count(key)) {
                throw ConfigurationException("Unknown key '" + section + "." + key + "'");
            }
        }
    }

    template <typename T>
    static void read(const YAML::Node& node, const std::string& section, const char* key, T& target) {
        const YAML::Node value = node[key];
        if (!value) return;
        try {
            target = value.as<T>();
        } catch (const YAML::Exception&) {
            throw ConfigurationException("Invalid value for '" + section + "." + key + "'");
        }
    }

    // Counts are read signed so a negative value is reported rather than wrapped
    static void readCount(const YAML::Node& node, const std::string& section, const char* key,
                          size_t& target) {
        long long value = static_cast<long long>(target);
        read(node, section, key, value);
        if (value < 0) {
            throw ConfigurationException("'" + section + "." + key + "' must be non-negative, got " +
                                         std::to_string(value));
        }
        target = static_cast<size_t>(value);
    }

    static void applyData(const YAML::Node& node, PipelineConfig& config) {
        checkKeys(node, "data", {"path", "delimiter", "require_sorted", "drop_duplicates"});
        read(node, "data", "path", config.data_path);
        std::string delimiter(1, config.data.delimiter);
        read(node, "data", "delimiter", delimiter);
        if (delimiter.size() != 1) {
            throw ConfigurationException("'data.delimiter' must be a single character");
        }
        config.data.delimiter = delimiter[0];
        read(node, "data", "require_sorted", config.data.require_sorted);
        read(node, "data", "drop_duplicates", config.data.drop_duplicates);
    }

    static void applyScreening(const YAML::Node& node, PipelineConfig& config) {
        checkKeys(node, "screening", {"min_correlation", "min_overlap", "significance_level",
                                      "direction", "rank_by", "adf_max_lag", "adf_autolag",
                                      "threads", "large_universe_warning_pairs", "top_n"});
        auto& s = config.screening;
        read(node, "screening", "min_correlation", s.min_correlation);
        readCount(node, "screening", "min_overlap", s.min_overlap);
        read(node, "screening", "significance_level", s.significance_level);
        if (node["direction"]) {
            std::string direction;
            read(node, "screening", "direction", direction);
            s.direction = PairScreener::parseDirectionPolicy(direction);
        }
        if (node["rank_by"]) {
            std::string rank_by;
            read(node, "screening", "rank_by", rank_by);
            s.rank_by = PairScreener::parseRankBy(rank_by);
        }
        if (node["adf_max_lag"]) {
            int lag = 0;
            read(node, "screening", "adf_max_lag", lag);
            s.adf.max_lag = lag;
        }
        read(node, "screening", "adf_autolag", s.adf.autolag);
        readCount(node, "screening", "threads", s.threads);
        readCount(node, "screening", "large_universe_warning_pairs", s.large_universe_warning_pairs);
        readCount(node, "screening", "top_n", s.top_n);
    }

    static void applyStrategy(const YAML::Node& node, PipelineConfig& config) {
        checkKeys(node, "strategy", {"z_entry", "z_exit", "notional_per_leg", "close_at_end",
                                     "slippage_model", "slippage_ticks", "tick_size_a", "tick_size_b",
                                     "commission_rate_a", "commission_rate_b", "contract_size_a",
                                     "contract_size_b", "pair"});
        auto& e = config.strategy;
        read(node, "strategy", "z_entry", e.z_entry);
        read(node, "strategy", "z_exit", e.z_exit);
        read(node, "strategy", "notional_per_leg", e.notional_per_leg);
        read(node, "strategy", "close_at_end", e.close_at_end);
        if (node["slippage_model"]) {
            std::string model;
            read(node, "strategy", "slippage_model", model);
            e.execution.slippage_model = parseSlippageModel(model);
        }
        read(node, "strategy", "slippage_ticks", e.execution.slippage_ticks);
        read(node, "strategy", "tick_size_a", e.execution.tick_size_a);
        read(node, "strategy", "tick_size_b", e.execution.tick_size_b);
        read(node, "strategy", "commission_rate_a", e.execution.commission_rate_a);
        read(node, "strategy", "commission_rate_b", e.execution.commission_rate_b);
        read(node, "strategy", "contract_size_a", e.execution.contract_size_a);
        read(node, "strategy", "contract_size_b", e.execution.contract_size_b);

        if (const YAML::Node pair = node["pair"]) {
            if (!pair.IsSequence() || pair.size() != 2) {
                throw ConfigurationException("'strategy.pair' must be a list of two instrument ids");
            }
            try {
                config.pair = std::make_pair(pair[0].as<std::string>(), pair[1].as<std::string>());
            } catch (const YAML::Exception&) {
                throw ConfigurationException("Invalid value for 'strategy.pair'");
            }
        }
    }

public:
    static PipelineConfig loadFile(const std::string& path,
                                   const PipelineConfig& base = PipelineConfig::getDefault()) {
        YAML::Node root;
        try {
            root = YAML::LoadFile(path);
        } catch (const YAML::BadFile&) {
            throw ConfigurationException("Cannot open config file: " + path);
        } catch (const YAML::Exception& e) {
            throw ConfigurationException("Malformed YAML in " + path + ": " + e.what());
        }
        return apply(root, base);
    }

    static PipelineConfig loadString(const std::string& text,
                                     const PipelineConfig& base = PipelineConfig::getDefault()) {
        YAML::Node root;
        try {
            root = YAML::Load(text);
        } catch (const YAML::Exception& e) {
            throw ConfigurationException(std::string("Malformed YAML: ") + e.what());
        }
        return apply(root, base);
    }

    // Missing keys keep the values already in `base`
    static PipelineConfig apply(const YAML::Node& root, const PipelineConfig& base) {
        PipelineConfig config = base;
        if (!root || root.IsNull()) {
            return config;
        }
        checkKeys(root, "<root>", {"data", "screening", "signal", "strategy", "metrics", "output",
                                   "verbose"});

        if (root["data"]) applyData(root["data"], config);
        if (root["screening"]) applyScreening(root["screening"], config);
        if (const YAML::Node signal = root["signal"]) {
            checkKeys(signal, "signal", {"rolling_window"});
            readCount(signal, "signal", "rolling_window", config.signal.rolling_window);
        }
        if (root["strategy"]) applyStrategy(root["strategy"], config);
        if (const YAML::Node metrics = root["metrics"]) {
            checkKeys(metrics, "metrics", {"annualization_factor"});
            read(metrics, "metrics", "annualization_factor", config.metrics.annualization_factor);
        }
        if (const YAML::Node output = root["output"]) {
            checkKeys(output, "output", {"directory", "write_signals", "write_equity"});
            read(output, "output", "directory", config.output.directory);
            read(output, "output", "write_signals", config.output.write_signals);
            read(output, "output", "write_equity", config.output.write_equity);
        }
        if (root["verbose"]) {
            bool verbose = config.verbose;
            read(root, "<root>", "verbose", verbose);
            config.setVerbose(verbose);
        }
        return config;
    }

    // Throws ConfigurationException on the first invalid setting
    static void validate(const PipelineConfig& config) {
        const auto& s = config.screening;
        if (!(s.min_correlation >= 0.0 && s.min_correlation < 1.0)) {
            throw ConfigurationException("min_correlation must be in [0, 1), got " +
                                         std::to_string(s.min_correlation));
        }
        if (s.min_overlap < 10) {
            throw ConfigurationException("min_overlap must be at least 10, got " +
                                         std::to_string(s.min_overlap));
        }
        if (!(s.significance_level > 0.0 && s.significance_level < 1.0)) {
            throw ConfigurationException("significance_level must be in (0, 1), got " +
                                         std::to_string(s.significance_level));
        }
        if (s.adf.max_lag && *s.adf.max_lag < 0) {
            throw ConfigurationException("adf_max_lag must be non-negative, got " +
                                         std::to_string(*s.adf.max_lag));
        }
        if (config.signal.rolling_window < 2) {
            throw ConfigurationException("rolling_window must be at least 2, got " +
                                         std::to_string(config.signal.rolling_window));
        }

        const auto& e = config.strategy;
        if (!(e.z_entry > 0.0) || !std::isfinite(e.z_entry)) {
            throw ConfigurationException("z_entry must be positive, got " + std::to_string(e.z_entry));
        }
        if (!(e.z_exit > -e.z_entry && e.z_exit < e.z_entry)) {
            throw ConfigurationException("z_exit must lie in (-z_entry, z_entry), got " +
                                         std::to_string(e.z_exit));
        }
        if (!(e.notional_per_leg > 0.0) || !std::isfinite(e.notional_per_leg)) {
            throw ConfigurationException("notional_per_leg must be positive, got " +
                                         std::to_string(e.notional_per_leg));
        }
        const auto& x = e.execution;
        if (!(x.commission_rate_a >= 0.0) || !(x.commission_rate_b >= 0.0)) {
            throw ConfigurationException("commission rates must be non-negative");
        }
        if (!(x.contract_size_a >= 0.0) || !(x.contract_size_b >= 0.0)) {
            throw ConfigurationException("contract sizes must be non-negative");
        }
        if (x.slippage_model == SlippageModel::TICK &&
            (!(x.tick_size_a > 0.0) || !(x.tick_size_b > 0.0) || !(x.slippage_ticks > 0.0))) {
            throw ConfigurationException("tick slippage needs positive tick sizes and slippage_ticks");
        }

        if (!(config.metrics.annualization_factor > 0.0)) {
            throw ConfigurationException("annualization_factor must be positive, got " +
                                         std::to_string(config.metrics.annualization_factor));
        }
        if (config.pair && (config.pair->first.empty() || config.pair->second.empty() ||
                            config.pair->first == config.pair->second)) {
            throw ConfigurationException("pair must name two different instruments");
        }
    }
};

} // namespace pairs_arb
