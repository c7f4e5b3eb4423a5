// main.cpp
// Cointegrated Pairs Discovery, Signal and Backtest Engine
// Command-line front end: screen a price universe, trade one pair, report and write results

#include <algorithm>
#include <iostream>
#include <iomanip>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "config/config_loader.hpp"
#include "core/exceptions.hpp"
#include "engine/pipeline.hpp"
#include "strategies/pair_screener.hpp"
#include "validation/metrics_aggregator.hpp"

using namespace pairs_arb;

// ============================================================================
// Command Line Options (override the config file)
// ============================================================================

struct CliOptions {
    std::optional<std::string> data_file;
    std::optional<std::string> config_file;
    std::optional<std::string> pair;
    std::optional<std::string> output_dir;
    std::optional<double> min_correlation;
    std::optional<size_t> min_overlap;
    std::optional<double> significance;
    std::optional<size_t> window;
    std::optional<double> entry;
    std::optional<double> exit;
    std::optional<double> notional;
    std::optional<double> annualization;
    std::optional<std::string> direction;
    std::optional<std::string> rank_by;
    std::optional<std::string> slippage;
    std::optional<size_t> threads;
    std::optional<size_t> top_n;
    bool close_at_end = false;
    bool screen_only = false;
    bool verbose = false;
    bool help = false;
};

void printUsage(const char* program_name) {
    std::cout << "Cointegrated Pairs Engine\n";
    std::cout << "=========================\n\n";
    std::cout << "Usage: " << program_name << " --data FILE [OPTIONS]\n\n";
    std::cout << "Options:\n";
    std::cout << "  -d, --data FILE              Normalized price table (timestamp,instrument_id,bid,ask[,mid])\n";
    std::cout << "  -c, --config FILE            YAML configuration file\n";
    std::cout << "  -p, --pair A,B               Trade this pair instead of the top-ranked candidate\n";
    std::cout << "  -o, --output-dir DIR         Write CSV results to DIR\n";
    std::cout << "  --min-corr X                 Minimum |return correlation| (default: 0.5)\n";
    std::cout << "  --min-overlap N              Minimum overlapping returns (default: 500)\n";
    std::cout << "  --significance X             Cointegration p-value threshold (default: 0.05)\n";
    std::cout << "  -w, --window N               Rolling z-score window (default: 60)\n";
    std::cout << "  -e, --entry Z                Entry z-score threshold (default: 2.0)\n";
    std::cout << "  -x, --exit Z                 Exit z-score threshold (default: 0.5)\n";
    std::cout << "  --notional X                 Notional per leg (default: 100000)\n";
    std::cout << "  --annualization X            Sharpe annualization factor (default: 252)\n";
    std::cout << "  --direction best|both        Regression directions kept per pair (default: best)\n";
    std::cout << "  --rank-by correlation|p_value  Candidate ranking (default: correlation)\n";
    std::cout << "  --slippage full_spread|tick  Fill model (default: full_spread)\n";
    std::cout << "  --threads N                  Screening threads, 0 = all cores (default: 0)\n";
    std::cout << "  --top N                      Candidates printed (default: 10)\n";
    std::cout << "  --close-at-end               Force-close an open position on the last bar\n";
    std::cout << "  --screen-only                Stop after pair screening\n";
    std::cout << "  --verbose                    Enable verbose output\n";
    std::cout << "  -h, --help                   Show this help message\n";
    std::cout << "\nExamples:\n";
    std::cout << "  " << program_name << " --data prices.csv --output-dir results\n";
    std::cout << "  " << program_name << " -d prices.csv -c pairs.yaml --pair ES,NQ -e 2.5 -x 0.3\n";
}

size_t parseCount(const std::string& flag, const std::string& value) {
    if (value.empty() || value[0] == '-') {
        throw ConfigurationException(flag + " expects a non-negative integer, got '" + value + "'");
    }
    try {
        size_t consumed = 0;
        unsigned long long parsed = std::stoull(value, &consumed);
        if (consumed != value.size()) throw std::invalid_argument(value);
        return static_cast<size_t>(parsed);
    } catch (const std::logic_error&) {
        throw ConfigurationException(flag + " expects a non-negative integer, got '" + value + "'");
    }
}

double parseReal(const std::string& flag, const std::string& value) {
    try {
        size_t consumed = 0;
        double parsed = std::stod(value, &consumed);
        if (consumed != value.size()) throw std::invalid_argument(value);
        return parsed;
    } catch (const std::logic_error&) {
        throw ConfigurationException(flag + " expects a number, got '" + value + "'");
    }
}

CliOptions parseArguments(int argc, char* argv[]) {
    CliOptions options;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto value = [&]() -> std::string {
            if (i + 1 >= argc) {
                throw ConfigurationException("Missing value for " + arg);
            }
            return argv[++i];
        };

        if (arg == "-h" || arg == "--help") {
            options.help = true;
        }
        else if (arg == "-d" || arg == "--data") {
            options.data_file = value();
        }
        else if (arg == "-c" || arg == "--config") {
            options.config_file = value();
        }
        else if (arg == "-p" || arg == "--pair") {
            options.pair = value();
        }
        else if (arg == "-o" || arg == "--output-dir") {
            options.output_dir = value();
        }
        else if (arg == "--min-corr") {
            options.min_correlation = parseReal(arg, value());
        }
        else if (arg == "--min-overlap") {
            options.min_overlap = parseCount(arg, value());
        }
        else if (arg == "--significance") {
            options.significance = parseReal(arg, value());
        }
        else if (arg == "-w" || arg == "--window") {
            options.window = parseCount(arg, value());
        }
        else if (arg == "-e" || arg == "--entry") {
            options.entry = parseReal(arg, value());
        }
        else if (arg == "-x" || arg == "--exit") {
            options.exit = parseReal(arg, value());
        }
        else if (arg == "--notional") {
            options.notional = parseReal(arg, value());
        }
        else if (arg == "--annualization") {
            options.annualization = parseReal(arg, value());
        }
        else if (arg == "--direction") {
            options.direction = value();
        }
        else if (arg == "--rank-by") {
            options.rank_by = value();
        }
        else if (arg == "--slippage") {
            options.slippage = value();
        }
        else if (arg == "--threads") {
            options.threads = parseCount(arg, value());
        }
        else if (arg == "--top") {
            options.top_n = parseCount(arg, value());
        }
        else if (arg == "--close-at-end") {
            options.close_at_end = true;
        }
        else if (arg == "--screen-only") {
            options.screen_only = true;
        }
        else if (arg == "--verbose") {
            options.verbose = true;
        }
        else {
            throw ConfigurationException("Unknown argument: " + arg);
        }
    }
    return options;
}

// File values first, then command-line overrides
PipelineConfig buildConfig(const CliOptions& options) {
    PipelineConfig config = options.config_file ? ConfigLoader::loadFile(*options.config_file)
                                                : PipelineConfig::getDefault();

    if (options.data_file) config.data_path = *options.data_file;
    if (options.output_dir) config.output.directory = *options.output_dir;
    if (options.pair) {
        const std::string& text = *options.pair;
        size_t comma = text.find(',');
        if (comma == std::string::npos || text.find(',', comma + 1) != std::string::npos) {
            throw ConfigurationException("--pair expects A,B, got '" + text + "'");
        }
        config.pair = std::make_pair(text.substr(0, comma), text.substr(comma + 1));
    }
    if (options.min_correlation) config.screening.min_correlation = *options.min_correlation;
    if (options.min_overlap) config.screening.min_overlap = *options.min_overlap;
    if (options.significance) config.screening.significance_level = *options.significance;
    if (options.window) config.signal.rolling_window = *options.window;
    if (options.entry) config.strategy.z_entry = *options.entry;
    if (options.exit) config.strategy.z_exit = *options.exit;
    if (options.notional) config.strategy.notional_per_leg = *options.notional;
    if (options.annualization) config.metrics.annualization_factor = *options.annualization;
    if (options.direction) config.screening.direction = PairScreener::parseDirectionPolicy(*options.direction);
    if (options.rank_by) config.screening.rank_by = PairScreener::parseRankBy(*options.rank_by);
    if (options.slippage) config.strategy.execution.slippage_model = parseSlippageModel(*options.slippage);
    if (options.threads) config.screening.threads = *options.threads;
    if (options.top_n) config.screening.top_n = *options.top_n;
    if (options.close_at_end) config.strategy.close_at_end = true;
    if (options.screen_only) config.screen_only = true;
    if (options.verbose) config.setVerbose(true);

    ConfigLoader::validate(config);
    return config;
}

// ============================================================================
// Reporting
// ============================================================================

void printScreeningSummary(const PairScreener::ScreeningReport& report, size_t top_n) {
    std::cout << "\nPair screening: " << report.instruments << " instruments, "
              << report.pairs_evaluated << " pairs evaluated\n";
    std::cout << "  accepted=" << report.accepted
              << "  insufficient_overlap=" << report.insufficient_overlap
              << "  below_correlation=" << report.below_correlation
              << "  degenerate=" << report.degenerate
              << "  not_cointegrated=" << report.not_cointegrated << "\n\n";

    if (report.candidates.empty()) {
        return;
    }

    std::cout << std::left << std::setw(6) << "Rank" << std::setw(14) << "A" << std::setw(14) << "B"
              << std::right << std::setw(10) << "Corr" << std::setw(12) << "Beta"
              << std::setw(12) << "ResidStd" << std::setw(12) << "p-value"
              << std::setw(10) << "Overlap" << "\n";
    std::cout << std::string(90, '-') << "\n";

    size_t shown = std::min(top_n, report.candidates.size());
    for (size_t i = 0; i < shown; ++i) {
        const auto& c = report.candidates[i];
        std::cout << std::left << std::setw(6) << (i + 1) << std::setw(14) << c.instrument_a
                  << std::setw(14) << c.instrument_b << std::right << std::fixed
                  << std::setprecision(4) << std::setw(10) << c.correlation
                  << std::setw(12) << c.hedge_ratio << std::setw(12) << c.residual_std
                  << std::setprecision(6) << std::setw(12) << c.p_value
                  << std::setw(10) << c.overlap_count << "\n";
    }
    if (shown < report.candidates.size()) {
        std::cout << "  ... " << (report.candidates.size() - shown) << " more\n";
    }
    std::cout.unsetf(std::ios::fixed);
}

void printTimings(const PairsPipeline::StageTimings& t) {
    std::cout << std::fixed << std::setprecision(1);
    std::cout << "\nTimings (ms): load " << t.load_ms << ", returns " << t.returns_ms
              << ", screening " << t.screening_ms << ", signal " << t.signal_ms
              << ", strategy " << t.strategy_ms << ", metrics " << t.metrics_ms
              << ", total " << t.total() << "\n";
    std::cout.unsetf(std::ios::fixed);
}

// ============================================================================
// Main Function
// ============================================================================

int main(int argc, char* argv[]) {
    PipelineConfig config;
    try {
        CliOptions options = parseArguments(argc, argv);
        if (options.help) {
            printUsage(argv[0]);
            return 0;
        }
        config = buildConfig(options);
        if (config.data_path.empty()) {
            throw ConfigurationException("No price data given (use --data or data.path)");
        }
    } catch (const ConfigurationException& e) {
        std::cerr << e.what() << "\n\n";
        printUsage(argv[0]);
        return 2;
    } catch (const PairsArbException& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    }

    try {
        PairsPipeline pipeline(config);

        std::cout << "Loading price data from: " << config.data_path << "\n";
        pipeline.loadData();
        const PriceTable& prices = pipeline.getPriceTable();
        std::cout << "Loaded " << prices.getTotalObservations() << " observations for "
                  << prices.size() << " instruments\n";

        auto result = pipeline.run();
        printScreeningSummary(result.screening, config.screening.top_n);

        if (result.selected_pair && result.backtest && result.metrics) {
            const auto& [a, b] = *result.selected_pair;
            const auto& stats = result.backtest->stats;
            std::cout << "Backtest " << a << "/" << b << " (beta "
                      << result.signal->hedge_ratio << ", window " << result.signal->window
                      << ", slippage " << getSlippageModelName(config.strategy.execution.slippage_model)
                      << ")\n";
            std::cout << "  bars=" << stats.bars_processed
                      << "  without_signal=" << stats.bars_without_signal
                      << "  entries=" << stats.entries << "  exits=" << stats.exits
                      << "  forced_exits=" << stats.forced_exits << "\n";
            std::cout << "  slippage_cost=" << stats.execution.total_slippage
                      << "  commission=" << stats.execution.total_commission << "\n";

            PerformanceReport report;
            report.addTradeStatistics(a + "/" + b, result.metrics->summary);
            if (config.strategy.execution.slippage_model == SlippageModel::FULL_SPREAD) {
                report.addNote("every fill pays the full bid/ask spread on the whole notional; "
                               "this cost can dominate realized P&L");
            }
            report.print();
        } else if (!config.screen_only) {
            std::cout << "No cointegrated pair found; nothing to trade.\n";
        }

        for (const auto& path : pipeline.writeResults(result)) {
            std::cout << "Wrote " << path << "\n";
        }
        printTimings(result.timings);
        return 0;

    } catch (const ConfigurationException& e) {
        std::cerr << e.what() << std::endl;
        return 2;
    } catch (const PairsArbException& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
