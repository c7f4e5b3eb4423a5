// test_config_loader.cpp
// YAML configuration sections, unknown keys, type errors and validation rules

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include "../include/config/config_loader.hpp"
#include "../include/core/exceptions.hpp"
#include "test_reporter.hpp"

using namespace pairs_arb;
using namespace pairs_arb::testing;

void test_defaults() {
    PipelineConfig config = PipelineConfig::getDefault();
    ConfigLoader::validate(config);
    checkNear(config.screening.min_correlation, 0.5, 0.0, "default min_correlation");
    check(config.screening.min_overlap == 500, "default min_overlap");
    checkNear(config.screening.significance_level, 0.05, 0.0, "default significance");
    check(config.signal.rolling_window == 60, "default rolling window");
    checkNear(config.strategy.z_entry, 2.0, 0.0, "default z_entry");
    checkNear(config.strategy.z_exit, 0.5, 0.0, "default z_exit");
    checkNear(config.strategy.notional_per_leg, 100000.0, 0.0, "default notional");
    check(config.strategy.execution.slippage_model == SlippageModel::FULL_SPREAD, "default slippage");
    check(!config.pair, "no pair by default");
}

void test_all_sections() {
    const std::string yaml =
        "data:\n"
        "  path: prices.csv\n"
        "  delimiter: ';'\n"
        "  drop_duplicates: false\n"
        "screening:\n"
        "  min_correlation: 0.7\n"
        "  min_overlap: 250\n"
        "  significance_level: 0.01\n"
        "  direction: both\n"
        "  rank_by: p_value\n"
        "  adf_max_lag: 4\n"
        "  adf_autolag: false\n"
        "  threads: 3\n"
        "signal:\n"
        "  rolling_window: 30\n"
        "strategy:\n"
        "  z_entry: 2.5\n"
        "  z_exit: 0.0\n"
        "  notional_per_leg: 50000\n"
        "  close_at_end: true\n"
        "  slippage_model: tick\n"
        "  tick_size_a: 0.05\n"
        "  commission_rate_b: 0.0002\n"
        "  pair: [XAU, XAG]\n"
        "metrics:\n"
        "  annualization_factor: 365\n"
        "output:\n"
        "  directory: out\n"
        "  write_signals: false\n";

    PipelineConfig c = ConfigLoader::loadString(yaml);
    ConfigLoader::validate(c);
    check(c.data_path == "prices.csv", "data.path");
    check(c.data.delimiter == ';', "data.delimiter");
    check(!c.data.drop_duplicates, "data.drop_duplicates");
    checkNear(c.screening.min_correlation, 0.7, 0.0, "screening.min_correlation");
    check(c.screening.min_overlap == 250, "screening.min_overlap");
    check(c.screening.direction == PairScreener::DirectionPolicy::BOTH, "screening.direction");
    check(c.screening.rank_by == PairScreener::RankBy::P_VALUE, "screening.rank_by");
    check(c.screening.adf.max_lag && *c.screening.adf.max_lag == 4, "screening.adf_max_lag");
    check(!c.screening.adf.autolag, "screening.adf_autolag");
    check(c.screening.threads == 3, "screening.threads");
    check(c.signal.rolling_window == 30, "signal.rolling_window");
    checkNear(c.strategy.z_entry, 2.5, 0.0, "strategy.z_entry");
    checkNear(c.strategy.z_exit, 0.0, 0.0, "strategy.z_exit");
    check(c.strategy.close_at_end, "strategy.close_at_end");
    check(c.strategy.execution.slippage_model == SlippageModel::TICK, "strategy.slippage_model");
    checkNear(c.strategy.execution.tick_size_a, 0.05, 0.0, "strategy.tick_size_a");
    checkNear(c.strategy.execution.commission_rate_b, 0.0002, 0.0, "strategy.commission_rate_b");
    check(c.pair && c.pair->first == "XAU" && c.pair->second == "XAG", "strategy.pair");
    checkNear(c.metrics.annualization_factor, 365.0, 0.0, "metrics.annualization_factor");
    check(c.output.directory == "out" && !c.output.write_signals && c.output.write_equity, "output section");
    // Untouched keys keep their defaults
    checkNear(c.strategy.execution.tick_size_b, 0.01, 0.0, "tick_size_b default kept");
}

void test_base_is_preserved() {
    PipelineConfig base = PipelineConfig::getDefault();
    base.signal.rolling_window = 90;
    PipelineConfig c = ConfigLoader::loadString("strategy:\n  z_entry: 3.0\n", base);
    check(c.signal.rolling_window == 90, "missing keys keep the base value");
    checkNear(c.strategy.z_entry, 3.0, 0.0, "given key applied");

    PipelineConfig empty = ConfigLoader::loadString("", base);
    check(empty.signal.rolling_window == 90, "empty document is a no-op");
}

void test_verbose_propagates() {
    PipelineConfig c = ConfigLoader::loadString("verbose: true\n");
    check(c.verbose && c.data.verbose && c.screening.verbose && c.signal.verbose && c.strategy.verbose,
          "verbose reaches every component");
}

void test_rejected_documents() {
    checkThrows<ConfigurationException>([] { ConfigLoader::loadString("screening:\n  min_corr: 0.3\n"); },
                                        "unknown key rejected");
    checkThrows<ConfigurationException>([] { ConfigLoader::loadString("backtest:\n  x: 1\n"); },
                                        "unknown section rejected");
    checkThrows<ConfigurationException>([] { ConfigLoader::loadString("strategy:\n  z_entry: high\n"); },
                                        "non-numeric value rejected");
    checkThrows<ConfigurationException>([] { ConfigLoader::loadString("screening:\n  min_overlap: -5\n"); },
                                        "negative count rejected");
    checkThrows<ConfigurationException>([] { ConfigLoader::loadString("screening: [1, 2\n"); },
                                        "malformed YAML rejected");
    checkThrows<ConfigurationException>([] { ConfigLoader::loadString("strategy:\n  pair: [XAU]\n"); },
                                        "pair needs two ids");
    checkThrows<ConfigurationException>([] { ConfigLoader::loadString("screening:\n  direction: left\n"); },
                                        "unknown direction rejected");
    checkThrows<ConfigurationException>([] { ConfigLoader::loadString("data:\n  delimiter: ';;'\n"); },
                                        "multi-character delimiter rejected");
    checkThrows<ConfigurationException>([] { ConfigLoader::loadFile("/nonexistent/pairs.yaml"); },
                                        "missing file rejected");
}

void test_validation_rules() {
    auto expectInvalid = [](auto mutate, const std::string& what) {
        PipelineConfig c = PipelineConfig::getDefault();
        mutate(c);
        checkThrows<ConfigurationException>([&] { ConfigLoader::validate(c); }, what);
    };
    expectInvalid([](PipelineConfig& c) { c.screening.min_correlation = 1.0; }, "min_correlation of 1");
    expectInvalid([](PipelineConfig& c) { c.screening.min_correlation = -0.1; }, "negative min_correlation");
    expectInvalid([](PipelineConfig& c) { c.screening.min_overlap = 9; }, "min_overlap below 10");
    expectInvalid([](PipelineConfig& c) { c.screening.significance_level = 0.0; }, "zero significance");
    expectInvalid([](PipelineConfig& c) { c.screening.significance_level = 1.0; }, "significance of 1");
    expectInvalid([](PipelineConfig& c) { c.signal.rolling_window = 1; }, "window of 1");
    expectInvalid([](PipelineConfig& c) { c.strategy.z_entry = 0.0; }, "zero z_entry");
    expectInvalid([](PipelineConfig& c) { c.strategy.z_exit = 2.0; }, "z_exit equal to z_entry");
    expectInvalid([](PipelineConfig& c) { c.strategy.z_exit = -2.5; }, "z_exit below -z_entry");
    expectInvalid([](PipelineConfig& c) { c.strategy.notional_per_leg = 0.0; }, "zero notional");
    expectInvalid([](PipelineConfig& c) { c.strategy.execution.commission_rate_a = -0.001; },
                  "negative commission");
    expectInvalid([](PipelineConfig& c) { c.metrics.annualization_factor = 0.0; }, "zero annualization");
    expectInvalid([](PipelineConfig& c) { c.pair = std::make_pair(std::string("A"), std::string("A")); },
                  "pair with the same instrument twice");

    PipelineConfig negative_exit = PipelineConfig::getDefault();
    negative_exit.strategy.z_exit = -0.5;
    ConfigLoader::validate(negative_exit);
}

void test_load_file() {
    std::filesystem::path path = std::filesystem::temp_directory_path() / "pairs_arb_test_config.yaml";
    {
        std::ofstream out(path);
        out << "signal:\n  rolling_window: 45\n";
    }
    PipelineConfig c = ConfigLoader::loadFile(path.string());
    std::filesystem::remove(path);
    check(c.signal.rolling_window == 45, "value read from file");
}

int main() {
    std::cout << "\n=== Config Loader Tests ===\n" << std::endl;

    TestReporter reporter;
    reporter.test("Defaults", test_defaults);
    reporter.test("All Sections", test_all_sections);
    reporter.test("Base Is Preserved", test_base_is_preserved);
    reporter.test("Verbose Propagates", test_verbose_propagates);
    reporter.test("Rejected Documents", test_rejected_documents);
    reporter.test("Validation Rules", test_validation_rules);
    reporter.test("Load File", test_load_file);
    return reporter.report();
}
