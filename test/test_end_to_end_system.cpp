// test_end_to_end_system.cpp
// Full pipeline: CSV load, screening, signal, backtest, metrics and result files

#include <cmath>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <optional>
#include <random>
#include <string>
#include <vector>
#include "../include/config/config_loader.hpp"
#include "../include/core/exceptions.hpp"
#include "../include/engine/pipeline.hpp"
#include "synthetic_data.hpp"
#include "test_reporter.hpp"

using namespace pairs_arb;
using namespace pairs_arb::testing;

namespace fs = std::filesystem;

// AAA = 20 + 0.5 * BBB + AR(1) noise; CCC is unrelated
PriceTable buildMarket() {
    std::mt19937 rng(42);
    const size_t n = 700;
    auto bbb = randomWalk(rng, n, 1000.0, 5.0);
    auto aaa = cointegratedWith(rng, bbb, 20.0, 0.5, 0.5, 1.0);
    auto ccc = logRandomWalk(rng, n, 60.0, 0.01);

    PriceTable table;
    table.addSeries(makeSeries("AAA", aaa, 0, 0.02));
    table.addSeries(makeSeries("BBB", bbb, 0, 0.05));
    table.addSeries(makeSeries("CCC", ccc, 0, 0.01));
    return table;
}

// Writes the market as a normalized quote table
void createSampleCsvFile(const std::string& filename, const PriceTable& table) {
    std::ofstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to create sample CSV file: " + filename);
    }
    file << "timestamp,instrument_id,bid,ask,mid\n";
    file << std::setprecision(17);
    for (const auto& [id, series] : table.getAllSeries()) {
        for (const auto& p : series.getPoints()) {
            file << formatTimestamp(p.timestamp) << ',' << id << ',' << p.bid << ',' << p.ask << ','
                 << p.mid << '\n';
        }
    }
}

PipelineConfig testConfig() {
    PipelineConfig config = PipelineConfig::getDefault();
    config.screening.min_overlap = 500;
    config.screening.threads = 2;
    config.signal.rolling_window = 60;
    return config;
}

void test_pipeline_selects_cointegrated_pair() {
    PairsPipeline pipeline(testConfig());
    pipeline.setPriceTable(buildMarket());
    auto result = pipeline.run();

    check(result.screening.pairs_evaluated == 3, "three pairs screened");
    check(result.screening.accepted == 1, "only AAA/BBB accepted");
    check(result.selected_pair.has_value(), "a pair was selected");
    const auto& [a, b] = *result.selected_pair;
    check((a == "AAA" && b == "BBB") || (a == "BBB" && b == "AAA"), "AAA/BBB selected");

    check(result.signal.has_value() && result.signal->size() == 700, "signal on every shared bar");
    check(result.signal->countDefined() > 600, "z-scores defined after the first window");
    check(result.backtest.has_value() && !result.backtest->ledger.empty(), "trades on a mean-reverting spread");
    check(result.metrics.has_value(), "metrics computed");
    check(result.metrics->summary.total_trades == result.backtest->ledger.size(), "metrics cover the ledger");
    check(result.backtest->stats.bars_processed == 700, "every bar processed");
}

// Replays the z-score crossings independently and compares with the ledger
void test_ledger_matches_crossings() {
    PairsPipeline pipeline(testConfig());
    pipeline.setPriceTable(buildMarket());
    auto result = pipeline.run();
    const auto& signal = *result.signal;
    const auto& config = pipeline.getConfig().strategy;
    const PriceSeries& series_a = pipeline.getPriceTable().getSeries(signal.instrument_a);
    const PriceSeries& series_b = pipeline.getPriceTable().getSeries(signal.instrument_b);

    struct Expected {
        Timestamp entry;
        Timestamp exit;
        PositionState direction;
    };
    std::vector<Expected> expected;
    PositionState state = PositionState::FLAT;
    Timestamp entry(0);
    for (const auto& p : signal.points) {
        if (!p.zscore) continue;
        double z = *p.zscore;
        if (state == PositionState::FLAT) {
            if (z < -config.z_entry) { state = PositionState::LONG_SPREAD; entry = p.timestamp; }
            else if (z > config.z_entry) { state = PositionState::SHORT_SPREAD; entry = p.timestamp; }
        } else if ((state == PositionState::LONG_SPREAD && z >= config.z_exit) ||
                   (state == PositionState::SHORT_SPREAD && z <= config.z_exit)) {
            expected.push_back({entry, p.timestamp, state});
            state = PositionState::FLAT;
        }
    }

    const auto& ledger = result.backtest->ledger;
    check(ledger.size() == expected.size(), "same number of round trips");
    for (size_t i = 0; i < ledger.size(); ++i) {
        const Trade& t = ledger[i];
        check(t.entry_timestamp == expected[i].entry && t.exit_timestamp == expected[i].exit,
              "trade boundaries follow the crossings");
        check(t.direction == expected[i].direction, "trade direction follows the crossing side");

        // Full-spread fills recomputed from the raw quotes
        auto qa_in = *series_a.find(t.entry_timestamp);
        auto qb_in = *series_b.find(t.entry_timestamp);
        auto qa_out = *series_a.find(t.exit_timestamp);
        auto qb_out = *series_b.find(t.exit_timestamp);
        bool is_long = (t.direction == PositionState::LONG_SPREAD);
        double in_a = is_long ? qa_in.ask + qa_in.spread() : qa_in.bid - qa_in.spread();
        double in_b = is_long ? qb_in.bid - qb_in.spread() : qb_in.ask + qb_in.spread();
        double out_a = is_long ? qa_out.bid - qa_out.spread() : qa_out.ask + qa_out.spread();
        double out_b = is_long ? qb_out.ask + qb_out.spread() : qb_out.bid - qb_out.spread();
        double qa = config.notional_per_leg / in_a;
        double qb = config.notional_per_leg / in_b;
        double leg_a = (out_a - in_a) * qa;
        double leg_b = (out_b - in_b) * qb;
        double pnl = is_long ? leg_a - leg_b : leg_b - leg_a;
        checkNear(t.realized_pnl, pnl, 1e-6, "P&L from full-spread fills");
    }
}

void test_idempotent_runs() {
    PairsPipeline pipeline(testConfig());
    pipeline.setPriceTable(buildMarket());
    auto first = pipeline.run();
    auto second = pipeline.run();

    // NaN statistics compare equal to themselves here
    auto same = [](double x, double y) { return x == y || (std::isnan(x) && std::isnan(y)); };

    const auto& ranked_1 = first.screening.candidates;
    const auto& ranked_2 = second.screening.candidates;
    check(!ranked_1.empty() && ranked_1.size() == ranked_2.size(), "same number of candidates");
    for (size_t i = 0; i < ranked_1.size(); ++i) {
        check(ranked_1[i].instrument_a == ranked_2[i].instrument_a &&
                  ranked_1[i].instrument_b == ranked_2[i].instrument_b,
              "same candidate order");
        check(same(ranked_1[i].p_value, ranked_2[i].p_value), "bit-identical p-value");
        check(same(ranked_1[i].hedge_ratio, ranked_2[i].hedge_ratio), "bit-identical hedge ratio");
        check(same(ranked_1[i].adf_statistic, ranked_2[i].adf_statistic), "bit-identical ADF statistic");
    }
    check(first.screening.outcomes.size() == second.screening.outcomes.size(), "same outcome count");
    for (size_t i = 0; i < first.screening.outcomes.size(); ++i) {
        check(first.screening.outcomes[i].status == second.screening.outcomes[i].status &&
                  same(first.screening.outcomes[i].p_value, second.screening.outcomes[i].p_value),
              "same screening outcome");
    }

    const auto& points_1 = first.signal->points;
    const auto& points_2 = second.signal->points;
    check(!points_1.empty() && points_1.size() == points_2.size(), "same signal length");
    check(first.signal->hedge_ratio == second.signal->hedge_ratio, "same signal hedge ratio");
    for (size_t i = 0; i < points_1.size(); ++i) {
        check(points_1[i].timestamp == points_2[i].timestamp, "same signal timestamps");
        check(points_1[i].spread == points_2[i].spread, "bit-identical spread");
        check(points_1[i].zscore.has_value() == points_2[i].zscore.has_value() &&
                  (!points_1[i].zscore || *points_1[i].zscore == *points_2[i].zscore),
              "bit-identical z-score");
    }

    check(first.backtest->ledger.size() == second.backtest->ledger.size(), "same trade count");
    for (size_t i = 0; i < first.backtest->ledger.size(); ++i) {
        check(first.backtest->ledger[i].realized_pnl == second.backtest->ledger[i].realized_pnl,
              "bit-identical P&L across runs");
    }
    check(first.metrics->summary.total_pnl == second.metrics->summary.total_pnl, "same total");
}

void test_explicit_pair_and_screen_only() {
    PipelineConfig config = testConfig();
    config.pair = std::make_pair(std::string("AAA"), std::string("BBB"));
    PairsPipeline explicit_pair(config);
    explicit_pair.setPriceTable(buildMarket());
    auto result = explicit_pair.run();
    check(result.selected_pair->first == "AAA", "explicit pair used as given");
    checkNear(result.signal->hedge_ratio, 0.5, 0.01, "hedge ratio of AAA on BBB");

    config.pair = std::make_pair(std::string("AAA"), std::string("ZZZ"));
    PairsPipeline missing(config);
    missing.setPriceTable(buildMarket());
    checkThrows<DataException>([&] { missing.run(); }, "unknown instrument in the pair rejected");

    PipelineConfig screen_config = testConfig();
    screen_config.screen_only = true;
    PairsPipeline screen_only(screen_config);
    screen_only.setPriceTable(buildMarket());
    auto screened = screen_only.run();
    check(!screened.signal && !screened.backtest, "screen-only stops after screening");
    check(screened.screening.candidates.size() == 1, "screening still ranks candidates");
}

void test_csv_to_result_files() {
    fs::path dir = fs::temp_directory_path() / "pairs_arb_end_to_end";
    fs::remove_all(dir);
    fs::create_directories(dir);
    std::string csv_path = (dir / "prices.csv").string();
    createSampleCsvFile(csv_path, buildMarket());

    PipelineConfig config = testConfig();
    config.data_path = csv_path;
    config.output.directory = (dir / "out").string();
    PairsPipeline pipeline(config);
    pipeline.loadData();
    check(pipeline.getPriceTable().size() == 3, "three instruments loaded");
    auto result = pipeline.run();
    auto files = pipeline.writeResults(result);

    const auto& [a, b] = *result.selected_pair;
    check(files.size() == 5, "pairs, outcomes, signals, trades and equity written");
    check(fs::exists(dir / "out" / "pairs.csv"), "pairs.csv");
    check(fs::exists(dir / "out" / "screening_outcomes.csv"), "screening_outcomes.csv");
    check(fs::exists(dir / "out" / ("trades_" + a + "_" + b + ".csv")), "trades file");

    std::ifstream trades(dir / "out" / ("trades_" + a + "_" + b + ".csv"));
    std::string line;
    size_t rows = 0;
    while (std::getline(trades, line)) ++rows;
    check(rows == result.backtest->ledger.size() + 1, "header plus one row per trade");
    fs::remove_all(dir);

    PairsPipeline no_data(testConfig());
    checkThrows<ConfigurationException>([&] { no_data.loadData(); }, "no data path configured");
    checkThrows<DataException>([&] { no_data.run(); }, "run before any data");
}

int main() {
    std::cout << "\n=== End-to-End System Tests ===\n" << std::endl;

    TestReporter reporter;
    reporter.test("Pipeline Selects Cointegrated Pair", test_pipeline_selects_cointegrated_pair);
    reporter.test("Ledger Matches Crossings", test_ledger_matches_crossings);
    reporter.test("Idempotent Runs", test_idempotent_runs);
    reporter.test("Explicit Pair And Screen Only", test_explicit_pair_and_screen_only);
    reporter.test("CSV To Result Files", test_csv_to_result_files);
    return reporter.report();
}
