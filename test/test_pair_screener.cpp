// test_pair_screener.cpp
// Overlap and correlation gates, cointegration filtering, ranking and thread-count independence

#include <cmath>
#include <iostream>
#include <random>
#include <vector>
#include "../include/core/exceptions.hpp"
#include "../include/data/return_computer.hpp"
#include "../include/strategies/pair_screener.hpp"
#include "synthetic_data.hpp"
#include "test_reporter.hpp"

using namespace pairs_arb;
using namespace pairs_arb::testing;

using Candidate = PairScreener::PairCandidate;
using Status = PairScreener::OutcomeStatus;

// AAA/BBB cointegrated, CCC independent, DDD short, EEE correlated but not cointegrated
PriceTable buildUniverse() {
    std::mt19937 rng(20240611);
    const size_t n = 700;
    auto bbb = randomWalk(rng, n, 1000.0, 5.0);
    auto aaa = cointegratedWith(rng, bbb, 20.0, 0.5, 0.5, 1.0);
    auto ccc = logRandomWalk(rng, n, 80.0, 0.01);
    auto ddd = logRandomWalk(rng, 100, 40.0, 0.01);
    auto own = randomWalk(rng, n, 500.0, 2.0);
    std::vector<double> eee(n);
    for (size_t i = 0; i < n; ++i) eee[i] = own[i] + 0.5 * bbb[i];

    PriceTable table;
    table.addSeries(makeSeries("AAA", aaa));
    table.addSeries(makeSeries("BBB", bbb));
    table.addSeries(makeSeries("CCC", ccc));
    table.addSeries(makeSeries("DDD", ddd, 300));
    table.addSeries(makeSeries("EEE", eee));
    return table;
}

PairScreener::ScreenerConfig universeConfig() {
    auto config = PairScreener::ScreenerConfig::getDefault();
    config.min_correlation = 0.5;
    config.min_overlap = 500;
    config.significance_level = 0.001;
    config.threads = 1;
    return config;
}

const PairScreener::ScreeningOutcome& findOutcome(const PairScreener::ScreeningReport& report,
                                                  const std::string& a, const std::string& b) {
    for (const auto& o : report.outcomes) {
        if (o.instrument_a == a && o.instrument_b == b) return o;
    }
    throw std::runtime_error("missing outcome " + a + "/" + b);
}

void test_universe_outcomes() {
    PriceTable prices = buildUniverse();
    ReturnMatrix returns = ReturnComputer::compute(prices);
    PairScreener screener(universeConfig());
    auto report = screener.screen(returns, prices);

    check(report.instruments == 5, "five instruments");
    check(report.pairs_evaluated == 10, "n(n-1)/2 pairs");
    check(report.outcomes.size() == 10, "one outcome per pair");
    check(report.insufficient_overlap == 4, "every DDD pair has too little overlap");
    check(report.below_correlation == 3, "every CCC pair is below the correlation gate");
    check(report.accepted == 1, "only AAA/BBB is accepted");
    check(report.not_cointegrated == 2, "EEE pairs are correlated but not cointegrated");
    check(report.degenerate == 0, "no degenerate pairs");

    check(findOutcome(report, "AAA", "DDD").status == Status::INSUFFICIENT_OVERLAP, "AAA/DDD status");
    check(std::isnan(findOutcome(report, "AAA", "DDD").correlation), "no statistics on short overlap");
    check(findOutcome(report, "BBB", "EEE").status == Status::NOT_COINTEGRATED, "BBB/EEE status");

    check(report.candidates.size() == 1, "best policy keeps one direction");
    const Candidate& c = report.candidates.front();
    bool ab = (c.instrument_a == "AAA" && c.instrument_b == "BBB");
    bool ba = (c.instrument_a == "BBB" && c.instrument_b == "AAA");
    check(ab || ba, "candidate is the AAA/BBB pair");
    check(c.p_value < 0.001, "candidate is significant");
    check(c.correlation > 0.5, "candidate correlation above the gate");
    check(c.overlap_count == 699, "overlap counts return rows");
    if (ab) {
        checkNear(c.hedge_ratio, 0.5, 0.01, "AAA on BBB hedge ratio");
    } else {
        checkNear(c.hedge_ratio, 2.0, 0.05, "BBB on AAA hedge ratio");
    }
}

void test_both_directions() {
    PriceTable prices = buildUniverse();
    ReturnMatrix returns = ReturnComputer::compute(prices);
    auto config = universeConfig();
    config.direction = PairScreener::DirectionPolicy::BOTH;
    auto report = PairScreener(config).screen(returns, prices);

    check(report.candidates.size() == 2, "both directions of AAA/BBB pass");
    check(report.accepted == 1, "still one accepted unordered pair");
    const Candidate& first = report.candidates[0];
    const Candidate& second = report.candidates[1];
    check(first.instrument_a == second.instrument_b && first.instrument_b == second.instrument_a,
          "the two candidates are opposite directions");
    checkNear(first.hedge_ratio * second.hedge_ratio, 1.0, 0.02,
              "product of the two slopes is the R^2 of the levels");
}

void test_thread_count_independence() {
    PriceTable prices = buildUniverse();
    ReturnMatrix returns = ReturnComputer::compute(prices);
    auto config = universeConfig();
    config.significance_level = 0.5;
    config.direction = PairScreener::DirectionPolicy::BOTH;

    auto serial = PairScreener(config).screen(returns, prices);
    config.threads = 4;
    auto parallel = PairScreener(config).screen(returns, prices);

    check(parallel.threads_used == 4, "four workers requested and used");
    check(serial.candidates.size() == parallel.candidates.size(), "same candidate count");
    for (size_t i = 0; i < serial.candidates.size(); ++i) {
        const auto& s = serial.candidates[i];
        const auto& p = parallel.candidates[i];
        check(s.instrument_a == p.instrument_a && s.instrument_b == p.instrument_b, "same order");
        check(s.p_value == p.p_value && s.hedge_ratio == p.hedge_ratio && s.correlation == p.correlation,
              "bit-identical statistics");
    }
    for (size_t i = 0; i < serial.outcomes.size(); ++i) {
        check(serial.outcomes[i].status == parallel.outcomes[i].status, "same outcome statuses");
    }
}

Candidate makeCandidate(const std::string& a, const std::string& b, double corr, double p) {
    return Candidate{a, b, corr, 1.0, 0.0, 1.0, p, -4.0, 0, 5.0, 600};
}

void test_ranking() {
    std::vector<Candidate> candidates = {
        makeCandidate("X", "Y", 0.80, 0.010),
        makeCandidate("A", "B", -0.90, 0.030),
        makeCandidate("C", "D", 0.80, 0.001),
        makeCandidate("E", "F", 0.80, 0.001),
    };

    PairScreener::rankCandidates(candidates, PairScreener::RankBy::CORRELATION);
    check(candidates[0].instrument_a == "A", "largest absolute correlation first");
    check(candidates[1].instrument_a == "C", "tie on correlation broken by p-value, then ids");
    check(candidates[2].instrument_a == "E", "id order on full tie");
    check(candidates[3].instrument_a == "X", "highest p-value last among equal correlations");

    PairScreener::rankCandidates(candidates, PairScreener::RankBy::P_VALUE);
    check(candidates[0].instrument_a == "C", "lowest p-value first");
    check(candidates[1].instrument_a == "E", "ids break p-value ties");
    check(candidates[2].instrument_a == "X", "then p = 0.01");
    check(candidates[3].instrument_a == "A", "then p = 0.03");
}

void test_degenerate_pair() {
    std::mt19937 rng(3);
    PriceTable prices;
    prices.addSeries(makeSeries("FLAT", std::vector<double>(50, 25.0)));
    prices.addSeries(makeSeries("MOVE", logRandomWalk(rng, 50, 25.0, 0.01)));
    auto config = PairScreener::ScreenerConfig::getDefault();
    config.min_overlap = 10;
    config.threads = 1;
    auto report = PairScreener(config).screen(ReturnComputer::compute(prices), prices);
    check(report.degenerate == 1, "zero-variance returns give a degenerate outcome");
    check(report.candidates.empty(), "no candidate from a degenerate pair");
}

void test_small_universes() {
    PriceTable one;
    one.addSeries(makeSeries("ONLY", {1.0, 2.0, 3.0}));
    auto report = PairScreener().screen(ReturnComputer::compute(one), one);
    check(report.pairs_evaluated == 0, "single instrument has no pairs");
    check(report.candidates.empty() && report.outcomes.empty(), "empty report");
}

void test_policy_names() {
    check(PairScreener::parseDirectionPolicy("both") == PairScreener::DirectionPolicy::BOTH, "parse both");
    check(PairScreener::parseRankBy("p_value") == PairScreener::RankBy::P_VALUE, "parse p_value");
    check(std::string(PairScreener::getStatusName(Status::BELOW_CORRELATION)) == "BELOW_CORRELATION",
          "status name");
    checkThrows<ConfigurationException>([] { PairScreener::parseDirectionPolicy("either"); },
                                        "unknown policy rejected");
    checkThrows<ConfigurationException>([] { PairScreener::parseRankBy("sharpe"); },
                                        "unknown ranking rejected");
}

int main() {
    std::cout << "\n=== Pair Screener Tests ===\n" << std::endl;

    TestReporter reporter;
    reporter.test("Universe Outcomes", test_universe_outcomes);
    reporter.test("Both Directions", test_both_directions);
    reporter.test("Thread Count Independence", test_thread_count_independence);
    reporter.test("Ranking", test_ranking);
    reporter.test("Degenerate Pair", test_degenerate_pair);
    reporter.test("Small Universes", test_small_universes);
    reporter.test("Policy Names", test_policy_names);
    return reporter.report();
}
