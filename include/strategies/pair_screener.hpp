// pair_screener.hpp
// All-pairs Correlation and Cointegration Screening
// Evaluates every unordered instrument pair in parallel and ranks the cointegrated ones

#pragma once

#include <algorithm>
#include <atomic>
#include <cmath>
#include <exception>
#include <iostream>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>
#include "cointegration_analyzer.hpp"
#include "../core/exceptions.hpp"
#include "../data/price_table.hpp"
#include "../data/return_computer.hpp"
#include "../math/statistics.hpp"

namespace pairs_arb {

// ============================================================================
// Pair Screener
// ============================================================================

class PairScreener {
public:
    // Which regression directions survive screening
    enum class DirectionPolicy {
        BEST,   // per unordered pair, the direction with the lower p-value
        BOTH    // every direction that passes the test
    };

    enum class RankBy {
        CORRELATION,
        P_VALUE
    };

    enum class OutcomeStatus {
        ACCEPTED,
        INSUFFICIENT_OVERLAP,
        BELOW_CORRELATION,
        DEGENERATE,
        NOT_COINTEGRATED
    };

    struct ScreenerConfig {
        double min_correlation;
        size_t min_overlap;
        double significance_level;
        DirectionPolicy direction;
        RankBy rank_by;
        CointegrationAnalyzer::AdfConfig adf;
        size_t threads;                        // 0 = hardware concurrency
        size_t large_universe_warning_pairs;
        size_t top_n;                          // display only
        bool verbose;

        ScreenerConfig()
            : min_correlation(0.5)
            , min_overlap(500)
            , significance_level(0.05)
            , direction(DirectionPolicy::BEST)
            , rank_by(RankBy::CORRELATION)
            , adf(CointegrationAnalyzer::AdfConfig::getDefault())
            , threads(0)
            , large_universe_warning_pairs(5000)
            , top_n(10)
            , verbose(false) {}

        static ScreenerConfig getDefault() { return ScreenerConfig(); }
    };

    // Immutable once ranked
    struct PairCandidate {
        InstrumentId instrument_a;   // dependent leg
        InstrumentId instrument_b;   // hedge leg
        double correlation;
        double hedge_ratio;
        double intercept;
        double residual_std;
        double p_value;
        double adf_statistic;
        int used_lag;
        double half_life;
        size_t overlap_count;
    };

    // One row per evaluated unordered pair (a < b)
    struct ScreeningOutcome {
        InstrumentId instrument_a;
        InstrumentId instrument_b;
        OutcomeStatus status;
        size_t overlap_count;
        double correlation;
        double p_value;
    };

    struct ScreeningReport {
        std::vector<PairCandidate> candidates;
        std::vector<ScreeningOutcome> outcomes;
        size_t instruments = 0;
        size_t pairs_evaluated = 0;
        size_t accepted = 0;
        size_t insufficient_overlap = 0;
        size_t below_correlation = 0;
        size_t degenerate = 0;
        size_t not_cointegrated = 0;
        size_t threads_used = 0;
    };

private:
    ScreenerConfig config_;
    CointegrationAnalyzer analyzer_;

    struct PairSlot {
        ScreeningOutcome outcome;
        std::vector<PairCandidate> candidates;
        std::exception_ptr error;
    };

    struct DirectionResult {
        bool valid = false;
        PairCandidate candidate{};
    };

    static bool betterDirection(const DirectionResult& lhs, const DirectionResult& rhs) {
        if (lhs.valid != rhs.valid) return lhs.valid;
        if (!lhs.valid) return true;
        if (lhs.candidate.p_value != rhs.candidate.p_value) {
            return lhs.candidate.p_value < rhs.candidate.p_value;
        }
        if (lhs.candidate.adf_statistic != rhs.candidate.adf_statistic) {
            return lhs.candidate.adf_statistic < rhs.candidate.adf_statistic;
        }
        return lhs.candidate.instrument_a < rhs.candidate.instrument_a;
    }

    // Regress price_a on price_b (levels, mid) over the return-overlap timestamps
    DirectionResult testDirection(const InstrumentId& a, const InstrumentId& b,
                                  const std::vector<double>& prices_a,
                                  const std::vector<double>& prices_b,
                                  double correlation, size_t overlap) const {
        DirectionResult result;
        try {
            auto coint = analyzer_.testCointegration(prices_a, prices_b, config_.significance_level);
            if (std::isnan(coint.p_value)) {
                return result;
            }
            result.valid = true;
            result.candidate = PairCandidate{a, b, correlation, coint.hedge_ratio, coint.intercept,
                                             coint.residual_std, coint.p_value, coint.adf_statistic,
                                             coint.used_lag, coint.half_life, overlap};
        } catch (const DegenerateStatisticException& e) {
            if (config_.verbose) {
                std::cout << "[Screener] " << a << " on " << b << ": " << e.what() << std::endl;
            }
        }
        return result;
    }

    void evaluatePair(const InstrumentId& a, const InstrumentId& b,
                      const ReturnMatrix& returns, const PriceTable& prices,
                      PairSlot& slot) const {
        ScreeningOutcome& outcome = slot.outcome;
        outcome = ScreeningOutcome{a, b, OutcomeStatus::INSUFFICIENT_OVERLAP, 0,
                                   StatisticalUtils::kNaN, StatisticalUtils::kNaN};

        // Cheap count first; no statistics on short overlaps
        outcome.overlap_count = returns.overlapCount(a, b);
        if (outcome.overlap_count < config_.min_overlap) {
            return;
        }

        auto aligned = returns.align(a, b);
        outcome.correlation = StatisticalUtils::pearsonCorrelation(aligned.a, aligned.b);
        if (std::isnan(outcome.correlation)) {
            outcome.status = OutcomeStatus::DEGENERATE;
            return;
        }
        if (std::abs(outcome.correlation) <= config_.min_correlation) {
            outcome.status = OutcomeStatus::BELOW_CORRELATION;
            return;
        }

        const PriceSeries& series_a = prices.getSeries(a);
        const PriceSeries& series_b = prices.getSeries(b);
        std::vector<double> levels_a, levels_b;
        levels_a.reserve(aligned.timestamps.size());
        levels_b.reserve(aligned.timestamps.size());
        for (Timestamp ts : aligned.timestamps) {
            auto pa = series_a.find(ts);
            auto pb = series_b.find(ts);
            if (!pa || !pb) {
                throw DataException("Return at " + formatTimestamp(ts) + " has no price for pair " +
                                    a + "/" + b);
            }
            levels_a.push_back(pa->mid);
            levels_b.push_back(pb->mid);
        }

        DirectionResult forward = testDirection(a, b, levels_a, levels_b, outcome.correlation,
                                                outcome.overlap_count);
        DirectionResult reverse = testDirection(b, a, levels_b, levels_a, outcome.correlation,
                                                outcome.overlap_count);

        if (!forward.valid && !reverse.valid) {
            outcome.status = OutcomeStatus::DEGENERATE;
            return;
        }

        const DirectionResult& best = betterDirection(forward, reverse) ? forward : reverse;
        outcome.p_value = best.candidate.p_value;

        auto passes = [this](const DirectionResult& d) {
            return d.valid && d.candidate.p_value < config_.significance_level;
        };

        if (config_.direction == DirectionPolicy::BOTH) {
            if (passes(forward)) slot.candidates.push_back(forward.candidate);
            if (passes(reverse)) slot.candidates.push_back(reverse.candidate);
        } else if (passes(best)) {
            slot.candidates.push_back(best.candidate);
        }

        outcome.status = slot.candidates.empty() ? OutcomeStatus::NOT_COINTEGRATED
                                                 : OutcomeStatus::ACCEPTED;
    }

    size_t resolveThreads(size_t work_items) const {
        size_t threads = config_.threads;
        if (threads == 0) {
            threads = std::max<size_t>(1, std::thread::hardware_concurrency());
        }
        return std::max<size_t>(1, std::min(threads, work_items));
    }

public:
    explicit PairScreener(const ScreenerConfig& config = ScreenerConfig::getDefault())
        : config_(config), analyzer_(config.adf) {}

    const ScreenerConfig& getConfig() const { return config_; }

    ScreeningReport screen(const ReturnMatrix& returns, const PriceTable& prices) const {
        std::vector<InstrumentId> instruments = returns.getInstruments();
        std::sort(instruments.begin(), instruments.end());

        std::vector<std::pair<size_t, size_t>> pairs;
        if (instruments.size() > 1) {
            pairs.reserve(instruments.size() * (instruments.size() - 1) / 2);
        }
        for (size_t i = 0; i < instruments.size(); ++i) {
            for (size_t j = i + 1; j < instruments.size(); ++j) {
                pairs.emplace_back(i, j);
            }
        }

        if (pairs.size() > config_.large_universe_warning_pairs) {
            std::cerr << "[Screener] Warning: " << instruments.size() << " instruments give "
                      << pairs.size() << " pairs; screening all of them may take a while"
                      << std::endl;
        }

        ScreeningReport report;
        report.instruments = instruments.size();
        report.pairs_evaluated = pairs.size();
        report.threads_used = pairs.empty() ? 0 : resolveThreads(pairs.size());

        if (config_.verbose) {
            std::cout << "[Screener] " << instruments.size() << " instruments, " << pairs.size()
                      << " pairs, " << report.threads_used << " threads" << std::endl;
        }

        // Each pair owns one slot, so workers never share output
        std::vector<PairSlot> slots(pairs.size());
        std::atomic<size_t> next_index{0};
        auto worker = [&]() {
            for (size_t k = next_index.fetch_add(1); k < pairs.size(); k = next_index.fetch_add(1)) {
                try {
                    evaluatePair(instruments[pairs[k].first], instruments[pairs[k].second],
                                 returns, prices, slots[k]);
                } catch (...) {
                    slots[k].error = std::current_exception();
                }
            }
        };

        if (report.threads_used <= 1) {
            worker();
        } else {
            std::vector<std::thread> workers;
            workers.reserve(report.threads_used);
            for (size_t t = 0; t < report.threads_used; ++t) {
                workers.emplace_back(worker);
            }
            for (auto& w : workers) {
                w.join();
            }
        }

        report.outcomes.reserve(slots.size());
        for (auto& slot : slots) {
            if (slot.error) {
                std::rethrow_exception(slot.error);
            }
            switch (slot.outcome.status) {
                case OutcomeStatus::ACCEPTED: report.accepted++; break;
                case OutcomeStatus::INSUFFICIENT_OVERLAP: report.insufficient_overlap++; break;
                case OutcomeStatus::BELOW_CORRELATION: report.below_correlation++; break;
                case OutcomeStatus::DEGENERATE: report.degenerate++; break;
                case OutcomeStatus::NOT_COINTEGRATED: report.not_cointegrated++; break;
            }
            report.outcomes.push_back(slot.outcome);
            for (auto& c : slot.candidates) {
                report.candidates.push_back(std::move(c));
            }
        }

        rankCandidates(report.candidates, config_.rank_by);

        if (config_.verbose) {
            std::cout << "[Screener] accepted=" << report.accepted
                      << " insufficient_overlap=" << report.insufficient_overlap
                      << " below_correlation=" << report.below_correlation
                      << " degenerate=" << report.degenerate
                      << " not_cointegrated=" << report.not_cointegrated << std::endl;
        }
        if (report.candidates.empty() && !pairs.empty()) {
            std::cerr << "[Screener] Warning: no cointegrated pairs found" << std::endl;
        }
        return report;
    }

    // Total order: the result never depends on evaluation order
    static void rankCandidates(std::vector<PairCandidate>& candidates, RankBy rank_by) {
        auto by_ids = [](const PairCandidate& l, const PairCandidate& r) {
            if (l.instrument_a != r.instrument_a) return l.instrument_a < r.instrument_a;
            return l.instrument_b < r.instrument_b;
        };
        std::sort(candidates.begin(), candidates.end(),
                  [&](const PairCandidate& l, const PairCandidate& r) {
                      double lc = std::abs(l.correlation);
                      double rc = std::abs(r.correlation);
                      if (rank_by == RankBy::CORRELATION) {
                          if (lc != rc) return lc > rc;
                          if (l.p_value != r.p_value) return l.p_value < r.p_value;
                      } else {
                          if (l.p_value != r.p_value) return l.p_value < r.p_value;
                          if (lc != rc) return lc > rc;
                      }
                      return by_ids(l, r);
                  });
    }

    static DirectionPolicy parseDirectionPolicy(const std::string& name) {
        if (name == "best") return DirectionPolicy::BEST;
        if (name == "both") return DirectionPolicy::BOTH;
        throw ConfigurationException("Unknown direction policy '" + name + "' (expected best or both)");
    }

    static const char* getDirectionPolicyName(DirectionPolicy policy) {
        return policy == DirectionPolicy::BEST ? "best" : "both";
    }

    static RankBy parseRankBy(const std::string& name) {
        if (name == "correlation") return RankBy::CORRELATION;
        if (name == "p_value") return RankBy::P_VALUE;
        throw ConfigurationException("Unknown ranking '" + name + "' (expected correlation or p_value)");
    }

    static const char* getRankByName(RankBy rank_by) {
        return rank_by == RankBy::CORRELATION ? "correlation" : "p_value";
    }

    static const char* getStatusName(OutcomeStatus status) {
        switch (status) {
            case OutcomeStatus::ACCEPTED: return "ACCEPTED";
            case OutcomeStatus::INSUFFICIENT_OVERLAP: return "INSUFFICIENT_OVERLAP";
            case OutcomeStatus::BELOW_CORRELATION: return "BELOW_CORRELATION";
            case OutcomeStatus::DEGENERATE: return "DEGENERATE";
            case OutcomeStatus::NOT_COINTEGRATED: return "NOT_COINTEGRATED";
        }
        return "UNKNOWN";
    }
};

} // namespace pairs_arb
