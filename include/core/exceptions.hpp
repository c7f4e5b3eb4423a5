// exceptions.hpp
// Exception Types for the Cointegrated Pairs Engine
// Provides custom exception hierarchy for data, configuration and statistic failures

#pragma once

#include <stdexcept>
#include <string>

namespace pairs_arb {

// ============================================================================
// Exception Types for Better Error Handling
// ============================================================================

class PairsArbException : public std::runtime_error {
public:
    explicit PairsArbException(const std::string& msg) : std::runtime_error(msg) {}
};

// Malformed or missing timestamps, non-monotonic series, bad quotes,
// insufficient history. Aborts the affected computation.
class DataException : public PairsArbException {
public:
    explicit DataException(const std::string& msg) : PairsArbException("Data Error: " + msg) {}
};

// Invalid thresholds or options. Raised before any computation starts.
class ConfigurationException : public PairsArbException {
public:
    explicit ConfigurationException(const std::string& msg)
        : PairsArbException("Configuration Error: " + msg) {}
};

// A statistic was explicitly requested but cannot exist (zero variance regressor etc.)
class DegenerateStatisticException : public PairsArbException {
public:
    explicit DegenerateStatisticException(const std::string& msg)
        : PairsArbException("Degenerate Statistic: " + msg) {}
};

} // namespace pairs_arb
