// exceptions.hpp
// Exception Types for the Distance-Method Pairs Backtester
// Configuration, data and execution faults; never used for normal trading flow

#pragma once

#include <stdexcept>
#include <string>

namespace distbt {

// ============================================================================
// Exception Types for Better Error Handling
// ============================================================================

class BacktestException : public std::runtime_error {
public:
    explicit BacktestException(const std::string& msg) : std::runtime_error(msg) {}
};

class DataException : public BacktestException {
public:
    explicit DataException(const std::string& msg) : BacktestException("Data Error: " + msg) {}
};

class ExecutionException : public BacktestException {
public:
    explicit ExecutionException(const std::string& msg) : BacktestException("Execution Error: " + msg) {}
};

class ConfigException : public BacktestException {
public:
    explicit ConfigException(const std::string& msg) : BacktestException("Config Error: " + msg) {}
};

} // namespace distbt
