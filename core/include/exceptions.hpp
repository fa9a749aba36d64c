#pragma once

#include <stdexcept>
#include <string>

namespace core {

    class BacktestEngineException : public std::runtime_error {
    public:
        explicit BacktestEngineException(const std::string& message)
            : std::runtime_error(message) {}

        explicit BacktestEngineException(const char* message)
            : std::runtime_error(message) {}
    };

    // Specific exception types
    // Invalid StrategyConfig / run settings values
    class ConfigException : public BacktestEngineException {
    public: using BacktestEngineException::BacktestEngineException; };

    // Empty, non-chronological, malformed or too-short bar data
    class DataException : public BacktestEngineException {
    public: using BacktestEngineException::BacktestEngineException; };

    class DataLoadException : public BacktestEngineException {
    public: using BacktestEngineException::BacktestEngineException; };

    class IndicatorCalculationException : public BacktestEngineException {
    public: using BacktestEngineException::BacktestEngineException; };

    class StrategyException : public BacktestEngineException {
    public: using BacktestEngineException::BacktestEngineException; };

    // Illegal position transition requested of the portfolio
    class BacktestException : public BacktestEngineException {
    public: using BacktestEngineException::BacktestEngineException; };

} // namespace core
