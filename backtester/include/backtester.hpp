#pragma once

#include <string>

#include "datatypes.hpp"
#include "bar_series.hpp"
#include "rolling_extremes.hpp"
#include "interfaces.hpp"       // Strategy engine interfaces
#include "strategy_config.hpp"

namespace backtester {

    // Everything one run produces; consumed by PerformanceAnalyzer and ResultWriter
    struct BacktestResult {
        std::string strategy_name;
        std::string instrument_key;
        strategy_engine::StrategyConfig config;
        double initial_cash = 0.0;
        int total_executions = 0;
        core::TradeLog trades;
        core::EquityCurve equity_curve;
    };

    // Bar-by-bar replay of one strategy over one series.
    // run() keeps all mutable state local, so one Backtester may serve
    // concurrent runs over the same series and extremes.
    class Backtester {
    public:
        explicit Backtester(double initial_capital = 100000.0);

        // Throws core::ConfigException / core::DataException before any bar is processed
        // when the config is invalid, the extremes do not match the series or lookback,
        // or the series is shorter than the strategy requires.
        BacktestResult run(const data::BarSeries& series,
                           const indicators::RollingExtremes& extremes,
                           const strategy_engine::IStrategy& strategy,
                           const strategy_engine::StrategyConfig& config) const;

        // Same, building the RollingExtremes for config.lookback_period itself
        BacktestResult run(const data::BarSeries& series,
                           const strategy_engine::IStrategy& strategy,
                           const strategy_engine::StrategyConfig& config) const;

        double getInitialCapital() const { return initial_capital_; }

    private:
        double initial_capital_;
    };

} // namespace backtester
