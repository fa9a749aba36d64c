#pragma once

#include <map>
#include <string>
#include <vector>

#include "datatypes.hpp"

namespace backtester {

    // --- Performance Report ---
    struct PerformanceReport {
        double total_return = 0.0;  // Fraction, (final - initial) / initial
        double sharpe_ratio = 0.0;  // Annualised; NaN when undefined
        double max_drawdown = 0.0;  // Positive fraction in [0, 1]
        double starting_value = 0.0;
        double final_value = 0.0;

        bool hasSharpe() const;

        // Logs the metrics block under the given heading
        void logReport(const std::string& label) const;
    };

    // --- Round-trip statistics ---
    struct TradeStatistics {
        int round_trip_trades = 0;
        int winning_trades = 0;
        int losing_trades = 0;
        double win_rate = 0.0;        // Based on round trips
        double profit_factor = 0.0;   // Gross Profit / Gross Loss
        double total_pnl = 0.0;
        double avg_win_pnl = 0.0;
        double avg_loss_pnl = 0.0;
        std::map<std::string, int> exits_by_reason;

        void logStatistics() const;
    };

    // Metrics computed from a stored equity curve and trade log only
    class PerformanceAnalyzer {
    public:
        static constexpr double kTradingDaysPerYear = 252.0;

        // risk_free_rate is annual; it is spread evenly over kTradingDaysPerYear
        explicit PerformanceAnalyzer(double risk_free_rate = 0.0);

        // Throws core::DataException for an empty curve, core::ConfigException for initial_cash <= 0
        PerformanceReport analyze(const core::EquityCurve& equity_curve, double initial_cash) const;

        static double totalReturn(double final_value, double initial_cash);

        // returns[i-1] = equity[i] / equity[i-1] - 1
        static std::vector<double> dailyReturns(const core::EquityCurve& equity_curve);

        // NaN when fewer than two returns or zero standard deviation
        double sharpeRatio(const std::vector<double>& daily_returns) const;

        static double maxDrawdown(const core::EquityCurve& equity_curve);

        static TradeStatistics computeTradeStatistics(const core::TradeLog& trades);

        double getRiskFreeRate() const { return risk_free_rate_; }

    private:
        double risk_free_rate_;
    };

} // namespace backtester
