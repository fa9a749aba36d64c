// backtester/include/portfolio.hpp
#pragma once

#include <string>
#include <vector>

#include "datatypes.hpp" // Provides core::Bar, core::Position, core::Trade, core::EquityPoint

namespace backtester {

    // --- Portfolio Class Definition ---
    // Per-run broker context: cash, the single Flat/Long position, the trade log and
    // the equity curve. Owned by exactly one Backtester::run call; the position only
    // changes through enterLong()/exitLong().
    class Portfolio {
    public:
        // Throws core::ConfigException if initial_cash <= 0 or commission_rate is outside [0, 1)
        Portfolio(double initial_cash, double commission_rate);

        // --- Getters ---
        double getCash() const { return cash_; }
        double getInitialCash() const { return initial_cash_; }
        double getCommissionRate() const { return commission_rate_; }
        const core::Position& getPosition() const { return position_; }
        double getCurrentEquity(double price) const;
        const core::EquityCurve& getEquityCurve() const { return equity_curve_; }
        const core::TradeLog& getTradeLog() const { return trade_log_; }
        int getTotalExecutions() const { return execution_count_; }

        // Whole shares buyable with position_fraction of current cash at price,
        // reduced if needed so that notional plus commission fits in cash.
        long long sizeFor(double position_fraction, double price) const;

        // --- Transitions ---
        // Flat -> Long at bar.close. Throws core::BacktestException if already Long,
        // size <= 0 or cash does not cover notional plus commission.
        void enterLong(const core::Bar& bar, long long size, double stop_loss, double take_profit);

        // Long -> Flat at bar.close; appends and returns the completed Trade.
        // Throws core::BacktestException if Flat.
        const core::Trade& exitLong(const core::Bar& bar, core::ExitReason reason);

        // Appends the mark-to-market value at bar.close
        void recordEquity(const core::Bar& bar);

    private:
        double initial_cash_;
        double commission_rate_;
        double cash_;
        core::Position position_;
        // Counter for total buy/sell executions
        int execution_count_ = 0;
        core::TradeLog trade_log_;
        core::EquityCurve equity_curve_;
    };

} // namespace backtester
