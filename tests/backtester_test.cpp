// Scenario tests for backtester::Backtester: the bar loop, exits, sizing,
// end-of-period close, fail-fast checks and concurrent runs.

#include "backtester.hpp"
#include "breakout_strategy.hpp"
#include "buy_and_hold_strategy.hpp"
#include "exceptions.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <future>
#include <vector>

using backtester::BacktestResult;
using backtester::Backtester;
using strategy_engine::StrategyConfig;
using test_helpers::dayN;

namespace {

StrategyConfig configWithLookback(int lookback) {
    StrategyConfig config;
    config.lookback_period = lookback;
    return config;
}

} // namespace

class BacktesterTest : public ::testing::Test {
 protected:
    Backtester engine{100000.0};
    strategy_engine::BreakoutStrategy breakout;
    strategy_engine::BuyAndHoldStrategy buy_and_hold;
};

TEST_F(BacktesterTest, BreakoutEntryThenStopLoss) {
    data::BarSeries series = test_helpers::seriesFromCloses({100, 101, 102, 103, 80});
    BacktestResult result = engine.run(series, breakout, configWithLookback(3));

    ASSERT_EQ(result.trades.size(), 1u);
    const core::Trade& trade = result.trades.front();
    EXPECT_EQ(trade.entry_date, dayN(3));
    EXPECT_DOUBLE_EQ(trade.entry_price, 103.0);
    EXPECT_EQ(trade.exit_date, dayN(4));
    EXPECT_DOUBLE_EQ(trade.exit_price, 80.0);
    EXPECT_EQ(trade.exit_reason, core::ExitReason::StopLoss);
    EXPECT_EQ(trade.size, 922); // floor(0.95 * 100000 / 103)
    EXPECT_NEAR(trade.pnl_pct, (80.0 - 103.0) / 103.0 - 0.002, 1e-12);
    EXPECT_EQ(result.total_executions, 2);

    ASSERT_EQ(result.equity_curve.size(), series.size());
    const double cash_after_entry = 100000.0 - 922 * 103.0 * 1.001;
    EXPECT_NEAR(result.equity_curve[2].portfolio_value, 100000.0, 1e-9);
    EXPECT_NEAR(result.equity_curve[3].cash, cash_after_entry, 1e-6);
    EXPECT_NEAR(result.equity_curve[3].portfolio_value, cash_after_entry + 922 * 103.0, 1e-6);
    EXPECT_NEAR(result.equity_curve[4].portfolio_value, cash_after_entry + 922 * 80.0 * 0.999, 1e-6);
    EXPECT_DOUBLE_EQ(result.equity_curve[4].position_value, 0.0);
}

TEST_F(BacktesterTest, BreakoutTakeProfit) {
    data::BarSeries series = test_helpers::seriesFromCloses({100, 101, 102, 103, 120, 121});
    BacktestResult result = engine.run(series, breakout, configWithLookback(3));

    ASSERT_EQ(result.trades.size(), 2u);
    EXPECT_EQ(result.trades[0].exit_reason, core::ExitReason::TakeProfit);
    EXPECT_EQ(result.trades[0].exit_date, dayN(4));
    // 121 breaks the prior high of 120 on the next bar, then the run ends
    EXPECT_EQ(result.trades[1].entry_date, dayN(5));
    EXPECT_EQ(result.trades[1].exit_reason, core::ExitReason::EndOfPeriod);
}

TEST_F(BacktesterTest, BreakoutExitBelowPriorLow) {
    data::BarSeries series = test_helpers::seriesFromCloses({100, 101, 102, 103, 100});
    BacktestResult result = engine.run(series, breakout, configWithLookback(3));

    ASSERT_EQ(result.trades.size(), 1u);
    EXPECT_EQ(result.trades[0].exit_reason, core::ExitReason::BreakoutExit);
    EXPECT_DOUBLE_EQ(result.trades[0].exit_price, 100.0);
}

TEST_F(BacktesterTest, OpenPositionClosedAtEndOfPeriod) {
    data::BarSeries series = test_helpers::seriesFromCloses({100, 101, 102, 103, 104});
    BacktestResult result = engine.run(series, breakout, configWithLookback(3));

    ASSERT_EQ(result.trades.size(), 1u);
    EXPECT_EQ(result.trades[0].exit_reason, core::ExitReason::EndOfPeriod);
    EXPECT_EQ(result.trades[0].exit_date, series.back().date);
    EXPECT_DOUBLE_EQ(result.trades[0].exit_price, 104.0);
    EXPECT_DOUBLE_EQ(result.equity_curve.back().position_value, 0.0);
}

TEST_F(BacktesterTest, NoSignalsMeansFlatEquity) {
    data::BarSeries series = test_helpers::seriesFromCloses({100, 99, 98, 97, 96, 95});
    BacktestResult result = engine.run(series, breakout, configWithLookback(3));

    EXPECT_TRUE(result.trades.empty());
    EXPECT_EQ(result.total_executions, 0);
    ASSERT_EQ(result.equity_curve.size(), series.size());
    for (const auto& point : result.equity_curve) {
        EXPECT_DOUBLE_EQ(point.portfolio_value, 100000.0);
    }
}

TEST_F(BacktesterTest, BuyAndHoldProducesOneEndOfPeriodTrade) {
    data::BarSeries series = test_helpers::seriesFromCloses({50, 55, 52, 60});
    BacktestResult result = engine.run(series, buy_and_hold, StrategyConfig{});

    ASSERT_EQ(result.trades.size(), 1u);
    const core::Trade& trade = result.trades.front();
    EXPECT_EQ(trade.entry_date, dayN(0));
    EXPECT_DOUBLE_EQ(trade.entry_price, 50.0);
    EXPECT_EQ(trade.exit_date, dayN(3));
    EXPECT_DOUBLE_EQ(trade.exit_price, 60.0);
    EXPECT_EQ(trade.exit_reason, core::ExitReason::EndOfPeriod);
    EXPECT_EQ(trade.size, 1900);
    EXPECT_EQ(result.strategy_name, "Buy and Hold");
    EXPECT_EQ(result.instrument_key, "TEST");
}

TEST_F(BacktesterTest, SingleBarBuyAndHoldEntersAndClosesSameBar) {
    data::BarSeries series = test_helpers::seriesFromCloses({100});
    BacktestResult result = engine.run(series, buy_and_hold, StrategyConfig{});

    ASSERT_EQ(result.trades.size(), 1u);
    EXPECT_EQ(result.trades[0].entry_date, result.trades[0].exit_date);
    EXPECT_EQ(result.trades[0].exit_reason, core::ExitReason::EndOfPeriod);
    EXPECT_NEAR(result.trades[0].pnl_pct, -0.002, 1e-12);
    ASSERT_EQ(result.equity_curve.size(), 1u);
    EXPECT_LT(result.equity_curve[0].portfolio_value, 100000.0);
}

TEST_F(BacktesterTest, PositionStateAlternatesAcrossLongRun) {
    data::BarSeries series("WAVY", test_helpers::wavyBars(400));
    BacktestResult result = engine.run(series, breakout, configWithLookback(10));

    ASSERT_EQ(result.equity_curve.size(), series.size());
    ASSERT_FALSE(result.trades.empty());
    EXPECT_EQ(result.total_executions, static_cast<int>(2 * result.trades.size()));
    for (std::size_t k = 0; k < result.trades.size(); ++k) {
        const auto& trade = result.trades[k];
        EXPECT_LE(trade.entry_date, trade.exit_date);
        EXPECT_GE(trade.entry_date, dayN(10)); // no entry before the window fills
        if (k > 0) {
            // No re-entry on the bar of an exit
            EXPECT_GT(trade.entry_date, result.trades[k - 1].exit_date);
        }
        if (trade.exit_reason == core::ExitReason::EndOfPeriod) {
            EXPECT_EQ(k, result.trades.size() - 1);
        }
    }
    for (std::size_t i = 1; i < result.equity_curve.size(); ++i) {
        EXPECT_GT(result.equity_curve[i].date, result.equity_curve[i - 1].date);
    }
}

TEST_F(BacktesterTest, FailsFastOnInvalidInput) {
    data::BarSeries series = test_helpers::seriesFromCloses({100, 101, 102, 103, 104});

    EXPECT_THROW(engine.run(series, breakout, configWithLookback(0)), core::ConfigException);
    // lookback 5 needs six bars
    EXPECT_THROW(engine.run(series, breakout, configWithLookback(5)), core::DataException);

    StrategyConfig bad_stop = configWithLookback(2);
    bad_stop.stop_loss = 1.2;
    EXPECT_THROW(engine.run(series, breakout, bad_stop), core::ConfigException);

    indicators::RollingExtremes extremes(series, 2);
    EXPECT_THROW(engine.run(series, extremes, breakout, configWithLookback(3)), core::ConfigException);

    data::BarSeries other = test_helpers::seriesFromCloses({100, 101, 102});
    EXPECT_THROW(engine.run(other, extremes, breakout, configWithLookback(2)), core::DataException);

    EXPECT_THROW(Backtester(0.0), core::ConfigException);
}

TEST_F(BacktesterTest, ConcurrentRunsMatchSequentialRuns) {
    data::BarSeries series("WAVY", test_helpers::wavyBars(300));
    const StrategyConfig config = configWithLookback(15);
    indicators::RollingExtremes extremes(series, config.lookback_period);

    BacktestResult expected_breakout = engine.run(series, extremes, breakout, config);
    BacktestResult expected_hold = engine.run(series, extremes, buy_and_hold, config);

    std::vector<std::future<BacktestResult>> futures;
    for (int k = 0; k < 4; ++k) {
        const strategy_engine::IStrategy* strategy = (k % 2 == 0)
            ? static_cast<const strategy_engine::IStrategy*>(&breakout)
            : static_cast<const strategy_engine::IStrategy*>(&buy_and_hold);
        futures.push_back(std::async(std::launch::async, [this, &series, &extremes, &config, strategy]() {
            return engine.run(series, extremes, *strategy, config);
        }));
    }

    for (int k = 0; k < 4; ++k) {
        BacktestResult actual = futures[k].get();
        const BacktestResult& expected = (k % 2 == 0) ? expected_breakout : expected_hold;
        ASSERT_EQ(actual.trades.size(), expected.trades.size());
        for (std::size_t t = 0; t < actual.trades.size(); ++t) {
            EXPECT_EQ(actual.trades[t].entry_date, expected.trades[t].entry_date);
            EXPECT_EQ(actual.trades[t].exit_date, expected.trades[t].exit_date);
            EXPECT_DOUBLE_EQ(actual.trades[t].pnl, expected.trades[t].pnl);
        }
        ASSERT_EQ(actual.equity_curve.size(), expected.equity_curve.size());
        EXPECT_DOUBLE_EQ(actual.equity_curve.back().portfolio_value,
                         expected.equity_curve.back().portfolio_value);
    }
}
