// Unit tests for backtester::PerformanceAnalyzer metrics and trade statistics.

#include "performance_analyzer.hpp"
#include "exceptions.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <vector>

using backtester::PerformanceAnalyzer;

namespace {

core::EquityCurve curveOf(const std::vector<double>& values) {
    core::EquityCurve curve;
    for (std::size_t i = 0; i < values.size(); ++i) {
        core::EquityPoint point;
        point.date = test_helpers::dayN(static_cast<int>(i));
        point.cash = values[i];
        point.position_value = 0.0;
        point.portfolio_value = values[i];
        curve.push_back(point);
    }
    return curve;
}

core::Trade tradeWithPnl(double pnl, core::ExitReason reason) {
    core::Trade trade;
    trade.pnl = pnl;
    trade.exit_reason = reason;
    return trade;
}

} // namespace

TEST(PerformanceAnalyzerTest, TotalReturnUsesInitialCash) {
    PerformanceAnalyzer analyzer;
    auto report = analyzer.analyze(curveOf({100000, 104000, 110000}), 100000.0);
    EXPECT_NEAR(report.total_return, 0.10, 1e-12);
    EXPECT_DOUBLE_EQ(report.starting_value, 100000.0);
    EXPECT_DOUBLE_EQ(report.final_value, 110000.0);
}

TEST(PerformanceAnalyzerTest, MaxDrawdownFromRunningPeak) {
    EXPECT_NEAR(PerformanceAnalyzer::maxDrawdown(curveOf({100, 110, 99, 120, 108})), 0.10, 1e-12);
    EXPECT_NEAR(PerformanceAnalyzer::maxDrawdown(curveOf({100, 50, 75})), 0.50, 1e-12);
}

TEST(PerformanceAnalyzerTest, NonDecreasingCurveHasNoDrawdown) {
    EXPECT_DOUBLE_EQ(PerformanceAnalyzer::maxDrawdown(curveOf({100, 100, 101, 105, 105, 130})), 0.0);
    EXPECT_DOUBLE_EQ(PerformanceAnalyzer::maxDrawdown(curveOf({100})), 0.0);
}

TEST(PerformanceAnalyzerTest, DailyReturnsAreBarToBar) {
    auto returns = PerformanceAnalyzer::dailyReturns(curveOf({100, 110, 99}));
    ASSERT_EQ(returns.size(), 2u);
    EXPECT_NEAR(returns[0], 0.10, 1e-12);
    EXPECT_NEAR(returns[1], -0.10, 1e-12);
    EXPECT_TRUE(PerformanceAnalyzer::dailyReturns(curveOf({100})).empty());
}

TEST(PerformanceAnalyzerTest, SharpeUndefinedForConstantCurve) {
    PerformanceAnalyzer analyzer;
    auto report = analyzer.analyze(curveOf({100000, 100000, 100000, 100000}), 100000.0);
    EXPECT_TRUE(std::isnan(report.sharpe_ratio));
    EXPECT_FALSE(report.hasSharpe());
    EXPECT_DOUBLE_EQ(report.max_drawdown, 0.0);
    EXPECT_DOUBLE_EQ(report.total_return, 0.0);
}

TEST(PerformanceAnalyzerTest, SharpeUndefinedWithFewerThanTwoReturns) {
    PerformanceAnalyzer analyzer;
    EXPECT_TRUE(std::isnan(analyzer.sharpeRatio({})));
    EXPECT_TRUE(std::isnan(analyzer.sharpeRatio({0.01})));
}

TEST(PerformanceAnalyzerTest, SharpeAnnualisesSampleStatistics) {
    PerformanceAnalyzer analyzer;
    std::vector<double> returns{0.01, 0.02, 0.00, 0.03};
    const double mean = 0.015;
    const double sample_std = std::sqrt((0.005 * 0.005 * 2 + 0.015 * 0.015 * 2) / 3.0);
    EXPECT_NEAR(analyzer.sharpeRatio(returns), mean / sample_std * std::sqrt(252.0), 1e-9);

    PerformanceAnalyzer with_rate(0.0252);
    EXPECT_NEAR(with_rate.sharpeRatio(returns), (mean - 0.0001) / sample_std * std::sqrt(252.0), 1e-9);
}

TEST(PerformanceAnalyzerTest, RisingCurveHasPositiveSharpe) {
    PerformanceAnalyzer analyzer;
    auto report = analyzer.analyze(curveOf({100, 101, 103, 104, 107}), 100.0);
    ASSERT_TRUE(report.hasSharpe());
    EXPECT_GT(report.sharpe_ratio, 0.0);
}

TEST(PerformanceAnalyzerTest, RejectsEmptyCurveAndBadCash) {
    PerformanceAnalyzer analyzer;
    EXPECT_THROW(analyzer.analyze({}, 100000.0), core::DataException);
    EXPECT_THROW(analyzer.analyze(curveOf({100}), 0.0), core::ConfigException);
}

TEST(TradeStatisticsTest, CountsWinsLossesAndExitReasons) {
    core::TradeLog trades{
        tradeWithPnl(300.0, core::ExitReason::TakeProfit),
        tradeWithPnl(-100.0, core::ExitReason::StopLoss),
        tradeWithPnl(100.0, core::ExitReason::BreakoutExit),
        tradeWithPnl(-50.0, core::ExitReason::StopLoss)};
    auto stats = PerformanceAnalyzer::computeTradeStatistics(trades);

    EXPECT_EQ(stats.round_trip_trades, 4);
    EXPECT_EQ(stats.winning_trades, 2);
    EXPECT_EQ(stats.losing_trades, 2);
    EXPECT_DOUBLE_EQ(stats.win_rate, 0.5);
    EXPECT_NEAR(stats.profit_factor, 400.0 / 150.0, 1e-12);
    EXPECT_DOUBLE_EQ(stats.total_pnl, 250.0);
    EXPECT_DOUBLE_EQ(stats.avg_win_pnl, 200.0);
    EXPECT_DOUBLE_EQ(stats.avg_loss_pnl, -75.0);
    EXPECT_EQ(stats.exits_by_reason["Stop Loss"], 2);
    EXPECT_EQ(stats.exits_by_reason["Take Profit"], 1);
    EXPECT_EQ(stats.exits_by_reason["Breakout Exit"], 1);
}

TEST(TradeStatisticsTest, NoLossesGivesInfiniteProfitFactor) {
    auto stats = PerformanceAnalyzer::computeTradeStatistics({tradeWithPnl(10.0, core::ExitReason::EndOfPeriod)});
    EXPECT_TRUE(std::isinf(stats.profit_factor));

    auto empty = PerformanceAnalyzer::computeTradeStatistics({});
    EXPECT_EQ(empty.round_trip_trades, 0);
    EXPECT_DOUBLE_EQ(empty.win_rate, 0.0);
    EXPECT_DOUBLE_EQ(empty.profit_factor, 0.0);
}
