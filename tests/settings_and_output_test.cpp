// Unit tests for BacktestSettings (JSON config) and ResultWriter (JSON results).

#include "backtest_settings.hpp"
#include "result_writer.hpp"
#include "breakout_strategy.hpp"
#include "exceptions.hpp"
#include "utils.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <filesystem>
#include <fstream>
#include <limits>

using backtester::BacktestSettings;
using backtester::ResultWriter;
using backtester::json;

namespace {

json validConfig() {
    return json::parse(R"({
        "database": { "path": "data/test.db", "instrument_key": "NSE_EQ|INE002A01018", "interval": "day" },
        "period": { "start": "2020-01-01", "end": "2020-12-31" },
        "initial_cash": 50000,
        "risk_free_rate": 0.02,
        "output_path": "results/run.json",
        "strategies": [
            { "name": "Breakout", "type": "Breakout", "params": { "lookback_period": 20 } },
            { "type": "BuyAndHold" }
        ]
    })");
}

} // namespace

TEST(BacktestSettingsTest, ParsesCompleteConfig) {
    BacktestSettings settings = BacktestSettings::fromJson(validConfig());
    EXPECT_EQ(settings.database_path, "data/test.db");
    EXPECT_EQ(settings.instrument_key, "NSE_EQ|INE002A01018");
    EXPECT_EQ(settings.interval, "day");
    EXPECT_EQ(settings.start_date, core::utils::makeDate(2020, 1, 1));
    EXPECT_EQ(settings.end_date, core::utils::makeDate(2020, 12, 31));
    EXPECT_DOUBLE_EQ(settings.initial_cash, 50000.0);
    EXPECT_DOUBLE_EQ(settings.risk_free_rate, 0.02);
    EXPECT_EQ(settings.output_path, "results/run.json");
    EXPECT_EQ(settings.strategies.size(), 2u);
}

TEST(BacktestSettingsTest, OptionalSectionsDefault) {
    json config = validConfig();
    config.erase("database");
    config.erase("initial_cash");
    config.erase("output_path");
    BacktestSettings settings = BacktestSettings::fromJson(config);
    EXPECT_EQ(settings.instrument_key, "SPY");
    EXPECT_DOUBLE_EQ(settings.initial_cash, 100000.0);
    EXPECT_TRUE(settings.output_path.empty());
}

TEST(BacktestSettingsTest, RejectsInvalidConfigs) {
    json reversed = validConfig();
    reversed["period"]["end"] = "2019-12-31";
    EXPECT_THROW(BacktestSettings::fromJson(reversed), core::ConfigException);

    json bad_date = validConfig();
    bad_date["period"]["start"] = "2020-02-30";
    EXPECT_THROW(BacktestSettings::fromJson(bad_date), core::ConfigException);

    json no_cash = validConfig();
    no_cash["initial_cash"] = 0;
    EXPECT_THROW(BacktestSettings::fromJson(no_cash), core::ConfigException);

    json no_strategies = validConfig();
    no_strategies["strategies"] = json::array();
    EXPECT_THROW(BacktestSettings::fromJson(no_strategies), core::ConfigException);

    json no_period = validConfig();
    no_period.erase("period");
    EXPECT_THROW(BacktestSettings::fromJson(no_period), core::ConfigException);
}

TEST(BacktestSettingsTest, MissingFileIsConfigError) {
    EXPECT_THROW(BacktestSettings::fromFile("does/not/exist.json"), core::ConfigException);
}

class ResultWriterTest : public ::testing::Test {
 protected:
    void SetUp() override {
        core::Trade trade;
        trade.entry_date = test_helpers::dayN(3);
        trade.entry_price = 103.0;
        trade.exit_date = test_helpers::dayN(4);
        trade.exit_price = 80.0;
        trade.exit_reason = core::ExitReason::StopLoss;
        trade.size = 922;
        trade.pnl_pct = -0.2253;
        run.result.strategy_name = "Breakout";
        run.result.instrument_key = "SPY";
        run.result.initial_cash = 100000.0;
        run.result.trades.push_back(trade);

        core::EquityPoint point;
        point.date = test_helpers::dayN(0);
        point.cash = 100000.0;
        point.portfolio_value = 100000.0;
        run.result.equity_curve.push_back(point);

        run.report.sharpe_ratio = std::numeric_limits<double>::quiet_NaN();
        run.report.final_value = 100000.0;
        run.statistics.round_trip_trades = 1;
        run.statistics.exits_by_reason["Stop Loss"] = 1;
    }

    backtester::RunSummary run;
};

TEST_F(ResultWriterTest, TradeUsesCalendarDatesAndReasonText) {
    json trade = ResultWriter::tradeToJson(run.result.trades.front());
    EXPECT_EQ(trade["entry_date"], "2024-01-04");
    EXPECT_EQ(trade["exit_date"], "2024-01-05");
    EXPECT_EQ(trade["exit_reason"], "Stop Loss");
    EXPECT_EQ(trade["size"], 922);
}

TEST_F(ResultWriterTest, UndefinedSharpeSerialisesAsNull) {
    json round_tripped = json::parse(ResultWriter::runToJson(run).dump());
    EXPECT_TRUE(round_tripped["report"]["sharpe_ratio"].is_null());
    EXPECT_EQ(round_tripped["strategy"], "Breakout");
    EXPECT_EQ(round_tripped["trades"].size(), 1u);
    EXPECT_EQ(round_tripped["equity_curve"][0]["date"], "2024-01-01");
    EXPECT_EQ(round_tripped["trade_statistics"]["exits_by_reason"]["Stop Loss"], 1);
    EXPECT_EQ(round_tripped["params"]["lookback_period"], 20);
}

TEST_F(ResultWriterTest, WritesRunsFileCreatingDirectories) {
    namespace fs = std::filesystem;
    fs::path dir = fs::temp_directory_path() / "bbt_result_writer_test";
    fs::remove_all(dir);
    fs::path file = dir / "nested" / "results.json";

    ASSERT_TRUE(ResultWriter::writeJson(file.string(), {run, run}));
    ASSERT_TRUE(fs::exists(file));

    std::ifstream in(file);
    json document = json::parse(in);
    ASSERT_TRUE(document["runs"].is_array());
    EXPECT_EQ(document["runs"].size(), 2u);
    EXPECT_EQ(document["runs"][0]["instrument_key"], "SPY");

    fs::remove_all(dir);
}
