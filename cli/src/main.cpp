// cli/src/main.cpp

#include <iostream>
#include <string>
#include <vector>
#include <map>
#include <memory>
#include <future>
#include <exception>

// Project includes
#include "logging.hpp"
#include "exceptions.hpp"
#include "datatypes.hpp"
#include "utils.hpp"
#include "database_manager.hpp"
#include "bar_series.hpp"
#include "rolling_extremes.hpp"
#include "strategy_factory.hpp"
#include "backtester.hpp"
#include "backtest_settings.hpp"
#include "performance_analyzer.hpp"
#include "result_writer.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/logger.h>

namespace {

    const char* kDefaultConfigPath = "config/backtest.json";

    data::BarSeries loadSeries(const backtester::BacktestSettings& settings) {
        auto logger = core::logging::getLogger();
        data::DatabaseManager db_manager(settings.database_path);
        if (!db_manager.connect()) {
            throw core::DataLoadException(fmt::format("Failed to connect to database '{}'.", settings.database_path));
        }
        if (!db_manager.initializeSchema()) {
            throw core::DataLoadException(fmt::format("Failed to initialize schema of '{}'.", settings.database_path));
        }

        auto bars = db_manager.queryBars(settings.instrument_key, settings.interval,
                                         settings.start_date, settings.end_date);
        db_manager.disconnect();
        logger->info("Loaded {} bars for {} ({}).", bars.size(), settings.instrument_key, settings.interval);

        return data::BarSeries(settings.instrument_key, std::move(bars));
    }

} // end anonymous namespace

int main(int argc, char* argv[]) {
    std::shared_ptr<spdlog::logger> logger = nullptr;

    try {
        // --- Initialize Logging ---
        core::logging::initialize("breakout_backtester", spdlog::level::info, spdlog::level::debug);
        logger = core::logging::getLogger();
        logger->info("Breakout Backtester starting...");

        const std::string config_path = (argc > 1) ? argv[1] : kDefaultConfigPath;
        backtester::BacktestSettings settings = backtester::BacktestSettings::fromFile(config_path);

        // --- Build strategies first so a bad config fails before any data work ---
        std::vector<strategy_engine::StrategyDefinition> definitions;
        for (const auto& entry : settings.strategies) {
            definitions.push_back(strategy_engine::StrategyFactory::createStrategy(entry));
        }

        const data::BarSeries series = loadSeries(settings);

        // One read-only RollingExtremes per distinct lookback, shared by the runs
        std::map<int, std::unique_ptr<indicators::RollingExtremes>> extremes_by_lookback;
        for (const auto& definition : definitions) {
            int lookback = definition.config.lookback_period;
            if (extremes_by_lookback.find(lookback) == extremes_by_lookback.end()) {
                extremes_by_lookback[lookback] = std::make_unique<indicators::RollingExtremes>(series, lookback);
            }
        }

        // --- Run strategies independently and in parallel ---
        const backtester::Backtester the_backtester(settings.initial_cash);
        std::vector<std::future<backtester::BacktestResult>> pending;
        for (const auto& definition : definitions) {
            const indicators::RollingExtremes& extremes = *extremes_by_lookback.at(definition.config.lookback_period);
            pending.push_back(std::async(std::launch::async, [&the_backtester, &series, &extremes, &definition]() {
                return the_backtester.run(series, extremes, *definition.strategy, definition.config);
            }));
        }

        const backtester::PerformanceAnalyzer analyzer(settings.risk_free_rate);
        std::vector<backtester::RunSummary> runs;
        for (auto& future : pending) {
            backtester::RunSummary run;
            run.result = future.get(); // Rethrows a failed run
            run.report = analyzer.analyze(run.result.equity_curve, run.result.initial_cash);
            run.statistics = backtester::PerformanceAnalyzer::computeTradeStatistics(run.result.trades);
            runs.push_back(std::move(run));
        }

        // --- Results ---
        logger->info("==================================================");
        logger->info("BACKTEST RESULTS COMPARISON");
        logger->info("==================================================");
        for (const auto& run : runs) {
            run.report.logReport(run.result.strategy_name);
            run.statistics.logStatistics();
        }
        for (std::size_t i = 1; i < runs.size(); ++i) {
            logger->info("{} vs {}: {:.2f}% difference",
                         runs[0].result.strategy_name, runs[i].result.strategy_name,
                         (runs[0].report.total_return - runs[i].report.total_return) * 100.0);
        }

        if (!settings.output_path.empty()) {
            if (!backtester::ResultWriter::writeJson(settings.output_path, runs)) {
                logger->error("Failed to write results to {}", settings.output_path);
                return 1;
            }
        }

        logger->info("Breakout Backtester finished.");

    // --- Exception Handling ---
    } catch (const core::BacktestEngineException& ex) {
        std::cerr << "Backtest Error: " << ex.what() << std::endl;
        if (logger) logger->critical("Backtest Error: {}", ex.what());
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << "Standard Error: " << ex.what() << std::endl;
        if (logger) logger->critical("Standard Error: {}", ex.what());
        return 1;
    }

    return 0;
}
