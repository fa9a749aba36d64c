#include "backtester.hpp"
#include "portfolio.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include "exceptions.hpp"

#include <cmath>
#include <string>

namespace backtester {

    namespace {

        void executeDecision(Portfolio& portfolio,
                             const core::Bar& bar,
                             const strategy_engine::Decision& decision,
                             const strategy_engine::StrategyConfig& config,
                             const std::string& strategy_name) {
            auto logger = core::logging::getLogger();
            const core::Position& position = portfolio.getPosition();

            switch (decision.action) {
                case core::SignalAction::EnterLong: {
                    if (position.isLong()) {
                        logger->debug("Ignoring EnterLong from '{}' on {}: position is not flat.",
                                      strategy_name, core::utils::dateToString(bar.date));
                        return;
                    }
                    long long size = portfolio.sizeFor(config.position_fraction, bar.close);
                    if (size <= 0) {
                        logger->warn("Calculated entry quantity is zero on {} (cash {:.2f}, price {:.2f}). Ignoring signal.",
                                     core::utils::dateToString(bar.date), portfolio.getCash(), bar.close);
                        return;
                    }
                    portfolio.enterLong(bar, size, config.stop_loss, config.take_profit);
                    return;
                }

                case core::SignalAction::ExitLong: {
                    if (!position.isLong()) {
                        logger->debug("Ignoring ExitLong from '{}' on {}: not currently long.",
                                      strategy_name, core::utils::dateToString(bar.date));
                        return;
                    }
                    if (decision.exit_reason == core::ExitReason::None) {
                        throw core::StrategyException(fmt::format(
                            "Strategy '{}' signalled ExitLong on {} without an exit reason.",
                            strategy_name, core::utils::dateToString(bar.date)));
                    }
                    portfolio.exitLong(bar, decision.exit_reason);
                    return;
                }

                case core::SignalAction::None:
                    return;
            }
        }

    } // end anonymous namespace

    Backtester::Backtester(double initial_capital)
        : initial_capital_(initial_capital)
    {
        if (!(initial_capital_ > 0.0) || !std::isfinite(initial_capital_)) {
            throw core::ConfigException(fmt::format("Initial capital must be positive, got {}.", initial_capital_));
        }
        core::logging::getLogger()->debug("Backtester initialized with capital: {}", initial_capital_);
    }

    BacktestResult Backtester::run(const data::BarSeries& series,
                                   const strategy_engine::IStrategy& strategy,
                                   const strategy_engine::StrategyConfig& config) const {
        config.validate();
        indicators::RollingExtremes extremes(series, config.lookback_period);
        return run(series, extremes, strategy, config);
    }

    BacktestResult Backtester::run(const data::BarSeries& series,
                                   const indicators::RollingExtremes& extremes,
                                   const strategy_engine::IStrategy& strategy,
                                   const strategy_engine::StrategyConfig& config) const {
        auto logger = core::logging::getLogger();
        const std::string strategy_name = strategy.getName();

        // --- Fail fast: nothing is simulated unless every precondition holds ---
        config.validate();
        if (extremes.lookback() != config.lookback_period) {
            throw core::ConfigException(fmt::format(
                "RollingExtremes lookback {} does not match lookback_period {}.",
                extremes.lookback(), config.lookback_period));
        }
        if (extremes.size() != series.size()) {
            throw core::DataException(fmt::format(
                "RollingExtremes covers {} bars but the series has {}.", extremes.size(), series.size()));
        }
        series.requireAtLeast(strategy.getRequiredBars(config),
                              fmt::format("strategy '{}' with lookback_period {}", strategy_name, config.lookback_period));

        logger->info("Starting backtest of '{}' on {} ({} bars, {} to {})",
                     strategy_name, series.instrumentKey(), series.size(),
                     core::utils::dateToString(series.front().date),
                     core::utils::dateToString(series.back().date));

        Portfolio portfolio(initial_capital_, config.commission_rate);
        const std::size_t last_index = series.size() - 1;

        // --- Main Event Loop ---
        for (std::size_t i = 0; i < series.size(); ++i) {
            const core::Bar& current_bar = series[i];

            // 1. Market data visible at this bar (extremes exclude the bar itself)
            strategy_engine::MarketDataSnapshot snapshot;
            snapshot.bar_index = i;
            snapshot.current_bar = &current_bar;
            snapshot.extremes = extremes.at(i);

            if (snapshot.extremes) {
                logger->trace("{} C={:.2f} HH={:.2f} LL={:.2f}", core::utils::dateToString(current_bar.date),
                              current_bar.close, snapshot.extremes->highest_high, snapshot.extremes->lowest_low);
            }

            // 2. Evaluate strategy
            strategy_engine::Decision decision = strategy.decide(snapshot, portfolio.getPosition(), config);
            if (decision.action != core::SignalAction::None) {
                logger->debug("{}: '{}' signalled {} ({})", core::utils::dateToString(current_bar.date),
                              strategy_name, core::toString(decision.action), core::toString(decision.exit_reason));
            }

            // 3. Execute signal; at most one transition per bar
            executeDecision(portfolio, current_bar, decision, config, strategy_name);

            // 4. Close whatever is still open at the final close
            if (i == last_index && portfolio.getPosition().isLong()) {
                portfolio.exitLong(current_bar, core::ExitReason::EndOfPeriod);
            }

            // 5. Record portfolio value for this bar
            portfolio.recordEquity(current_bar);
        }

        BacktestResult result;
        result.strategy_name = strategy_name;
        result.instrument_key = series.instrumentKey();
        result.config = config;
        result.initial_cash = initial_capital_;
        result.total_executions = portfolio.getTotalExecutions();
        result.trades = portfolio.getTradeLog();
        result.equity_curve = portfolio.getEquityCurve();

        logger->info("Backtest of '{}' finished: {} round trips, final value {:.2f}",
                     strategy_name, result.trades.size(), result.equity_curve.back().portfolio_value);
        return result;
    }

} // namespace backtester
