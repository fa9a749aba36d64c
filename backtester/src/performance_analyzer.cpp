#include "performance_analyzer.hpp"
#include "exceptions.hpp"
#include "logging.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>

namespace backtester {

    namespace {
        // Below this the return series is treated as flat
        constexpr double kMinStdDev = 1e-12;
    }

    bool PerformanceReport::hasSharpe() const {
        return !std::isnan(sharpe_ratio);
    }

    void PerformanceReport::logReport(const std::string& label) const {
        auto logger = core::logging::getLogger();
        logger->info("--- {} ---", label);
        logger->info("Starting Portfolio Value: {:.2f}", starting_value);
        logger->info("Final Portfolio Value: {:.2f}", final_value);
        logger->info("Total Return: {:.2f}%", total_return * 100.0);
        if (hasSharpe()) {
            logger->info("Sharpe Ratio: {:.4f}", sharpe_ratio);
        } else {
            logger->info("Sharpe Ratio: N/A");
        }
        logger->info("Max Drawdown: {:.2f}%", max_drawdown * 100.0);
    }

    void TradeStatistics::logStatistics() const {
        auto logger = core::logging::getLogger();
        logger->info("Round-Trip Trades: {} (won {}, lost {})", round_trip_trades, winning_trades, losing_trades);
        logger->info("Win Rate: {:.2f}%", win_rate * 100.0);
        logger->info("Profit Factor: {:.2f}", profit_factor);
        logger->info("Total PnL: {:.2f} (Avg Win {:.2f}, Avg Loss {:.2f})", total_pnl, avg_win_pnl, avg_loss_pnl);
        for (const auto& entry : exits_by_reason) {
            logger->info("  {}: {}", entry.first, entry.second);
        }
    }

    PerformanceAnalyzer::PerformanceAnalyzer(double risk_free_rate)
        : risk_free_rate_(risk_free_rate) {
        if (!std::isfinite(risk_free_rate_)) {
            throw core::ConfigException("risk_free_rate must be a finite number.");
        }
    }

    PerformanceReport PerformanceAnalyzer::analyze(const core::EquityCurve& equity_curve, double initial_cash) const {
        if (equity_curve.empty()) {
            throw core::DataException("Cannot analyze performance of an empty equity curve.");
        }
        if (!(initial_cash > 0.0)) {
            throw core::ConfigException(fmt::format("Initial cash must be positive, got {}.", initial_cash));
        }

        PerformanceReport report;
        report.starting_value = initial_cash;
        report.final_value = equity_curve.back().portfolio_value;
        report.total_return = totalReturn(report.final_value, initial_cash);
        report.sharpe_ratio = sharpeRatio(dailyReturns(equity_curve));
        report.max_drawdown = maxDrawdown(equity_curve);
        return report;
    }

    double PerformanceAnalyzer::totalReturn(double final_value, double initial_cash) {
        return (final_value - initial_cash) / initial_cash;
    }

    std::vector<double> PerformanceAnalyzer::dailyReturns(const core::EquityCurve& equity_curve) {
        std::vector<double> returns;
        if (equity_curve.size() < 2) {
            return returns;
        }
        returns.reserve(equity_curve.size() - 1);
        for (std::size_t i = 1; i < equity_curve.size(); ++i) {
            const double previous = equity_curve[i - 1].portfolio_value;
            if (previous > 0.0) { // Avoid division by zero
                returns.push_back(equity_curve[i].portfolio_value / previous - 1.0);
            } else {
                returns.push_back(0.0);
            }
        }
        return returns;
    }

    double PerformanceAnalyzer::sharpeRatio(const std::vector<double>& daily_returns) const {
        if (daily_returns.size() < 2) {
            return std::numeric_limits<double>::quiet_NaN();
        }

        const double n = static_cast<double>(daily_returns.size());
        const double mean_return = std::accumulate(daily_returns.begin(), daily_returns.end(), 0.0) / n;

        // Sample standard deviation
        double sq_dev_sum = 0.0;
        for (double r : daily_returns) {
            sq_dev_sum += (r - mean_return) * (r - mean_return);
        }
        const double std_dev = std::sqrt(sq_dev_sum / (n - 1.0));
        if (!(std_dev > kMinStdDev)) {
            return std::numeric_limits<double>::quiet_NaN();
        }

        const double risk_free_daily = risk_free_rate_ / kTradingDaysPerYear;
        return (mean_return - risk_free_daily) / std_dev * std::sqrt(kTradingDaysPerYear);
    }

    double PerformanceAnalyzer::maxDrawdown(const core::EquityCurve& equity_curve) {
        if (equity_curve.empty()) {
            return 0.0;
        }
        double peak_equity = equity_curve.front().portfolio_value;
        double max_drawdown = 0.0;
        for (const auto& point : equity_curve) {
            peak_equity = std::max(peak_equity, point.portfolio_value);
            double current_drawdown = (peak_equity > 0.0) ? (peak_equity - point.portfolio_value) / peak_equity : 0.0;
            max_drawdown = std::max(max_drawdown, current_drawdown);
        }
        return max_drawdown;
    }

    TradeStatistics PerformanceAnalyzer::computeTradeStatistics(const core::TradeLog& trades) {
        TradeStatistics stats;
        stats.round_trip_trades = static_cast<int>(trades.size());

        double gross_profit = 0.0;
        double gross_loss = 0.0;
        for (const auto& trade : trades) {
            if (trade.pnl > 0) {
                stats.winning_trades++;
                gross_profit += trade.pnl;
            } else if (trade.pnl < 0) {
                stats.losing_trades++;
                gross_loss += trade.pnl; // Loss is negative
            }
            stats.total_pnl += trade.pnl;
            stats.exits_by_reason[core::toString(trade.exit_reason)]++;
        }

        if (stats.round_trip_trades > 0) {
            stats.win_rate = static_cast<double>(stats.winning_trades) / stats.round_trip_trades;
        }

        if (std::abs(gross_loss) > 1e-9) {
            stats.profit_factor = gross_profit / std::abs(gross_loss);
        } else if (gross_profit > 1e-9) {
            stats.profit_factor = std::numeric_limits<double>::infinity();
        }

        stats.avg_win_pnl = (stats.winning_trades > 0) ? gross_profit / stats.winning_trades : 0.0;
        stats.avg_loss_pnl = (stats.losing_trades > 0) ? gross_loss / stats.losing_trades : 0.0; // Will be negative
        return stats;
    }

} // namespace backtester
