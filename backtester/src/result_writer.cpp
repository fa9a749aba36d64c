#include "result_writer.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include "strategy_config.hpp"

#include <filesystem>
#include <fstream>

namespace backtester {

    json ResultWriter::tradeToJson(const core::Trade& trade) {
        return json{
            {"entry_date", core::utils::dateToString(trade.entry_date)},
            {"entry_price", trade.entry_price},
            {"exit_date", core::utils::dateToString(trade.exit_date)},
            {"exit_price", trade.exit_price},
            {"exit_reason", core::toString(trade.exit_reason)},
            {"size", trade.size},
            {"pnl_pct", trade.pnl_pct},
            {"pnl", trade.pnl},
            {"commission", trade.commission}
        };
    }

    json ResultWriter::equityPointToJson(const core::EquityPoint& point) {
        return json{
            {"date", core::utils::dateToString(point.date)},
            {"cash", point.cash},
            {"position_value", point.position_value},
            {"portfolio_value", point.portfolio_value}
        };
    }

    json ResultWriter::reportToJson(const PerformanceReport& report) {
        return json{
            {"total_return", report.total_return},
            {"sharpe_ratio", report.sharpe_ratio},
            {"max_drawdown", report.max_drawdown},
            {"starting_value", report.starting_value},
            {"final_value", report.final_value}
        };
    }

    json ResultWriter::statisticsToJson(const TradeStatistics& statistics) {
        return json{
            {"round_trip_trades", statistics.round_trip_trades},
            {"winning_trades", statistics.winning_trades},
            {"losing_trades", statistics.losing_trades},
            {"win_rate", statistics.win_rate},
            {"profit_factor", statistics.profit_factor},
            {"total_pnl", statistics.total_pnl},
            {"avg_win_pnl", statistics.avg_win_pnl},
            {"avg_loss_pnl", statistics.avg_loss_pnl},
            {"exits_by_reason", statistics.exits_by_reason}
        };
    }

    json ResultWriter::runToJson(const RunSummary& run) {
        json trades = json::array();
        for (const auto& trade : run.result.trades) {
            trades.push_back(tradeToJson(trade));
        }
        json equity_curve = json::array();
        for (const auto& point : run.result.equity_curve) {
            equity_curve.push_back(equityPointToJson(point));
        }

        return json{
            {"strategy", run.result.strategy_name},
            {"instrument_key", run.result.instrument_key},
            {"initial_cash", run.result.initial_cash},
            {"params", strategy_engine::toJson(run.result.config)},
            {"total_executions", run.result.total_executions},
            {"report", reportToJson(run.report)},
            {"trade_statistics", statisticsToJson(run.statistics)},
            {"trades", trades},
            {"equity_curve", equity_curve}
        };
    }

    bool ResultWriter::writeJson(const std::string& filepath, const std::vector<RunSummary>& runs) {
        auto logger = core::logging::getLogger();

        std::filesystem::path path(filepath);
        if (path.has_parent_path()) {
            std::error_code ec;
            std::filesystem::create_directories(path.parent_path(), ec);
            if (ec) {
                logger->error("Cannot create directory '{}' for results: {}", path.parent_path().string(), ec.message());
                return false;
            }
        }

        json document;
        document["runs"] = json::array();
        for (const auto& run : runs) {
            document["runs"].push_back(runToJson(run));
        }

        std::ofstream out(filepath);
        if (!out.is_open()) {
            logger->error("Cannot open results file for writing: {}", filepath);
            return false;
        }
        out << document.dump(2) << '\n';
        if (!out) {
            logger->error("Failed while writing results file: {}", filepath);
            return false;
        }

        logger->info("Wrote {} run(s) to {}", runs.size(), filepath);
        return true;
    }

} // namespace backtester
