#include "portfolio.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include <cmath>

namespace backtester {

    Portfolio::Portfolio(double initial_cash, double commission_rate)
        : initial_cash_(initial_cash), commission_rate_(commission_rate), cash_(initial_cash) {
        if (!(initial_cash > 0.0) || !std::isfinite(initial_cash)) {
            throw core::ConfigException(fmt::format("Initial cash must be positive, got {}.", initial_cash));
        }
        if (!(commission_rate >= 0.0 && commission_rate < 1.0)) {
            throw core::ConfigException(fmt::format("commission_rate must be in [0, 1), got {}.", commission_rate));
        }
    }

    double Portfolio::getCurrentEquity(double price) const {
        return position_.isLong() ? cash_ + static_cast<double>(position_.size) * price : cash_;
    }

    long long Portfolio::sizeFor(double position_fraction, double price) const {
        if (!(price > 0.0)) {
            core::logging::getLogger()->error("Cannot calculate quantity: price is not positive ({}).", price);
            return 0;
        }
        long long size = static_cast<long long>(std::floor(position_fraction * cash_ / price));
        if (size > 0 && static_cast<double>(size) * price * (1.0 + commission_rate_) > cash_) {
            size = static_cast<long long>(std::floor(cash_ / (price * (1.0 + commission_rate_))));
        }
        return size > 0 ? size : 0;
    }

    void Portfolio::enterLong(const core::Bar& bar, long long size, double stop_loss, double take_profit) {
        auto logger = core::logging::getLogger();
        if (position_.isLong()) {
            throw core::BacktestException(fmt::format(
                "Cannot enter long on {}: position is already Long.", core::utils::dateToString(bar.date)));
        }
        if (size <= 0) {
            throw core::BacktestException(fmt::format(
                "Cannot enter long on {} with non-positive size {}.", core::utils::dateToString(bar.date), size));
        }

        const double execution_price = bar.close; // Fills at the close
        const double notional = static_cast<double>(size) * execution_price;
        const double commission = notional * commission_rate_;
        if (notional + commission > cash_) {
            throw core::BacktestException(fmt::format(
                "Insufficient cash for entry on {}! Have: {:.2f}, Need: {:.2f}.",
                core::utils::dateToString(bar.date), cash_, notional + commission));
        }

        cash_ -= notional + commission;
        execution_count_++;

        position_.state = core::PositionState::Long;
        position_.entry_price = execution_price;
        position_.entry_date = bar.date;
        position_.size = size;
        position_.stop_price = execution_price * (1.0 - stop_loss);
        position_.target_price = execution_price * (1.0 + take_profit);
        position_.entry_commission = commission;

        logger->info("BUY {} at {:.2f} on {} (Comm={:.2f}, Stop={:.2f}, Target={:.2f}, NewCash={:.2f})",
                     size, execution_price, core::utils::dateToString(bar.date),
                     commission, position_.stop_price, position_.target_price, cash_);
    }

    const core::Trade& Portfolio::exitLong(const core::Bar& bar, core::ExitReason reason) {
        auto logger = core::logging::getLogger();
        if (!position_.isLong()) {
            throw core::BacktestException(fmt::format(
                "Cannot exit long on {}: position is Flat.", core::utils::dateToString(bar.date)));
        }

        const double execution_price = bar.close;
        const double notional = static_cast<double>(position_.size) * execution_price;
        const double commission = notional * commission_rate_;
        const double entry_value = static_cast<double>(position_.size) * position_.entry_price;

        cash_ += notional - commission;
        execution_count_++;

        core::Trade trade;
        trade.entry_date = position_.entry_date;
        trade.entry_price = position_.entry_price;
        trade.exit_date = bar.date;
        trade.exit_price = execution_price;
        trade.exit_reason = reason;
        trade.size = position_.size;
        trade.commission = position_.entry_commission + commission;
        trade.pnl = notional - entry_value - trade.commission;
        trade.pnl_pct = (execution_price - position_.entry_price) / position_.entry_price - 2.0 * commission_rate_;
        trade_log_.push_back(trade);

        logger->info("SELL {} at {:.2f} on {} - {} - P&L: {:.2f}% ({:.2f}), NewCash={:.2f}",
                     trade.size, execution_price, core::utils::dateToString(bar.date),
                     core::toString(reason), trade.pnl_pct * 100.0, trade.pnl, cash_);

        position_ = core::Position{};
        return trade_log_.back();
    }

    void Portfolio::recordEquity(const core::Bar& bar) {
        core::EquityPoint point;
        point.date = bar.date;
        point.cash = cash_;
        point.position_value = position_.isLong() ? static_cast<double>(position_.size) * bar.close : 0.0;
        point.portfolio_value = point.cash + point.position_value;
        equity_curve_.push_back(point);
    }

} // namespace backtester
