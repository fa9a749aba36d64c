#include "breakout_strategy.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include <stdexcept>
#include <utility>

namespace strategy_engine {

BreakoutStrategy::BreakoutStrategy(std::string name)
    : name_(std::move(name))
{
    if (name_.empty()) throw std::invalid_argument("Strategy name cannot be empty.");
    core::logging::getLogger()->debug("Strategy '{}' created.", name_);
}

std::string BreakoutStrategy::getName() const { return name_; }

std::size_t BreakoutStrategy::getRequiredBars(const StrategyConfig& config) const {
    // One full lookback window plus a bar to act on
    return static_cast<std::size_t>(config.lookback_period) + 1;
}

Decision BreakoutStrategy::decide(const MarketDataSnapshot& snapshot,
                                  const core::Position& position,
                                  const StrategyConfig& config) const {
    auto logger = core::logging::getLogger();
    if (!snapshot.current_bar) {
        logger->error("Strategy '{}' evaluated without a current bar.", name_);
        return Decision::none();
    }
    const double close = snapshot.current_bar->close;

    if (position.isLong()) {
        // Protective exits first, so the loss and gain caps hold regardless of indicator lag
        if (close <= position.entry_price * (1.0 - config.stop_loss)) {
            return Decision::exitLong(core::ExitReason::StopLoss);
        }
        if (close >= position.entry_price * (1.0 + config.take_profit)) {
            return Decision::exitLong(core::ExitReason::TakeProfit);
        }
        if (snapshot.extremes && close < snapshot.extremes->lowest_low) {
            return Decision::exitLong(core::ExitReason::BreakoutExit);
        }
        return Decision::none();
    }

    if (!snapshot.extremes) {
        // Lookback window still filling
        return Decision::none();
    }

    if (close > snapshot.extremes->highest_high) {
        logger->debug("Strategy '{}': close {:.2f} broke prior high {:.2f} on {}", name_, close,
                      snapshot.extremes->highest_high, core::utils::dateToString(snapshot.current_bar->date));
        return Decision::enterLong();
    }
    return Decision::none();
}

} // namespace strategy_engine
