#include "buy_and_hold_strategy.hpp"
#include "logging.hpp"
#include <stdexcept>
#include <utility>

namespace strategy_engine {

BuyAndHoldStrategy::BuyAndHoldStrategy(std::string name)
    : name_(std::move(name))
{
    if (name_.empty()) throw std::invalid_argument("Strategy name cannot be empty.");
    core::logging::getLogger()->debug("Strategy '{}' created.", name_);
}

std::string BuyAndHoldStrategy::getName() const { return name_; }

std::size_t BuyAndHoldStrategy::getRequiredBars(const StrategyConfig& /*config*/) const {
    return 1;
}

Decision BuyAndHoldStrategy::decide(const MarketDataSnapshot& snapshot,
                                    const core::Position& position,
                                    const StrategyConfig& /*config*/) const {
    if (snapshot.bar_index == 0 && !position.isLong()) {
        return Decision::enterLong();
    }
    return Decision::none();
}

} // namespace strategy_engine
