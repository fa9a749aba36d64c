#pragma once

#include "interfaces.hpp"
#include <string>

namespace strategy_engine {

    // Buys on the first bar and never signals an exit; the backtester closes the
    // position at the final bar ("End of Period").
    class BuyAndHoldStrategy : public IStrategy {
    public:
        explicit BuyAndHoldStrategy(std::string name = "Buy and Hold");

        virtual ~BuyAndHoldStrategy() override = default;

        std::string getName() const override;
        std::size_t getRequiredBars(const StrategyConfig& config) const override;
        Decision decide(const MarketDataSnapshot& snapshot,
                        const core::Position& position,
                        const StrategyConfig& config) const override;

    private:
        std::string name_;
    };

} // namespace strategy_engine
