#pragma once

#include "interfaces.hpp"
#include <string>

namespace strategy_engine {

    // Enters when the close breaks above the prior N-bar high. While long, exits on
    // the first of: stop-loss, take-profit, close below the prior N-bar low.
    class BreakoutStrategy : public IStrategy {
    public:
        explicit BreakoutStrategy(std::string name = "Breakout");

        virtual ~BreakoutStrategy() override = default;

        std::string getName() const override;
        std::size_t getRequiredBars(const StrategyConfig& config) const override;
        Decision decide(const MarketDataSnapshot& snapshot,
                        const core::Position& position,
                        const StrategyConfig& config) const override;

    private:
        std::string name_;
    };

} // namespace strategy_engine
