#pragma once

#include <cstddef>
#include <optional>
#include <string>

#include "datatypes.hpp"        // Provides Bar, Position, SignalAction, ExitReason
#include "rolling_extremes.hpp" // Provides indicators::Extremes
#include "strategy_config.hpp"

namespace strategy_engine {

    // Market data visible to a strategy at one bar: the bar itself and
    // extremes built from strictly earlier bars.
    struct MarketDataSnapshot {
        std::size_t bar_index = 0;
        const core::Bar* current_bar = nullptr;
        std::optional<indicators::Extremes> extremes; // Empty while the lookback window is filling
    };

    // What a strategy wants done on the current bar
    struct Decision {
        core::SignalAction action = core::SignalAction::None;
        core::ExitReason exit_reason = core::ExitReason::None; // Set for ExitLong only

        static Decision none() { return Decision{}; }
        static Decision enterLong() { return Decision{core::SignalAction::EnterLong, core::ExitReason::None}; }
        static Decision exitLong(core::ExitReason reason) { return Decision{core::SignalAction::ExitLong, reason}; }
    };

    // --- Strategy Interface ---
    // Implementations are stateless: the decision depends only on the arguments,
    // so one instance can serve concurrent runs.
    class IStrategy {
    public:
        virtual ~IStrategy() = default;

        // Get the unique name/ID of the strategy
        virtual std::string getName() const = 0;

        // Minimum number of bars a series must hold before a run may start
        virtual std::size_t getRequiredBars(const StrategyConfig& config) const = 0;

        virtual Decision decide(const MarketDataSnapshot& snapshot,
                                const core::Position& position,
                                const StrategyConfig& config) const = 0;
    };

} // namespace strategy_engine
