#pragma once

#include <nlohmann/json.hpp>

namespace strategy_engine {

    using json = nlohmann::json;

    // Parameters of one strategy run. Immutable for the duration of the run.
    struct StrategyConfig {
        int lookback_period = 20;        // >= 1
        double stop_loss = 0.05;         // (0, 1)
        double take_profit = 0.15;       // (0, 1)
        double position_fraction = 0.95; // (0, 1]
        double commission_rate = 0.001;  // [0, 1)

        // Throws core::ConfigException naming the first violated bound
        void validate() const;
    };

    // Reads the "params" object of a strategy entry. Missing keys keep their defaults;
    // wrong types or out-of-range values raise core::ConfigException.
    StrategyConfig parseStrategyConfig(const json& params);

    json toJson(const StrategyConfig& config);

} // namespace strategy_engine
