#pragma once

#include <string>
#include <memory> // For std::unique_ptr
#include <nlohmann/json.hpp>

#include "interfaces.hpp"
#include "strategy_config.hpp"

namespace strategy_engine {

    using json = nlohmann::json;

    // A strategy instance together with the parameters it runs with
    struct StrategyDefinition {
        std::unique_ptr<IStrategy> strategy;
        StrategyConfig config;
    };

    class StrategyFactory {
    public:
        // Build a strategy from a config entry:
        //   { "name": "...", "type": "Breakout" | "BuyAndHold", "params": { ... } }
        // Throws core::StrategyException for an unknown type and
        // core::ConfigException for malformed entries or parameters.
        static StrategyDefinition createStrategy(const json& config);

        static std::unique_ptr<IStrategy> createByType(const std::string& type, const std::string& name);
    };

} // namespace strategy_engine
