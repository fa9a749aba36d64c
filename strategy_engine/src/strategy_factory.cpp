#include "strategy_factory.hpp"
#include "breakout_strategy.hpp"
#include "buy_and_hold_strategy.hpp"
#include "logging.hpp"
#include "exceptions.hpp"

#include <algorithm>
#include <cctype>
#include <string>
#include <memory>

namespace strategy_engine {

    namespace { // Use anonymous namespace for file-local helpers

        // "Breakout", "breakout", "Buy_And_Hold", "buy-and-hold" all normalise to lowercase letters only
        std::string normaliseType(const std::string& type) {
            std::string out;
            out.reserve(type.size());
            for (unsigned char c : type) {
                if (std::isalnum(c)) out.push_back(static_cast<char>(std::tolower(c)));
            }
            return out;
        }

    } // end anonymous namespace

    std::unique_ptr<IStrategy> StrategyFactory::createByType(const std::string& type, const std::string& name) {
        const std::string key = normaliseType(type);
        if (key == "breakout") {
            return name.empty() ? std::make_unique<BreakoutStrategy>() : std::make_unique<BreakoutStrategy>(name);
        }
        if (key == "buyandhold" || key == "buyhold") {
            return name.empty() ? std::make_unique<BuyAndHoldStrategy>() : std::make_unique<BuyAndHoldStrategy>(name);
        }
        throw core::StrategyException(fmt::format("Unknown strategy type '{}'.", type));
    }

    StrategyDefinition StrategyFactory::createStrategy(const json& config) {
        auto logger = core::logging::getLogger();

        if (!config.is_object() || !config.contains("type") || !config["type"].is_string()) {
            throw core::ConfigException("Strategy config must be an object with a 'type' (string).");
        }
        std::string type = config["type"].get<std::string>();

        std::string name;
        if (config.contains("name")) {
            if (!config["name"].is_string()) {
                throw core::ConfigException("Strategy 'name' must be a string.");
            }
            name = config["name"].get<std::string>();
        }

        StrategyDefinition definition;
        try {
            definition.config = parseStrategyConfig(config.contains("params") ? config["params"] : json());
        } catch (const core::ConfigException& e) {
            logger->error("Invalid parameters for strategy '{}' ({}): {}", name, type, e.what());
            throw;
        }
        definition.strategy = createByType(type, name);

        logger->info("Strategy '{}' ({}) loaded: {}", definition.strategy->getName(), type,
                     toJson(definition.config).dump());
        return definition;
    }

} // namespace strategy_engine
