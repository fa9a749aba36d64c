#include "strategy_config.hpp"
#include "exceptions.hpp"
#include "logging.hpp"

#include <cmath>
#include <string>

namespace strategy_engine {

    namespace { // file-local helpers

        bool isFraction(double value, bool include_zero, bool include_one) {
            if (!std::isfinite(value)) return false;
            bool lower_ok = include_zero ? value >= 0.0 : value > 0.0;
            bool upper_ok = include_one ? value <= 1.0 : value < 1.0;
            return lower_ok && upper_ok;
        }

        double readFraction(const json& params, const char* key, double fallback) {
            if (!params.contains(key)) return fallback;
            if (!params[key].is_number()) {
                throw core::ConfigException(fmt::format("Strategy parameter '{}' must be a number.", key));
            }
            return params[key].get<double>();
        }

    } // end anonymous namespace

    void StrategyConfig::validate() const {
        if (lookback_period < 1) {
            throw core::ConfigException(fmt::format("lookback_period must be >= 1, got {}.", lookback_period));
        }
        if (!isFraction(stop_loss, false, false)) {
            throw core::ConfigException(fmt::format("stop_loss must be in (0, 1), got {}.", stop_loss));
        }
        if (!isFraction(take_profit, false, false)) {
            throw core::ConfigException(fmt::format("take_profit must be in (0, 1), got {}.", take_profit));
        }
        if (!isFraction(position_fraction, false, true)) {
            throw core::ConfigException(fmt::format("position_fraction must be in (0, 1], got {}.", position_fraction));
        }
        if (!isFraction(commission_rate, true, false)) {
            throw core::ConfigException(fmt::format("commission_rate must be in [0, 1), got {}.", commission_rate));
        }
    }

    StrategyConfig parseStrategyConfig(const json& params) {
        StrategyConfig config;
        if (params.is_null()) {
            config.validate();
            return config;
        }
        if (!params.is_object()) {
            throw core::ConfigException("Strategy 'params' must be an object.");
        }

        if (params.contains("lookback_period")) {
            if (!params["lookback_period"].is_number_integer()) {
                throw core::ConfigException("Strategy parameter 'lookback_period' must be an integer.");
            }
            config.lookback_period = params["lookback_period"].get<int>();
        }
        config.stop_loss = readFraction(params, "stop_loss", config.stop_loss);
        config.take_profit = readFraction(params, "take_profit", config.take_profit);
        config.position_fraction = readFraction(params, "position_fraction", config.position_fraction);
        config.commission_rate = readFraction(params, "commission_rate", config.commission_rate);

        config.validate();
        core::logging::getLogger()->debug(
            "StrategyConfig parsed: lookback={}, stop_loss={}, take_profit={}, position_fraction={}, commission_rate={}",
            config.lookback_period, config.stop_loss, config.take_profit,
            config.position_fraction, config.commission_rate);
        return config;
    }

    json toJson(const StrategyConfig& config) {
        return json{
            {"lookback_period", config.lookback_period},
            {"stop_loss", config.stop_loss},
            {"take_profit", config.take_profit},
            {"position_fraction", config.position_fraction},
            {"commission_rate", config.commission_rate}
        };
    }

} // namespace strategy_engine
