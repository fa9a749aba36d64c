#include "backtest_settings.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "utils.hpp"

#include <cmath>
#include <fstream>
#include <stdexcept>

namespace backtester {

    namespace {

        std::string readString(const json& object, const char* key, const std::string& fallback) {
            if (!object.contains(key)) return fallback;
            if (!object[key].is_string()) {
                throw core::ConfigException(fmt::format("Config key '{}' must be a string.", key));
            }
            return object[key].get<std::string>();
        }

        double readNumber(const json& object, const char* key, double fallback) {
            if (!object.contains(key)) return fallback;
            if (!object[key].is_number()) {
                throw core::ConfigException(fmt::format("Config key '{}' must be a number.", key));
            }
            return object[key].get<double>();
        }

        core::Timestamp readDate(const json& object, const char* key) {
            if (!object.contains(key) || !object[key].is_string()) {
                throw core::ConfigException(fmt::format("Config key 'period.{}' must be a YYYY-MM-DD string.", key));
            }
            try {
                return core::utils::stringToDate(object[key].get<std::string>());
            } catch (const std::invalid_argument& e) {
                throw core::ConfigException(fmt::format("Config key 'period.{}': {}", key, e.what()));
            }
        }

    } // end anonymous namespace

    BacktestSettings BacktestSettings::fromJson(const json& config) {
        if (!config.is_object()) {
            throw core::ConfigException("Backtest config must be a JSON object.");
        }

        BacktestSettings settings;

        if (config.contains("database")) {
            const json& database = config["database"];
            if (!database.is_object()) {
                throw core::ConfigException("Config key 'database' must be an object.");
            }
            settings.database_path = readString(database, "path", settings.database_path);
            settings.instrument_key = readString(database, "instrument_key", settings.instrument_key);
            settings.interval = readString(database, "interval", settings.interval);
        }

        if (!config.contains("period") || !config["period"].is_object()) {
            throw core::ConfigException("Config key 'period' must be an object with 'start' and 'end'.");
        }
        settings.start_date = readDate(config["period"], "start");
        settings.end_date = readDate(config["period"], "end");
        if (settings.end_date < settings.start_date) {
            throw core::ConfigException(fmt::format("Backtest period ends ({}) before it starts ({}).",
                                                    core::utils::dateToString(settings.end_date),
                                                    core::utils::dateToString(settings.start_date)));
        }

        settings.initial_cash = readNumber(config, "initial_cash", settings.initial_cash);
        if (!(settings.initial_cash > 0.0) || !std::isfinite(settings.initial_cash)) {
            throw core::ConfigException(fmt::format("initial_cash must be positive, got {}.", settings.initial_cash));
        }
        settings.risk_free_rate = readNumber(config, "risk_free_rate", settings.risk_free_rate);
        settings.output_path = readString(config, "output_path", settings.output_path);

        if (!config.contains("strategies") || !config["strategies"].is_array() || config["strategies"].empty()) {
            throw core::ConfigException("Config key 'strategies' must be a non-empty array.");
        }
        settings.strategies = config["strategies"];

        return settings;
    }

    BacktestSettings BacktestSettings::fromFile(const std::string& path) {
        auto logger = core::logging::getLogger();
        logger->info("Loading backtest config from: {}", path);

        std::ifstream ifs(path);
        if (!ifs.is_open()) {
            throw core::ConfigException(fmt::format("Failed to open config file: {}", path));
        }

        json config;
        try {
            config = json::parse(ifs);
        } catch (const json::parse_error& e) {
            throw core::ConfigException(fmt::format("Failed to parse config file '{}': {}", path, e.what()));
        }

        BacktestSettings settings = fromJson(config);
        logger->info("Config loaded: {} {} from {} to {}, {} strategies", settings.instrument_key, settings.interval,
                     core::utils::dateToString(settings.start_date), core::utils::dateToString(settings.end_date),
                     settings.strategies.size());
        return settings;
    }

} // namespace backtester
