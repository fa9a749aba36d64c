#pragma once

#include <string>
#include <nlohmann/json.hpp>

#include "datatypes.hpp"

namespace backtester {

    using json = nlohmann::json;

    // Run-level settings read from the JSON config file
    struct BacktestSettings {
        std::string database_path = "data/market_data.db";
        std::string instrument_key = "SPY";
        std::string interval = "day";
        core::Timestamp start_date;
        core::Timestamp end_date;
        double initial_cash = 100000.0;
        double risk_free_rate = 0.0;
        std::string output_path;   // Empty: no results file
        json strategies = json::array(); // Entries for StrategyFactory::createStrategy

        // Throws core::ConfigException on missing/ill-typed keys, start after end,
        // initial_cash <= 0 or an empty strategy list.
        static BacktestSettings fromJson(const json& config);

        // Reads and parses the file, then fromJson(). Throws core::ConfigException.
        static BacktestSettings fromFile(const std::string& path);
    };

} // namespace backtester
