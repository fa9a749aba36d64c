#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "backtester.hpp"
#include "performance_analyzer.hpp"

namespace backtester {

    using json = nlohmann::json;

    // One analysed run, as handed to reporting
    struct RunSummary {
        BacktestResult result;
        PerformanceReport report;
        TradeStatistics statistics;
    };

    // Serialises runs for downstream reporting/charting tools.
    // Dates are "YYYY-MM-DD"; undefined metrics (NaN, infinity) become null.
    class ResultWriter {
    public:
        static json tradeToJson(const core::Trade& trade);
        static json equityPointToJson(const core::EquityPoint& point);
        static json reportToJson(const PerformanceReport& report);
        static json statisticsToJson(const TradeStatistics& statistics);
        static json runToJson(const RunSummary& run);

        // { "runs": [ ... ] } written with 2-space indentation; creates parent directories.
        // Returns false and logs on failure.
        static bool writeJson(const std::string& filepath, const std::vector<RunSummary>& runs);
    };

} // namespace backtester
