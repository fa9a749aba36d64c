#include "window_extreme_indicator.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "ta_libc.h"            // Include TA-Lib C API header
#include <vector>

namespace indicators {

WindowExtremeIndicator::WindowExtremeIndicator(Kind kind, int period)
    : kind_(kind), period_(period), lookback_(0) {
    if (period_ <= 0) {
         throw core::ConfigException(fmt::format("Window extreme period must be positive, got {}.", period_));
    }

    // TA-Lib accepts periods of 2 and up; a 1-bar window is the bar itself
    if (period_ == 1) {
        lookback_ = 0;
    } else {
        lookback_ = (kind_ == Kind::HighestHigh) ? TA_MAX_Lookback(period_) : TA_MIN_Lookback(period_);
    }
    if (lookback_ < 0) {
         throw core::IndicatorCalculationException(
             fmt::format("TA-Lib lookback returned an unexpected value: {}", lookback_));
    }

    name_ = fmt::format("{}({})", kind_ == Kind::HighestHigh ? "HighestHigh" : "LowestLow", period_);
    core::logging::getLogger()->debug("WindowExtremeIndicator created: Name='{}', Period={}, Lookback={}",
                                      name_, period_, lookback_);
}

std::string WindowExtremeIndicator::getName() const {
    return name_;
}

int WindowExtremeIndicator::getLookback() const {
    return lookback_;
}

const core::TimeSeries<double>& WindowExtremeIndicator::getResult() const {
    return results_;
}

void WindowExtremeIndicator::calculate(const core::TimeSeries<core::Bar>& input) {
    auto logger = core::logging::getLogger();
    logger->trace("Calculating {}...", name_);
    results_.clear();

    if (input.size() <= static_cast<size_t>(lookback_)) {
        logger->debug("Input size ({}) is less than or equal to lookback ({}) for {}. No results generated.",
                      input.size(), lookback_, name_);
        return;
    }

    std::vector<double> prices;
    prices.reserve(input.size());
    for (const auto& bar : input) {
        prices.push_back(kind_ == Kind::HighestHigh ? bar.high : bar.low);
    }

    if (period_ == 1) {
        results_ = std::move(prices);
        return;
    }

    // TA-Lib output size = input size - lookback
    int output_size = static_cast<int>(prices.size()) - lookback_;
    results_.resize(static_cast<size_t>(output_size));

    int out_begin_idx = 0;  // Index of the first valid output element relative to input
    int out_nb_element = 0; // Number of elements calculated

    TA_RetCode ret_code;
    if (kind_ == Kind::HighestHigh) {
        ret_code = TA_MAX(0, static_cast<int>(prices.size()) - 1, prices.data(), period_,
                          &out_begin_idx, &out_nb_element, results_.data());
    } else {
        ret_code = TA_MIN(0, static_cast<int>(prices.size()) - 1, prices.data(), period_,
                          &out_begin_idx, &out_nb_element, results_.data());
    }

    if (ret_code != TA_SUCCESS) {
        results_.clear();
        throw core::IndicatorCalculationException(
            fmt::format("TA-Lib calculation failed for {} with error code: {}", name_, static_cast<int>(ret_code)));
    }

    // Results are aligned by lookback; any other layout would shift every window
    if (out_begin_idx != lookback_ || out_nb_element != output_size) {
        results_.clear();
        throw core::IndicatorCalculationException(
            fmt::format("TA-Lib output for {} misaligned: begin {} (expected {}), count {} (expected {}).",
                        name_, out_begin_idx, lookback_, out_nb_element, output_size));
    }

    logger->trace("Successfully calculated {} results for {}", results_.size(), name_);
}

} // namespace indicators
