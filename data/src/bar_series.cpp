#include "bar_series.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "utils.hpp"

#include <utility>

namespace data {

namespace {

    void validateBar(const core::Bar& bar, std::size_t index) {
        if (!(bar.open > 0.0) || !(bar.high > 0.0) || !(bar.low > 0.0) || !(bar.close > 0.0)) {
            throw core::DataException(fmt::format(
                "Bar {} ({}) has a non-positive price (O={}, H={}, L={}, C={}).",
                index, core::utils::dateToString(bar.date), bar.open, bar.high, bar.low, bar.close));
        }
        if (bar.high < bar.low) {
            throw core::DataException(fmt::format(
                "Bar {} ({}) has high {} below low {}.",
                index, core::utils::dateToString(bar.date), bar.high, bar.low));
        }
        if (bar.volume < 0) {
            throw core::DataException(fmt::format(
                "Bar {} ({}) has negative volume {}.",
                index, core::utils::dateToString(bar.date), bar.volume));
        }
    }

} // end anonymous namespace

BarSeries::BarSeries(std::string instrument_key, core::TimeSeries<core::Bar> bars)
    : instrument_key_(std::move(instrument_key)), bars_(std::move(bars))
{
    if (bars_.empty()) {
        throw core::DataException(fmt::format("Bar series for '{}' is empty.", instrument_key_));
    }

    for (std::size_t i = 0; i < bars_.size(); ++i) {
        validateBar(bars_[i], i);
        if (i > 0 && !(bars_[i - 1].date < bars_[i].date)) {
            throw core::DataException(fmt::format(
                "Bar series for '{}' is not strictly chronological: bar {} ({}) does not follow bar {} ({}).",
                instrument_key_, i, core::utils::dateToString(bars_[i].date),
                i - 1, core::utils::dateToString(bars_[i - 1].date)));
        }
    }

    core::logging::getLogger()->debug("BarSeries '{}' created with {} bars ({} to {}).",
                                      instrument_key_, bars_.size(),
                                      core::utils::dateToString(bars_.front().date),
                                      core::utils::dateToString(bars_.back().date));
}

void BarSeries::requireAtLeast(std::size_t min_bars, const std::string& reason) const {
    if (bars_.size() < min_bars) {
        throw core::DataException(fmt::format(
            "Bar series for '{}' has {} bars but at least {} are required ({}).",
            instrument_key_, bars_.size(), min_bars, reason));
    }
}

} // namespace data
