#pragma once

#include <string>
#include <vector>
#include <cstddef>

#include "datatypes.hpp"

namespace data {

// Validated, chronologically ordered daily bars for one instrument.
// Immutable once constructed; may be shared read-only between concurrent runs.
class BarSeries {
public:
    // Throws core::DataException if bars is empty, not strictly increasing in date,
    // or contains a bar with non-positive prices, high < low or negative volume.
    BarSeries(std::string instrument_key, core::TimeSeries<core::Bar> bars);

    const std::string& instrumentKey() const { return instrument_key_; }
    const core::TimeSeries<core::Bar>& bars() const { return bars_; }
    std::size_t size() const { return bars_.size(); }

    const core::Bar& at(std::size_t i) const { return bars_.at(i); }
    const core::Bar& operator[](std::size_t i) const { return bars_[i]; }
    const core::Bar& front() const { return bars_.front(); }
    const core::Bar& back() const { return bars_.back(); }

    core::TimeSeries<core::Bar>::const_iterator begin() const { return bars_.begin(); }
    core::TimeSeries<core::Bar>::const_iterator end() const { return bars_.end(); }

    // Throws core::DataException unless the series holds at least min_bars bars
    void requireAtLeast(std::size_t min_bars, const std::string& reason) const;

private:
    std::string instrument_key_;
    core::TimeSeries<core::Bar> bars_;
};

} // namespace data
