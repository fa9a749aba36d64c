#pragma once

#include <cstddef>
#include <optional>
#include <string>

#include "bar_series.hpp"
#include "window_extreme_indicator.hpp"

namespace indicators {

    // Highest high / lowest low over the lookback window preceding a bar
    struct Extremes {
        double highest_high = 0.0;
        double lowest_low = 0.0;
    };

    // Half-open range of bar indices [begin, end) a window covers
    struct Window {
        std::size_t begin = 0;
        std::size_t end = 0;
    };

    // Rolling N-period extremes over a BarSeries, computed once at construction.
    // The extremes available at bar i cover bars [i-N, i-1] only, so a bar never
    // sees its own high/low. Unavailable for i < N.
    // Read-only after construction; safe to share between concurrent runs.
    class RollingExtremes {
    public:
        // Throws core::ConfigException if lookback < 1.
        RollingExtremes(const data::BarSeries& series, int lookback);

        int lookback() const { return lookback_; }
        std::size_t size() const { return size_; }

        bool isAvailable(std::size_t index) const;

        // std::nullopt while index < lookback or past the end of the series
        std::optional<Extremes> at(std::size_t index) const;

        // Bars consulted for index; throws std::out_of_range if !isAvailable(index)
        Window windowFor(std::size_t index) const;

    private:
        int lookback_;
        std::size_t size_;
        WindowExtremeIndicator highest_high_;
        WindowExtremeIndicator lowest_low_;
    };

} // namespace indicators
