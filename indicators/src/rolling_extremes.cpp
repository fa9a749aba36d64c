#include "rolling_extremes.hpp"
#include "exceptions.hpp"
#include "logging.hpp"

#include <stdexcept>

namespace indicators {

namespace {

    int checkedLookback(int lookback) {
        if (lookback < 1) {
            throw core::ConfigException(fmt::format("lookback_period must be >= 1, got {}.", lookback));
        }
        return lookback;
    }

} // end anonymous namespace

RollingExtremes::RollingExtremes(const data::BarSeries& series, int lookback)
    : lookback_(checkedLookback(lookback)),
      size_(series.size()),
      highest_high_(WindowExtremeIndicator::Kind::HighestHigh, lookback),
      lowest_low_(WindowExtremeIndicator::Kind::LowestLow, lookback)
{
    highest_high_.calculate(series.bars());
    lowest_low_.calculate(series.bars());

    core::logging::getLogger()->debug("RollingExtremes({}) for '{}': {} of {} bars have extremes available.",
                                      lookback_, series.instrumentKey(),
                                      size_ > static_cast<std::size_t>(lookback_) ? size_ - lookback_ : 0,
                                      size_);
}

bool RollingExtremes::isAvailable(std::size_t index) const {
    return index >= static_cast<std::size_t>(lookback_) && index < size_;
}

std::optional<Extremes> RollingExtremes::at(std::size_t index) const {
    if (!isAvailable(index)) {
        return std::nullopt;
    }

    // The window ends at the previous bar; indicator result j belongs to bar j + lookback
    std::size_t high_index = (index - 1) - static_cast<std::size_t>(highest_high_.getLookback());
    std::size_t low_index = (index - 1) - static_cast<std::size_t>(lowest_low_.getLookback());

    const auto& highs = highest_high_.getResult();
    const auto& lows = lowest_low_.getResult();
    if (high_index >= highs.size() || low_index >= lows.size()) {
        return std::nullopt;
    }

    Extremes extremes;
    extremes.highest_high = highs[high_index];
    extremes.lowest_low = lows[low_index];
    return extremes;
}

Window RollingExtremes::windowFor(std::size_t index) const {
    if (!isAvailable(index)) {
        throw std::out_of_range(fmt::format("No extremes window for bar {} (lookback {}, {} bars).",
                                            index, lookback_, size_));
    }
    return Window{index - static_cast<std::size_t>(lookback_), index};
}

} // namespace indicators
