#pragma once

#include "datatypes.hpp" // Needs Bar, TimeSeries
#include <string>

namespace indicators {

class IIndicator {
public:
    virtual ~IIndicator() = default;

    // Get the name of the indicator (e.g., "HighestHigh(20)")
    virtual std::string getName() const = 0;

    // Get the lookback period required by the indicator calculation
    // This determines how many initial input data points are consumed
    // before the first valid output can be generated.
    virtual int getLookback() const = 0;

    // Calculate the indicator based on input bar data
    // It should store the result internally.
    virtual void calculate(const core::TimeSeries<core::Bar>& input) = 0;

    // Get the calculated results.
    // result[j] belongs to input bar j + getLookback(); the caller aligns by lookback.
    virtual const core::TimeSeries<double>& getResult() const = 0;
};

} // namespace indicators
