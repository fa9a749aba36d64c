#pragma once

#include "indicators.hpp" // Base interface
#include <vector>
#include <string>

namespace indicators {

// N-period maximum of highs or minimum of lows, window ending at (and including) each bar.
class WindowExtremeIndicator : public IIndicator {
public:
    enum class Kind {
        HighestHigh, // TA_MAX over bar highs
        LowestLow    // TA_MIN over bar lows
    };

    WindowExtremeIndicator(Kind kind, int period);

    virtual ~WindowExtremeIndicator() override = default;

    std::string getName() const override;
    int getLookback() const override;
    void calculate(const core::TimeSeries<core::Bar>& input) override;
    const core::TimeSeries<double>& getResult() const override;

    Kind getKind() const { return kind_; }
    int getPeriod() const { return period_; }

private:
    const Kind kind_;
    const int period_;
    int lookback_;
    std::string name_;
    core::TimeSeries<double> results_;
};

} // namespace indicators
