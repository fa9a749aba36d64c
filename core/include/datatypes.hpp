#pragma once // Use #pragma once for include guards (common practice)

#include <string>
#include <vector>
#include <chrono> // For timestamps

namespace core {

    // Daily bars are keyed by calendar date; a Timestamp holds midnight UTC of that date
    using Timestamp = std::chrono::system_clock::time_point;


    struct Bar {
        Timestamp date;
        double open = 0.0;
        double high = 0.0;
        double low = 0.0;
        double close = 0.0;
        long long volume = 0; // Use long long for potentially large volumes

        bool operator<(const Bar& other) const {
            return date < other.date;
        }
    };

    enum class SignalAction {
        None,
        EnterLong,
        ExitLong
    };

    // Represents the current state of a strategy's position
    enum class PositionState {
        Flat,  // No position
        Long   // Currently holding a long position
    };

    enum class ExitReason {
        None,
        StopLoss,
        TakeProfit,
        BreakoutExit,
        EndOfPeriod
    };

    // Human readable names, used in logs and reports
    const char* toString(SignalAction action);
    const char* toString(PositionState state);
    const char* toString(ExitReason reason);

    struct Position {
        PositionState state = PositionState::Flat;
        double entry_price = 0.0;
        Timestamp entry_date;
        long long size = 0;           // Shares held while Long
        double stop_price = 0.0;      // entry_price * (1 - stop_loss)
        double target_price = 0.0;    // entry_price * (1 + take_profit)
        double entry_commission = 0.0;

        bool isLong() const { return state == PositionState::Long; }
    };


    // One completed round trip
    struct Trade {
        Timestamp entry_date;
        double entry_price = 0.0;
        Timestamp exit_date;
        double exit_price = 0.0;
        ExitReason exit_reason = ExitReason::None;
        double pnl_pct = 0.0;         // Price return minus round-trip commission rate
        long long size = 0;
        double commission = 0.0;      // Total commission (entry + exit)
        double pnl = 0.0;             // Cash profit or loss net of commission
    };

    struct EquityPoint {
        Timestamp date;
        double cash = 0.0;
        double position_value = 0.0;
        double portfolio_value = 0.0; // cash + position_value
    };

    template<typename T>
    using TimeSeries = std::vector<T>;

    using TradeLog = std::vector<Trade>;
    using EquityCurve = std::vector<EquityPoint>;

} // namespace core
