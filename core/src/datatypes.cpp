#include "datatypes.hpp"

namespace core {

    const char* toString(SignalAction action) {
        switch (action) {
            case SignalAction::None:      return "None";
            case SignalAction::EnterLong: return "EnterLong";
            case SignalAction::ExitLong:  return "ExitLong";
        }
        return "Unknown";
    }

    const char* toString(PositionState state) {
        switch (state) {
            case PositionState::Flat: return "Flat";
            case PositionState::Long: return "Long";
        }
        return "Unknown";
    }

    // These strings are part of the trade log contract
    const char* toString(ExitReason reason) {
        switch (reason) {
            case ExitReason::None:         return "None";
            case ExitReason::StopLoss:     return "Stop Loss";
            case ExitReason::TakeProfit:   return "Take Profit";
            case ExitReason::BreakoutExit: return "Breakout Exit";
            case ExitReason::EndOfPeriod:  return "End of Period";
        }
        return "Unknown";
    }

} // namespace core
