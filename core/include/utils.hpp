#pragma once

#include "datatypes.hpp"
#include <string>
#include <chrono>

namespace core {
namespace utils {

    // Convert a Timestamp to its UTC calendar date, "YYYY-MM-DD"
    std::string dateToString(const Timestamp& ts);

    // Parse "YYYY-MM-DD" into midnight UTC of that date. Throws std::invalid_argument.
    Timestamp stringToDate(const std::string& date_string);

    // Midnight UTC of the given calendar date. Throws std::invalid_argument.
    Timestamp makeDate(int year, unsigned month, unsigned day);

} // namespace utils
} // namespace core
