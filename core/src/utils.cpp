#include "utils.hpp"
#include <iomanip>    // For std::put_time, std::get_time
#include <sstream>    // For string streams
#include <string>
#include <stdexcept>  // For std::invalid_argument
#include <ctime>

namespace core {
namespace utils {

    namespace {

        std::tm toUtcTm(const Timestamp& ts) {
            auto tt = std::chrono::system_clock::to_time_t(ts);
            std::tm time_tm{};
            #ifdef _WIN32
                gmtime_s(&time_tm, &tt);
            #else
                gmtime_r(&tt, &time_tm);
            #endif
            return time_tm;
        }

    } // end anonymous namespace

    Timestamp makeDate(int year, unsigned month, unsigned day) {
        std::tm tm{};
        tm.tm_year = year - 1900;
        tm.tm_mon = static_cast<int>(month) - 1;
        tm.tm_mday = static_cast<int>(day);

        // timegm interprets struct tm as UTC; use _mkgmtime on Windows.
        #ifdef _WIN32
            time_t tt = _mkgmtime(&tm);
        #else
            time_t tt = timegm(&tm);
        #endif
        if (tt == (time_t)-1) {
            throw std::invalid_argument("Failed to convert calendar date to UTC epoch seconds.");
        }

        // timegm normalises out-of-range fields (Feb 30 -> Mar 2); reject those
        std::tm check = toUtcTm(std::chrono::system_clock::from_time_t(tt));
        if (check.tm_year != year - 1900 || check.tm_mon != static_cast<int>(month) - 1 ||
            check.tm_mday != static_cast<int>(day)) {
            std::ostringstream oss;
            oss << "Invalid calendar date: " << year << "-" << month << "-" << day;
            throw std::invalid_argument(oss.str());
        }
        return std::chrono::system_clock::from_time_t(tt);
    }

    Timestamp stringToDate(const std::string& date_string) {
        std::tm tm = {};
        std::istringstream ss(date_string);
        ss >> std::get_time(&tm, "%Y-%m-%d");
        if (ss.fail()) {
            throw std::invalid_argument("Failed to parse date (expected YYYY-MM-DD): " + date_string);
        }
        // Nothing may follow the date
        if (ss.peek() != std::char_traits<char>::eof()) {
            throw std::invalid_argument("Unexpected trailing characters in date: " + date_string);
        }
        return makeDate(tm.tm_year + 1900, static_cast<unsigned>(tm.tm_mon + 1), static_cast<unsigned>(tm.tm_mday));
    }

    std::string dateToString(const Timestamp& ts) {
        std::tm time_tm = toUtcTm(ts);
        std::ostringstream oss;
        oss << std::put_time(&time_tm, "%Y-%m-%d");
        return oss.str();
    }

} // namespace utils
} // namespace core
