#pragma once

#include <string>
#include <vector>

#include <sqlite3.h> // Standard C header

#include "datatypes.hpp"

namespace data {

// SQLite-backed store of daily bars, keyed by (instrument_key, interval, date).
class DatabaseManager {
public:
    explicit DatabaseManager(const std::string& db_path);
    ~DatabaseManager();

    // Delete copy constructor and assignment operator
    DatabaseManager(const DatabaseManager&) = delete;
    DatabaseManager& operator=(const DatabaseManager&) = delete;

    bool connect();
    void disconnect();
    bool isConnected() const;

    bool initializeSchema();

    bool executeSQL(const std::string& sql);

    // INSERT OR IGNORE inside one transaction; duplicates are skipped
    bool saveBars(const core::TimeSeries<core::Bar>& bars,
                  const std::string& instrument_key,
                  const std::string& interval);

    // Bars with start_date <= date <= end_date, ascending by date.
    // Throws core::DataLoadException when the query cannot be run.
    core::TimeSeries<core::Bar> queryBars(
        const std::string& instrument_key,
        const std::string& interval,
        core::Timestamp start_date,
        core::Timestamp end_date);

private:
    std::string database_path_;
    sqlite3* db_ = nullptr; // SQLite database connection handle
    bool connected_ = false;
};

} // namespace data
