#include "database_manager.hpp"
#include "logging.hpp"
#include "exceptions.hpp"
#include "utils.hpp" // For dateToString/stringToDate
#include <vector>
#include <stdexcept>

namespace data
{

    DatabaseManager::DatabaseManager(const std::string &db_path)
        : database_path_(db_path), db_(nullptr), connected_(false)
    {
        core::logging::getLogger()->debug("DatabaseManager (SQLite) created for path: {}", db_path);
    }

    DatabaseManager::~DatabaseManager()
    {
        disconnect(); // Ensure disconnection
    }

    bool DatabaseManager::connect()
    {
        if (connected_)
        {
            core::logging::getLogger()->warn("Already connected to SQLite database {}.", database_path_);
            return true;
        }

        core::logging::getLogger()->info("Connecting to SQLite database: {}", database_path_);

        // SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE: Open for reading/writing, create if not exists
        int rc = sqlite3_open_v2(database_path_.c_str(), &db_,
                                 SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_NOMUTEX,
                                 nullptr);

        if (rc != SQLITE_OK)
        {
            core::logging::getLogger()->error("Cannot open SQLite database '{}': {}", database_path_, sqlite3_errmsg(db_));
            sqlite3_close(db_); // Close handle even if open failed (as per docs)
            db_ = nullptr;
            return false;
        }

        connected_ = true;
        core::logging::getLogger()->info("Successfully connected to SQLite database: {}", database_path_);
        return true;
    }

    void DatabaseManager::disconnect()
    {
        if (connected_)
        {
            core::logging::getLogger()->info("Disconnecting from SQLite database: {}", database_path_);
            int rc = sqlite3_close(db_);
            if (rc != SQLITE_OK)
            {
                // This usually happens if prepared statements are not finalized
                core::logging::getLogger()->error("Error disconnecting from SQLite database: {}", sqlite3_errmsg(db_));
            }
            db_ = nullptr;
            connected_ = false;
        }
    }

    bool DatabaseManager::isConnected() const
    {
        return connected_ && (db_ != nullptr);
    }

    bool DatabaseManager::executeSQL(const std::string &sql)
    {
        if (!isConnected())
        {
            core::logging::getLogger()->error("Cannot execute SQL: Not connected to database.");
            return false;
        }

        core::logging::getLogger()->debug("Executing SQL (SQLite): {}", sql);

        char *error_msg = nullptr;
        int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &error_msg);

        if (rc != SQLITE_OK)
        {
            core::logging::getLogger()->error("SQL error: {}", error_msg ? error_msg : "unknown");
            sqlite3_free(error_msg); // Must free error message memory
            return false;
        }

        return true;
    }

    bool DatabaseManager::initializeSchema()
    {
        if (!isConnected())
        {
            core::logging::getLogger()->error("Cannot initialize schema: Not connected to database.");
            return false;
        }
        core::logging::getLogger()->info("Initializing SQLite database schema if needed...");

        const std::string create_bars_sql = R"(
        CREATE TABLE IF NOT EXISTS historical_bars (
            instrument_key TEXT NOT NULL,
            interval TEXT NOT NULL,
            date TEXT NOT NULL, -- YYYY-MM-DD, sorts chronologically as TEXT
            open REAL,
            high REAL,
            low REAL,
            close REAL,
            volume INTEGER,
            PRIMARY KEY (instrument_key, interval, date)
        );
    )";

        const std::string create_bars_index_sql = R"(
        CREATE INDEX IF NOT EXISTS idx_bars_date
        ON historical_bars (instrument_key, interval, date);
     )";

        bool success = true;
        success &= executeSQL(create_bars_sql);
        success &= executeSQL(create_bars_index_sql);

        if (success)
        {
            core::logging::getLogger()->info("SQLite database schema initialization check complete.");
        }
        else
        {
            core::logging::getLogger()->error("SQLite database schema initialization failed for one or more statements.");
        }
        return success;
    }

    core::TimeSeries<core::Bar> DatabaseManager::queryBars(
        const std::string& instrument_key,
        const std::string& interval,
        core::Timestamp start_date,
        core::Timestamp end_date)
    {
        core::TimeSeries<core::Bar> bars;
        auto logger = core::logging::getLogger();
        if (!isConnected()) {
            throw core::DataLoadException("Cannot query bars: Not connected to database.");
        }

        std::string start_str = core::utils::dateToString(start_date);
        std::string end_str = core::utils::dateToString(end_date);

        logger->debug("Querying bars for {} ({}) between '{}' and '{}'",
                       instrument_key, interval, start_str, end_str);

        const char* sql = R"(
            SELECT date, open, high, low, close, volume
            FROM historical_bars
            WHERE instrument_key = ?
              AND interval = ?
              AND date >= ?
              AND date <= ?
            ORDER BY date ASC;
        )";

        sqlite3_stmt *stmt = nullptr;
        int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);

        if (rc != SQLITE_OK) {
            std::string message = fmt::format("Failed to prepare bar query [{}]: {}", rc, sqlite3_errmsg(db_));
            sqlite3_finalize(stmt); // Finalize even if prepare failed
            throw core::DataLoadException(message);
        }

        // Index is 1-based
        sqlite3_bind_text(stmt, 1, instrument_key.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 2, interval.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 3, start_str.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 4, end_str.c_str(), -1, SQLITE_TRANSIENT);

        int row_count = 0;
        while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
            row_count++;
            const unsigned char *date_text = sqlite3_column_text(stmt, 0);
            if (!date_text) {
                 logger->warn("NULL date found in query result (row {}), skipping row.", row_count);
                 continue;
            }

            core::Bar bar;
            try {
                bar.date = core::utils::stringToDate(reinterpret_cast<const char*>(date_text));
            } catch (const std::invalid_argument& e) {
                sqlite3_finalize(stmt);
                throw core::DataLoadException(fmt::format("Malformed date in row {}: {}", row_count, e.what()));
            }
            bar.open = sqlite3_column_double(stmt, 1);
            bar.high = sqlite3_column_double(stmt, 2);
            bar.low = sqlite3_column_double(stmt, 3);
            bar.close = sqlite3_column_double(stmt, 4);
            bar.volume = sqlite3_column_int64(stmt, 5);
            logger->trace("Row {}: {} C={:.2f}", row_count, reinterpret_cast<const char*>(date_text), bar.close);

            bars.push_back(bar);
        }

        if (rc != SQLITE_DONE) {
            std::string message = fmt::format("Error stepping through bar query results [{}]: {}", rc, sqlite3_errmsg(db_));
            sqlite3_finalize(stmt);
            throw core::DataLoadException(message);
        }

        sqlite3_finalize(stmt);
        logger->debug("Finished processing query results. Parsed {} bars.", bars.size());
        return bars;
    }

    bool DatabaseManager::saveBars(const core::TimeSeries<core::Bar> &bars,
                                   const std::string &instrument_key,
                                   const std::string &interval)
    {
        if (!isConnected())
        {
            core::logging::getLogger()->error("Cannot save bars: Not connected to database.");
            return false;
        }
        if (bars.empty())
        {
            core::logging::getLogger()->debug("No bars provided to save for {} ({}).", instrument_key, interval);
            return true; // Nothing to do, report success
        }

        const char *sql = R"(
INSERT OR IGNORE INTO historical_bars
(instrument_key, interval, date, open, high, low, close, volume)
VALUES (?, ?, ?, ?, ?, ?, ?, ?);
)";

        sqlite3_stmt *stmt = nullptr;
        int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
        if (rc != SQLITE_OK)
        {
            core::logging::getLogger()->error("Failed to prepare INSERT statement [{}]: {}", rc, sqlite3_errmsg(db_));
            sqlite3_finalize(stmt);
            return false;
        }

        if (!executeSQL("BEGIN TRANSACTION;"))
        {
            core::logging::getLogger()->error("Failed to begin transaction for saving bars.");
            sqlite3_finalize(stmt);
            return false;
        }

        bool success = true;
        int saved_count = 0;
        for (const auto &bar : bars)
        {
            std::string date_str = core::utils::dateToString(bar.date);

            sqlite3_bind_text(stmt, 1, instrument_key.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(stmt, 2, interval.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(stmt, 3, date_str.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_double(stmt, 4, bar.open);
            sqlite3_bind_double(stmt, 5, bar.high);
            sqlite3_bind_double(stmt, 6, bar.low);
            sqlite3_bind_double(stmt, 7, bar.close);
            sqlite3_bind_int64(stmt, 8, bar.volume);

            rc = sqlite3_step(stmt);
            if (rc != SQLITE_DONE)
            {
                core::logging::getLogger()->error("Failed to execute insert step [{}]: {}", rc, sqlite3_errmsg(db_));
                success = false;
                break;
            }
            if (sqlite3_changes(db_) > 0)
            {
                saved_count++;
            }

            rc = sqlite3_reset(stmt);
            if (rc != SQLITE_OK)
            {
                core::logging::getLogger()->error("Failed to reset prepared statement [{}]: {}", rc, sqlite3_errmsg(db_));
                success = false;
                break;
            }
        }

        // Finalize the statement BEFORE commit/rollback
        sqlite3_finalize(stmt);

        if (success)
        {
            if (!executeSQL("COMMIT;"))
            {
                core::logging::getLogger()->error("Failed to COMMIT transaction for saving bars.");
                if (!executeSQL("ROLLBACK;"))
                {
                    core::logging::getLogger()->error("ROLLBACK after failed COMMIT also failed; database state may be inconsistent.");
                }
                return false;
            }
            core::logging::getLogger()->info("Saved {} new bars (duplicates ignored) for {} ({}).", saved_count, instrument_key, interval);
            return true;
        }

        if (!executeSQL("ROLLBACK;"))
        {
            core::logging::getLogger()->error("Failed to ROLLBACK transaction for saving bars.");
        }
        core::logging::getLogger()->warn("Transaction rolled back due to error during bar save for {} ({}).", instrument_key, interval);
        return false;
    }

} // namespace data
