#include "cache_store.hpp"
#include "logging.hpp"
#include "exceptions.hpp"
#include "utils.hpp"

#include <stdexcept>
#include <spdlog/fmt/fmt.h>

namespace data
{

    namespace
    {
        void bindKey(sqlite3_stmt *stmt, const CacheKey &key)
        {
            // Index is 1-based
            sqlite3_bind_text(stmt, 1, key.asset.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(stmt, 2, key.source.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(stmt, 3, key.interval.c_str(), -1, SQLITE_TRANSIENT);
        }

        void bindOptionalDouble(sqlite3_stmt *stmt, int index, const std::optional<double> &value)
        {
            if (value)
                sqlite3_bind_double(stmt, index, *value);
            else
                sqlite3_bind_null(stmt, index);
        }

        bool isNumericColumn(sqlite3_stmt *stmt, int column)
        {
            int type = sqlite3_column_type(stmt, column);
            return type == SQLITE_FLOAT || type == SQLITE_INTEGER;
        }
    } // namespace

    CacheStore::CacheStore(const std::string &db_path)
        : database_path_(db_path), db_(nullptr), connected_(false)
    {
        core::logging::getLogger()->debug("CacheStore (SQLite) created for path: {}", db_path);
    }

    CacheStore::~CacheStore()
    {
        disconnect();
    }

    bool CacheStore::connect()
    {
        if (connected_)
        {
            core::logging::getLogger()->warn("Already connected to cache database {}.", database_path_);
            return true;
        }

        core::logging::getLogger()->info("Opening price cache database: {}", database_path_);

        int rc = sqlite3_open_v2(database_path_.c_str(), &db_,
                                 SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_NOMUTEX,
                                 nullptr);

        if (rc != SQLITE_OK)
        {
            core::logging::getLogger()->error("Cannot open cache database '{}': {}", database_path_, sqlite3_errmsg(db_));
            sqlite3_close(db_); // Close handle even if open failed (as per docs)
            db_ = nullptr;
            return false;
        }

        connected_ = true;
        return true;
    }

    void CacheStore::disconnect()
    {
        if (!connected_)
            return;

        core::logging::getLogger()->debug("Closing price cache database: {}", database_path_);
        int rc = sqlite3_close(db_);
        if (rc != SQLITE_OK)
        {
            // Usually unfinalized statements
            core::logging::getLogger()->error("Error closing cache database: {}", sqlite3_errmsg(db_));
        }
        db_ = nullptr;
        connected_ = false;
    }

    bool CacheStore::isConnected() const
    {
        return connected_ && (db_ != nullptr);
    }

    bool CacheStore::executeSQL(const std::string &sql)
    {
        if (!isConnected())
        {
            core::logging::getLogger()->error("Cannot execute SQL: cache database not connected.");
            return false;
        }

        core::logging::getLogger()->trace("Executing SQL (SQLite): {}", sql);

        char *error_msg = nullptr;
        int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &error_msg);

        if (rc != SQLITE_OK)
        {
            core::logging::getLogger()->error("SQL error: {}", error_msg ? error_msg : sqlite3_errmsg(db_));
            sqlite3_free(error_msg);
            return false;
        }
        return true;
    }

    bool CacheStore::initializeSchema()
    {
        if (!isConnected())
        {
            core::logging::getLogger()->error("Cannot initialize cache schema: not connected.");
            return false;
        }

        const std::string create_entries_sql = R"(
        CREATE TABLE IF NOT EXISTS cache_payloads (
            fetch_id INTEGER PRIMARY KEY AUTOINCREMENT,
            asset TEXT NOT NULL,
            source TEXT NOT NULL,
            interval TEXT NOT NULL,
            raw_payload TEXT,          -- Provider payload as fetched, one row per fetch
            fetched_at TEXT
        );
    )";

        const std::string create_bars_sql = R"(
        CREATE TABLE IF NOT EXISTS price_bars (
            asset TEXT NOT NULL,
            source TEXT NOT NULL,
            interval TEXT NOT NULL,
            date TEXT NOT NULL,        -- YYYY-MM-DD
            open REAL,
            high REAL,
            low REAL,
            close REAL,
            volume INTEGER,
            dividend REAL,
            pe_ttm REAL,
            PRIMARY KEY (asset, source, interval, date)
        );
    )";

        bool success = true;
        success &= executeSQL(create_entries_sql);
        success &= executeSQL(create_bars_sql);

        if (!success)
        {
            core::logging::getLogger()->error("Cache schema initialization failed for one or more statements.");
        }
        return success;
    }

    std::optional<core::TimeSeries<core::PriceBar>> CacheStore::loadBars(const CacheKey &key)
    {
        auto logger = core::logging::getLogger();
        if (!isConnected())
        {
            logger->debug("Cache not connected, treating {} as uncached.", key.asset);
            return std::nullopt;
        }

        const char *sql = R"(
            SELECT date, open, high, low, close, volume, dividend, pe_ttm
            FROM price_bars
            WHERE asset = ? AND source = ? AND interval = ?
            ORDER BY date ASC;
        )";

        sqlite3_stmt *stmt = nullptr;
        int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
        if (rc != SQLITE_OK)
        {
            std::string message = sqlite3_errmsg(db_);
            sqlite3_finalize(stmt);
            throw core::CacheCorruptionException(
                fmt::format("Cannot read cache for {} ({}/{}): {}", key.asset, key.source, key.interval, message));
        }
        bindKey(stmt, key);

        core::TimeSeries<core::PriceBar> bars;
        std::string corruption;
        while ((rc = sqlite3_step(stmt)) == SQLITE_ROW)
        {
            const unsigned char *date_text = sqlite3_column_text(stmt, 0);
            if (!date_text || !isNumericColumn(stmt, 4))
            {
                corruption = "row without date or close price";
                break;
            }

            core::PriceBar bar;
            try
            {
                bar.date = core::utils::stringToDate(reinterpret_cast<const char *>(date_text));
            }
            catch (const std::runtime_error &e)
            {
                corruption = e.what();
                break;
            }
            bar.open = sqlite3_column_double(stmt, 1);
            bar.high = sqlite3_column_double(stmt, 2);
            bar.low = sqlite3_column_double(stmt, 3);
            bar.close = sqlite3_column_double(stmt, 4);
            bar.volume = sqlite3_column_int64(stmt, 5);
            if (isNumericColumn(stmt, 6))
                bar.dividend = sqlite3_column_double(stmt, 6);
            if (isNumericColumn(stmt, 7))
                bar.pe_ttm = sqlite3_column_double(stmt, 7);
            bars.push_back(bar);
        }

        if (corruption.empty() && rc != SQLITE_DONE)
        {
            corruption = sqlite3_errmsg(db_);
        }
        sqlite3_finalize(stmt);

        if (!corruption.empty())
        {
            throw core::CacheCorruptionException(
                fmt::format("Corrupt cache rows for {} ({}/{}): {}", key.asset, key.source, key.interval, corruption));
        }

        if (bars.empty())
        {
            return std::nullopt;
        }
        logger->debug("Loaded {} cached bars for {} ({}/{}).", bars.size(), key.asset, key.source, key.interval);
        return bars;
    }

    std::vector<std::string> CacheStore::loadRawPayloads(const CacheKey &key)
    {
        std::vector<std::string> payloads;
        if (!isConnected())
            return payloads;

        const char *sql = R"(
            SELECT raw_payload FROM cache_payloads
            WHERE asset = ? AND source = ? AND interval = ?
            ORDER BY fetch_id ASC;
        )";
        sqlite3_stmt *stmt = nullptr;
        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK)
        {
            std::string message = sqlite3_errmsg(db_);
            sqlite3_finalize(stmt);
            throw core::CacheCorruptionException("Cannot read cached payload: " + message);
        }
        bindKey(stmt, key);

        int rc;
        while ((rc = sqlite3_step(stmt)) == SQLITE_ROW)
        {
            const unsigned char *text = sqlite3_column_text(stmt, 0);
            if (text)
            {
                payloads.emplace_back(reinterpret_cast<const char *>(text),
                                      static_cast<size_t>(sqlite3_column_bytes(stmt, 0)));
            }
        }
        if (rc != SQLITE_DONE)
        {
            std::string message = sqlite3_errmsg(db_);
            sqlite3_finalize(stmt);
            throw core::CacheCorruptionException("Cannot read cached payloads: " + message);
        }
        sqlite3_finalize(stmt);
        return payloads;
    }

    bool CacheStore::saveBars(const CacheKey &key,
                              const core::TimeSeries<core::PriceBar> &bars,
                              const std::optional<std::string> &raw_payload)
    {
        auto logger = core::logging::getLogger();
        if (!isConnected())
        {
            logger->error("Cannot save bars: cache database not connected.");
            return false;
        }

        const char *bar_sql = R"(
INSERT OR REPLACE INTO price_bars
(asset, source, interval, date, open, high, low, close, volume, dividend, pe_ttm)
VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?);
)";
        const char *entry_sql = R"(
INSERT INTO cache_payloads (asset, source, interval, raw_payload, fetched_at)
VALUES (?, ?, ?, ?, ?);
)";

        if (!executeSQL("BEGIN TRANSACTION;"))
        {
            logger->error("Failed to begin transaction for saving bars.");
            return false;
        }

        bool success = true;
        sqlite3_stmt *stmt = nullptr;
        int rc = sqlite3_prepare_v2(db_, bar_sql, -1, &stmt, nullptr);
        if (rc != SQLITE_OK)
        {
            logger->error("Failed to prepare bar INSERT statement [{}]: {}", rc, sqlite3_errmsg(db_));
            success = false;
        }

        for (size_t i = 0; success && i < bars.size(); ++i)
        {
            const auto &bar = bars[i];
            bindKey(stmt, key);
            std::string date_str = core::utils::dateToString(bar.date);
            sqlite3_bind_text(stmt, 4, date_str.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_double(stmt, 5, bar.open);
            sqlite3_bind_double(stmt, 6, bar.high);
            sqlite3_bind_double(stmt, 7, bar.low);
            sqlite3_bind_double(stmt, 8, bar.close);
            sqlite3_bind_int64(stmt, 9, bar.volume);
            bindOptionalDouble(stmt, 10, bar.dividend);
            bindOptionalDouble(stmt, 11, bar.pe_ttm);

            rc = sqlite3_step(stmt);
            if (rc != SQLITE_DONE)
            {
                logger->error("Failed to insert cached bar [{}]: {}", rc, sqlite3_errmsg(db_));
                success = false;
                break;
            }
            sqlite3_reset(stmt);
        }
        sqlite3_finalize(stmt);

        if (success && raw_payload)
        {
            stmt = nullptr;
            rc = sqlite3_prepare_v2(db_, entry_sql, -1, &stmt, nullptr);
            if (rc == SQLITE_OK)
            {
                bindKey(stmt, key);
                std::string now_str = core::utils::dateToString(std::chrono::system_clock::now());
                sqlite3_bind_text(stmt, 4, raw_payload->c_str(), static_cast<int>(raw_payload->size()), SQLITE_TRANSIENT);
                sqlite3_bind_text(stmt, 5, now_str.c_str(), -1, SQLITE_TRANSIENT);
                rc = sqlite3_step(stmt);
            }
            if (rc != SQLITE_DONE)
            {
                logger->error("Failed to store raw payload for {} [{}]: {}", key.asset, rc, sqlite3_errmsg(db_));
                success = false;
            }
            sqlite3_finalize(stmt);
        }

        if (!executeSQL(success ? "COMMIT;" : "ROLLBACK;"))
        {
            logger->error("Failed to {} transaction for saving bars.", success ? "COMMIT" : "ROLLBACK");
            if (success && !executeSQL("ROLLBACK;"))
                logger->error("ROLLBACK after failed COMMIT also failed for {}.", key.asset);
            return false;
        }

        if (success)
        {
            logger->info("Cached {} bars for {} ({}/{}).", bars.size(), key.asset, key.source, key.interval);
        }
        return success;
    }

    bool CacheStore::clear(const CacheKey &key)
    {
        if (!isConnected())
            return false;

        bool success = true;
        for (const char *sql : {"DELETE FROM price_bars WHERE asset = ? AND source = ? AND interval = ?;",
                                "DELETE FROM cache_payloads WHERE asset = ? AND source = ? AND interval = ?;"})
        {
            sqlite3_stmt *stmt = nullptr;
            if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK)
            {
                core::logging::getLogger()->error("Failed to clear cache for {}: {}", key.asset, sqlite3_errmsg(db_));
                sqlite3_finalize(stmt);
                success = false;
                continue;
            }
            bindKey(stmt, key);
            if (sqlite3_step(stmt) != SQLITE_DONE)
            {
                success = false;
            }
            sqlite3_finalize(stmt);
        }
        return success;
    }

} // namespace data
