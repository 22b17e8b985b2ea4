#pragma once

#include <string>
#include <vector>
#include <optional>

#include <sqlite3.h>

#include "datatypes.hpp"

namespace data {

    // One cache unit per (asset, data source, sampling interval)
    struct CacheKey {
        std::string asset;
        std::string source;
        std::string interval;
    };

    // SQLite-backed persistence of raw provider payloads and normalized bars.
    // Owned by the caller and handed to every PriceHistoryStore of a run.
    class CacheStore {
    public:
        explicit CacheStore(const std::string& db_path);
        ~CacheStore();

        CacheStore(const CacheStore&) = delete;
        CacheStore& operator=(const CacheStore&) = delete;

        bool connect();
        void disconnect();
        bool isConnected() const;

        bool initializeSchema();
        bool executeSQL(const std::string& sql);

        // nullopt when nothing is cached for the key.
        // Throws core::CacheCorruptionException when stored rows cannot be read back.
        std::optional<core::TimeSeries<core::PriceBar>> loadBars(const CacheKey& key);

        // Every stored fetch payload of the key, oldest first
        std::vector<std::string> loadRawPayloads(const CacheKey& key);

        // Upserts bars by date (new rows replace old ones) and appends the fetch's
        // raw payload when one is given
        bool saveBars(const CacheKey& key,
                      const core::TimeSeries<core::PriceBar>& bars,
                      const std::optional<std::string>& raw_payload);

        // Drops every row of the key, used before re-fetching a corrupt unit
        bool clear(const CacheKey& key);

    private:
        std::string database_path_;
        sqlite3* db_ = nullptr;
        bool connected_ = false;
    };

} // namespace data
