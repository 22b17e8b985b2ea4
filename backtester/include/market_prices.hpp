#pragma once

#include <string>
#include <map>
#include <optional>

#include "datatypes.hpp"
#include "price_history_store.hpp"

namespace backtester {

    // Point-in-time price lookups used by the execution engine and the
    // conditional order manager. Prices returned are always finite and positive.
    class IMarketPrices {
    public:
        virtual ~IMarketPrices() = default;

        virtual std::optional<double> closeOn(const std::string& asset, core::Timestamp date) const = 0;
        virtual std::optional<double> openOn(const std::string& asset, core::Timestamp date) const = 0;

        // 0 when the bar or the volume column is missing
        virtual long long volumeOn(const std::string& asset, core::Timestamp date) const = 0;

        virtual bool hasBar(const std::string& asset, core::Timestamp date) const = 0;
    };

    // Lookups served by the shared PriceHistoryStores of one data source
    class StoreBackedPrices : public IMarketPrices {
    public:
        void addStore(const data::PriceHistoryStore& store);

        std::optional<double> closeOn(const std::string& asset, core::Timestamp date) const override;
        std::optional<double> openOn(const std::string& asset, core::Timestamp date) const override;
        long long volumeOn(const std::string& asset, core::Timestamp date) const override;
        bool hasBar(const std::string& asset, core::Timestamp date) const override;

        const data::PriceHistoryStore* storeFor(const std::string& asset) const;

    private:
        std::map<std::string, const data::PriceHistoryStore*> stores_; // Not owned
    };

} // namespace backtester
