#include "market_prices.hpp"

namespace backtester {

void StoreBackedPrices::addStore(const data::PriceHistoryStore& store) {
    stores_[store.asset()] = &store;
}

const data::PriceHistoryStore* StoreBackedPrices::storeFor(const std::string& asset) const {
    auto it = stores_.find(asset);
    return it != stores_.end() ? it->second : nullptr;
}

std::optional<double> StoreBackedPrices::closeOn(const std::string& asset, core::Timestamp date) const {
    const auto* store = storeFor(asset);
    return store ? store->closeOn(date) : std::nullopt;
}

std::optional<double> StoreBackedPrices::openOn(const std::string& asset, core::Timestamp date) const {
    const auto* store = storeFor(asset);
    return store ? store->openOn(date) : std::nullopt;
}

long long StoreBackedPrices::volumeOn(const std::string& asset, core::Timestamp date) const {
    const auto* store = storeFor(asset);
    return store ? store->volumeOn(date) : 0;
}

bool StoreBackedPrices::hasBar(const std::string& asset, core::Timestamp date) const {
    const auto* store = storeFor(asset);
    return store != nullptr && store->priceOn(date).has_value();
}

} // namespace backtester
