#include "price_provider.hpp"

namespace data {

    std::string intervalLabel(int interval_days) {
        return interval_days >= 7 ? "1wk" : "1d";
    }

} // namespace data
