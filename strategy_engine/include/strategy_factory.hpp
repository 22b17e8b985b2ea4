#pragma once

#include <memory>
#include <string>
#include <vector>

#include "interfaces.hpp"
#include "config.hpp"

namespace strategy_engine {

    class StrategyFactory {
    public:
        // Builds a strategy from one "strategies" entry of the run config.
        // Throws core::ConfigException for unknown types or invalid parameters.
        static std::unique_ptr<IStrategy> createStrategy(const core::config::StrategyConfig& config);

        static std::vector<std::string> availableTypes();
    };

} // namespace strategy_engine
