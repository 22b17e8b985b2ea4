#pragma once

#include <stdexcept>
#include <string>

namespace core {

    class SimulatorException : public std::runtime_error {
    public:
        explicit SimulatorException(const std::string& message)
            : std::runtime_error(message) {}

        explicit SimulatorException(const char* message)
            : std::runtime_error(message) {}
    };

    // Specific exception types
    class ConfigException : public SimulatorException {
    public: using SimulatorException::SimulatorException; };

    // Raised when a price source cannot deliver data and no usable cache exists
    class DataLoadException : public SimulatorException {
    public: using SimulatorException::SimulatorException; };

    // Persisted cache exists but cannot be read back; callers re-fetch
    class CacheCorruptionException : public SimulatorException {
    public: using SimulatorException::SimulatorException; };

    class ApiRequestException : public SimulatorException {
    public: using SimulatorException::SimulatorException; };

    class IndicatorCalculationException : public SimulatorException {
    public: using SimulatorException::SimulatorException; };

    class StrategyException : public SimulatorException {
    public: using SimulatorException::SimulatorException; };

    class BacktestException : public SimulatorException {
    public: using SimulatorException::SimulatorException; };

} // namespace core
