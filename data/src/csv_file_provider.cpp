#include "csv_file_provider.hpp"
#include "logging.hpp"
#include "exceptions.hpp"
#include "utils.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <map>
#include <vector>
#include <optional>
#include <initializer_list>
#include <cmath>
#include <spdlog/fmt/fmt.h>

namespace data {

namespace {

    std::vector<std::string> splitCsvLine(const std::string& line) {
        std::vector<std::string> fields;
        std::stringstream ss(line);
        std::string field;
        while (std::getline(ss, field, ',')) {
            fields.push_back(core::utils::trim(field));
        }
        if (!line.empty() && line.back() == ',') {
            fields.emplace_back(); // Trailing empty column
        }
        return fields;
    }

    int findColumn(const std::vector<std::string>& header, std::initializer_list<const char*> names) {
        for (const char* name : names) {
            for (size_t i = 0; i < header.size(); ++i) {
                if (header[i] == name) return static_cast<int>(i);
            }
        }
        return -1;
    }

    std::optional<double> parseNumber(const std::vector<std::string>& fields, int column) {
        if (column < 0 || static_cast<size_t>(column) >= fields.size() || fields[column].empty()) {
            return std::nullopt;
        }
        try {
            double value = std::stod(fields[column]);
            if (!std::isfinite(value)) return std::nullopt;
            return value;
        } catch (const std::exception&) {
            return std::nullopt;
        }
    }

} // namespace

CsvFileProvider::CsvFileProvider(std::string directory)
    : directory_(std::move(directory))
{
    core::logging::getLogger()->debug("CsvFileProvider created for directory '{}'.", directory_);
}

std::string CsvFileProvider::resolvePath(const std::string& asset) const {
    if (std::filesystem::is_regular_file(asset)) {
        return asset;
    }
    return (std::filesystem::path(directory_) / (asset + ".csv")).string();
}

std::string CsvFileProvider::fetchRaw(const std::string& asset,
                                      const std::string& interval,
                                      core::Timestamp /*from*/,
                                      core::Timestamp /*to*/)
{
    std::string path = resolvePath(asset);
    core::logging::getLogger()->debug("Reading local CSV for {} ({}): {}", asset, interval, path);

    std::ifstream ifs(path, std::ios::binary);
    if (!ifs.is_open()) {
        throw core::DataLoadException(fmt::format("Local CSV not found for {}: {}", asset, path));
    }
    std::ostringstream contents;
    contents << ifs.rdbuf();
    return contents.str();
}

core::TimeSeries<core::PriceBar> CsvFileProvider::normalize(const std::string& raw_payload) const {
    auto logger = core::logging::getLogger();
    std::istringstream input(raw_payload);
    std::string line;

    if (!std::getline(input, line)) {
        throw core::DataLoadException("CSV payload is empty.");
    }
    std::vector<std::string> header = splitCsvLine(line);
    for (auto& column : header) {
        column = core::utils::toLower(column);
    }

    int date_col = findColumn(header, {"date", "time", "trade_date", "datetime"});
    if (date_col < 0) {
        date_col = 0; // Assume the index was written as the first column
    }
    int open_col = findColumn(header, {"open"});
    int high_col = findColumn(header, {"high"});
    int low_col = findColumn(header, {"low"});
    int close_col = findColumn(header, {"close", "adj close", "adj_close"});
    int volume_col = findColumn(header, {"volume"});
    int dividend_col = findColumn(header, {"dividends", "dividend"});
    int pe_col = findColumn(header, {"pe_ttm", "pe"});

    if (close_col < 0) {
        throw core::DataLoadException("CSV payload has no close column.");
    }

    // Keyed by date so later rows replace earlier duplicates
    std::map<core::Timestamp, core::PriceBar> by_date;
    size_t skipped = 0;
    while (std::getline(input, line)) {
        if (core::utils::trim(line).empty()) continue;
        std::vector<std::string> fields = splitCsvLine(line);

        auto close = parseNumber(fields, close_col);
        if (!close || static_cast<size_t>(date_col) >= fields.size()) {
            ++skipped;
            continue;
        }

        core::PriceBar bar;
        try {
            bar.date = core::utils::stringToDate(fields[date_col]);
        } catch (const std::runtime_error&) {
            ++skipped;
            continue;
        }
        bar.close = *close;
        bar.open = parseNumber(fields, open_col).value_or(bar.close);
        bar.high = parseNumber(fields, high_col).value_or(bar.close);
        bar.low = parseNumber(fields, low_col).value_or(bar.close);
        bar.volume = static_cast<long long>(parseNumber(fields, volume_col).value_or(0.0));
        auto dividend = parseNumber(fields, dividend_col);
        if (dividend && *dividend != 0.0) {
            bar.dividend = dividend;
        }
        bar.pe_ttm = parseNumber(fields, pe_col);
        by_date[bar.date] = bar;
    }

    if (skipped > 0) {
        logger->warn("Skipped {} CSV rows without a parsable date or close price.", skipped);
    }

    core::TimeSeries<core::PriceBar> bars;
    bars.reserve(by_date.size());
    for (const auto& entry : by_date) {
        bars.push_back(entry.second);
    }
    logger->debug("Normalized {} bars from CSV payload.", bars.size());
    return bars;
}

} // namespace data
