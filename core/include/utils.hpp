#pragma once

#include "datatypes.hpp"
#include <string>
#include <chrono>

namespace core {
namespace utils {

    // "YYYY-MM-DD" -> UTC midnight. Throws std::runtime_error on malformed input.
    Timestamp stringToDate(const std::string& date_str);

    // UTC midnight -> "YYYY-MM-DD"
    std::string dateToString(const Timestamp& date);

    // Truncate any time point to its UTC midnight
    Timestamp toDate(const Timestamp& ts);

    Timestamp addDays(const Timestamp& date, int days);

    // Whole days between two dates (b - a), negative if b precedes a
    long long daysBetween(const Timestamp& a, const Timestamp& b);

    // Seconds since epoch <-> Timestamp, used by HTTP sources
    Timestamp fromUnixSeconds(long long seconds);
    long long toUnixSeconds(const Timestamp& ts);

    // Round to cents, half away from zero, tolerant of binary representation error
    double roundToCents(double value);

    std::string toLower(std::string value);
    std::string trim(const std::string& value);

} // namespace utils
} // namespace core
