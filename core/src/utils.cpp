#include "utils.hpp"
#include <iomanip> // For std::put_time, std::get_time
#include <sstream>
#include <string>
#include <stdexcept>
#include <cmath>
#include <algorithm>
#include <cctype>
#include <ctime>

namespace core {
namespace utils {

    Timestamp stringToDate(const std::string& date_str) {
        // Only the leading YYYY-MM-DD is significant; "2024-01-05T00:00:00" or
        // "2024-01-05 00:00:00" from CSV exports are accepted as well
        std::string head = trim(date_str).substr(0, 10);
        std::tm tm = {};
        std::istringstream ss(head);
        ss >> std::get_time(&tm, "%Y-%m-%d");
        if (ss.fail() || head.size() != 10) {
            throw std::runtime_error("Failed to parse date (expected YYYY-MM-DD): " + date_str);
        }

        // timegm interprets struct tm as UTC. Use _mkgmtime on Windows.
        #ifdef _WIN32
            time_t tt = _mkgmtime(&tm);
        #else
            time_t tt = timegm(&tm);
        #endif
        if (tt == (time_t)-1) {
            throw std::runtime_error("Failed to convert parsed date to UTC epoch seconds: " + date_str);
        }
        return std::chrono::system_clock::from_time_t(tt);
    }

    std::string dateToString(const Timestamp& date) {
        auto tt = std::chrono::system_clock::to_time_t(date);
        std::tm time_tm;
        #ifdef _WIN32
            gmtime_s(&time_tm, &tt);
        #else
            gmtime_r(&tt, &time_tm);
        #endif
        std::ostringstream oss;
        oss << std::put_time(&time_tm, "%Y-%m-%d");
        return oss.str();
    }

    Timestamp toDate(const Timestamp& ts) {
        auto secs = std::chrono::duration_cast<std::chrono::seconds>(ts.time_since_epoch()).count();
        long long day_secs = 24LL * 60 * 60;
        long long days = secs / day_secs;
        if (secs < 0 && secs % day_secs != 0) {
            --days; // Floor for dates before the epoch
        }
        return Timestamp(std::chrono::seconds(days * day_secs));
    }

    Timestamp addDays(const Timestamp& date, int days) {
        return date + std::chrono::hours(24LL * days);
    }

    long long daysBetween(const Timestamp& a, const Timestamp& b) {
        return std::chrono::duration_cast<std::chrono::hours>(toDate(b) - toDate(a)).count() / 24;
    }

    Timestamp fromUnixSeconds(long long seconds) {
        return Timestamp(std::chrono::seconds(seconds));
    }

    long long toUnixSeconds(const Timestamp& ts) {
        return std::chrono::duration_cast<std::chrono::seconds>(ts.time_since_epoch()).count();
    }

    double roundToCents(double value) {
        double magnitude = std::floor(std::fabs(value) * 100.0 + 0.5 + 1e-7) / 100.0;
        return value < 0.0 ? -magnitude : magnitude;
    }

    std::string toLower(std::string value) {
        std::transform(value.begin(), value.end(), value.begin(),
            [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
        return value;
    }

    std::string trim(const std::string& value) {
        const char* whitespace = " \t\r\n\"";
        auto begin = value.find_first_not_of(whitespace);
        if (begin == std::string::npos) {
            return "";
        }
        auto end = value.find_last_not_of(whitespace);
        return value.substr(begin, end - begin + 1);
    }

} // namespace utils
} // namespace core
