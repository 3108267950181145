#pragma once

#include <time.h>
#include <cctype>
#include <chrono>
#include <string>
#include "stock_advisor/core/types.hpp"

namespace stock_advisor {
namespace core {

/**
 * @brief Thread-safe wrapper for localtime
 * @param time Pointer to time_t value
 * @param result Pointer to tm struct where result will be stored
 * @return Pointer to the result tm struct on success, nullptr on failure
 */
inline std::tm* safe_localtime(const std::time_t* time, std::tm* result) {
#ifdef _WIN32
    if (localtime_s(result, time) != 0) {
        return nullptr;
    }
    return result;
#else
    return localtime_r(time, result);
#endif
}

/**
 * @brief Thread-safe wrapper for gmtime
 * @param time Pointer to time_t value
 * @param result Pointer to tm struct where result will be stored
 * @return Pointer to the result tm struct on success, nullptr on failure
 */
inline std::tm* safe_gmtime(const std::time_t* time, std::tm* result) {
#ifdef _WIN32
    if (gmtime_s(result, time) != 0) {
        return nullptr;
    }
    return result;
#else
    return gmtime_r(time, result);
#endif
}

/**
 * @brief Format a timestamp as a UTC calendar date
 * @param ts Timestamp to format
 * @return Date string in YYYY-MM-DD form
 */
inline std::string format_date(const Timestamp& ts) {
    auto tt = std::chrono::system_clock::to_time_t(ts);
    std::tm result;
    if (safe_gmtime(&tt, &result) == nullptr) {
        return "";
    }

    char buffer[16];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%d", &result);
    return std::string(buffer);
}

/**
 * @brief Days since 1970-01-01 for a proleptic Gregorian date
 */
inline long long days_from_civil(int year, unsigned month, unsigned day) {
    year -= month <= 2 ? 1 : 0;
    const long long era = (year >= 0 ? year : year - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(year - era * 400);
    const unsigned doy = (153 * (month + (month > 2 ? -3 : 9)) + 2) / 5 + day - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<long long>(doe) - 719468;
}

inline bool is_leap_year(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

// Month length in the proleptic Gregorian calendar, month in [1, 12]
inline unsigned days_in_month(int year, unsigned month) {
    static const unsigned days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2 && is_leap_year(year)) {
        return 29;
    }
    return days[month - 1];
}

/**
 * @brief Parse a YYYY-MM-DD prefix into a UTC midnight timestamp
 * @param text Date string; anything after the first ten characters is ignored
 * @param out Parsed timestamp
 * @return false if the text is not a valid date
 */
inline bool parse_date(const std::string& text, Timestamp& out) {
    if (text.size() < 10 || text[4] != '-' || text[7] != '-') {
        return false;
    }
    for (size_t i : {0, 1, 2, 3, 5, 6, 8, 9}) {
        if (!std::isdigit(static_cast<unsigned char>(text[i]))) {
            return false;
        }
    }

    auto field = [&text](size_t pos, size_t len) {
        int value = 0;
        for (size_t i = pos; i < pos + len; ++i) {
            value = value * 10 + (text[i] - '0');
        }
        return value;
    };

    const int year = field(0, 4);
    const unsigned month = static_cast<unsigned>(field(5, 2));
    const unsigned day = static_cast<unsigned>(field(8, 2));
    if (month < 1 || month > 12 || day < 1 || day > days_in_month(year, month)) {
        return false;
    }

    out = Timestamp(std::chrono::hours(24 * days_from_civil(year, month, day)));
    return true;
}

}  // namespace core
}  // namespace stock_advisor
