// include/renewfolio/core/time_utils.hpp
#pragma once

#include <time.h>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <string>
#include "renewfolio/core/error.hpp"
#include "renewfolio/core/types.hpp"

namespace renewfolio {
namespace core {

/**
 * @brief Thread-safe wrapper for localtime
 *
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
 *
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
 * @brief Broken-down UTC calendar fields of a timestamp
 */
inline std::tm to_utc_tm(const Timestamp& ts) {
    std::time_t t = std::chrono::system_clock::to_time_t(ts);
    std::tm result{};
    safe_gmtime(&t, &result);
    return result;
}

// Calendar accessors used by the seasonal and diurnal models. All work in UTC.
inline int hour_of_day(const Timestamp& ts) {
    return to_utc_tm(ts).tm_hour;
}

/// 1-based day of year (1..366)
inline int day_of_year(const Timestamp& ts) {
    return to_utc_tm(ts).tm_yday + 1;
}

/// Monday = 0 ... Sunday = 6
inline int day_of_week(const Timestamp& ts) {
    return (to_utc_tm(ts).tm_wday + 6) % 7;
}

/// 1-based month (1..12)
inline int month_of_year(const Timestamp& ts) {
    return to_utc_tm(ts).tm_mon + 1;
}

inline bool is_weekend(const Timestamp& ts) {
    return day_of_week(ts) >= 5;
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

/**
 * @brief Parse an ISO-8601 UTC timestamp
 *
 * Accepts "YYYY-MM-DD", "YYYY-MM-DDTHH:MM:SS" and the same with a trailing 'Z'.
 *
 * @param text Timestamp text
 * @return Parsed timestamp or INVALID_ARGUMENT
 */
inline Result<Timestamp> parse_utc_timestamp(const std::string& text) {
    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
    int fields = std::sscanf(text.c_str(), "%d-%d-%dT%d:%d:%d", &year, &month, &day, &hour,
                             &minute, &second);
    if (fields != 3 && fields != 6) {
        return make_error<Timestamp>(ErrorCode::INVALID_ARGUMENT,
                                     "Unrecognized timestamp '" + text + "'", "TimeUtils");
    }
    if (month < 1 || month > 12 || day < 1 || day > 31 || hour < 0 || hour > 23 ||
        minute < 0 || minute > 59 || second < 0 || second > 60) {
        return make_error<Timestamp>(ErrorCode::INVALID_ARGUMENT,
                                     "Timestamp field out of range in '" + text + "'",
                                     "TimeUtils");
    }

    long long days = days_from_civil(year, static_cast<unsigned>(month),
                                     static_cast<unsigned>(day));
    auto since_epoch = std::chrono::hours(days * 24 + hour) + std::chrono::minutes(minute) +
                       std::chrono::seconds(second);
    return Timestamp(std::chrono::duration_cast<Timestamp::duration>(since_epoch));
}

/**
 * @brief Format a timestamp as "YYYY-MM-DDTHH:MM:SSZ"
 */
inline std::string format_utc_timestamp(const Timestamp& ts) {
    std::tm tm = to_utc_tm(ts);
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return std::string(buffer);
}

/**
 * @brief Get current time as a string with specified format
 *
 * @param format Format string compatible with strftime
 * @param use_local_time If true, uses local time, otherwise GMT
 * @return Formatted time string
 */
inline std::string get_formatted_time(const char* format, bool use_local_time = true) {
    auto now_c = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm result;

    if (use_local_time) {
        safe_localtime(&now_c, &result);
    } else {
        safe_gmtime(&now_c, &result);
    }

    char buffer[128];
    std::strftime(buffer, sizeof(buffer), format, &result);
    return std::string(buffer);
}

}  // namespace core
}  // namespace renewfolio
