#pragma once

#include <chrono>
#include <cmath>
#include <string>
#include <vector>

namespace libprecise {

/**
 * @brief Calendar instant (UTC, leap seconds ignored)
 */
using Timestamp = std::chrono::system_clock::time_point;

/**
 * @brief Span of time in whole seconds
 */
using TimeSpan = std::chrono::seconds;

/**
 * @brief GPS time (week number + time of week)
 */
struct GNSSTime {
    int week;           ///< GPS week number
    double tow;         ///< Time of week in seconds

    GNSSTime() : week(0), tow(0.0) {}
    GNSSTime(int w, double t) : week(w), tow(t) {}

    /**
     * @brief Convert to system time
     */
    Timestamp toSystemTime() const;

    /**
     * @brief Create from system time
     */
    static GNSSTime fromSystemTime(const Timestamp& tp);

    /**
     * @brief Time difference in seconds
     */
    double operator-(const GNSSTime& other) const {
        return (week - other.week) * 604800.0 + (tow - other.tow);
    }

    bool operator<(const GNSSTime& other) const {
        return week < other.week || (week == other.week && tow < other.tow);
    }

    bool operator==(const GNSSTime& other) const {
        return week == other.week && std::abs(tow - other.tow) < 1e-6;
    }
};

/**
 * @brief Requested observation window
 *
 * A zero-length window (start == end) is valid.
 */
struct TimeWindow {
    Timestamp start;
    Timestamp end;

    TimeWindow() = default;
    TimeWindow(const Timestamp& s, const Timestamp& e) : start(s), end(e) {}

    bool isValid() const { return start <= end; }

    /**
     * @brief Build a window from two "YYYY-MM-DD_HH:MM:SS" boundaries
     * @throws std::invalid_argument on an empty or malformed boundary, or if start > end
     */
    static TimeWindow fromStrings(const std::string& start_str, const std::string& end_str);
};

/**
 * @brief GPS weeks touched by a window, inclusive on both ends
 */
std::vector<int> gpsWeekRange(const TimeWindow& window);

/**
 * @brief Calendar helpers
 */
namespace time_utils {

    /**
     * @brief Check for a Gregorian leap year
     */
    bool isLeapYear(int year);

    /**
     * @brief Build a timestamp from year, ordinal day, hour and minute
     * @return false if any field is out of range
     */
    bool fromYearDayOfYear(int year, int day_of_year, int hour, int minute, Timestamp& out);

    /**
     * @brief Build a timestamp from a calendar date and time of day
     * @return false if any field is out of range
     */
    bool fromCalendar(int year, int month, int day, int hour, int minute, int second, Timestamp& out);

    /**
     * @brief Parse "YYYY-MM-DD_HH:MM:SS"
     */
    bool parseDateTime(const std::string& text, Timestamp& out);

    /**
     * @brief Format as "YYYY-MM-DD HH:MM:SS"
     */
    std::string formatDateTime(const Timestamp& ts);

    /**
     * @brief Split a timestamp into year, day of year, hour and minute
     */
    void toYearDayOfYear(const Timestamp& ts, int& year, int& day_of_year, int& hour, int& minute);
}

namespace constants {
    constexpr long long SECONDS_PER_DAY = 86400;
    constexpr long long SECONDS_PER_WEEK = 604800;
    constexpr long long GPS_EPOCH_UNIX = 315964800;  ///< 1980-01-06 00:00:00 UTC
}

} // namespace libprecise
