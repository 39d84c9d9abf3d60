#include <libprecise++/core/types.hpp>
#include <cctype>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace libprecise {

namespace {

// Days since 1970-01-01 for a proleptic Gregorian date
long long daysFromCivil(int year, int month, int day) {
    year -= month <= 2;
    const long long era = (year >= 0 ? year : year - 399) / 400;
    const long long yoe = year - era * 400;
    const long long doy = (153 * (month + (month > 2 ? -3 : 9)) + 2) / 5 + day - 1;
    const long long doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

void civilFromDays(long long z, int& year, int& month, int& day) {
    z += 719468;
    const long long era = (z >= 0 ? z : z - 146096) / 146097;
    const long long doe = z - era * 146097;
    const long long yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const long long doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const long long mp = (5 * doy + 2) / 153;
    day = static_cast<int>(doy - (153 * mp + 2) / 5 + 1);
    month = static_cast<int>(mp < 10 ? mp + 3 : mp - 9);
    year = static_cast<int>(yoe + era * 400 + (month <= 2));
}

long long floorDiv(long long a, long long b) {
    long long q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) {
        --q;
    }
    return q;
}

long long toUnixSeconds(const Timestamp& ts) {
    return std::chrono::duration_cast<std::chrono::seconds>(ts.time_since_epoch()).count();
}

Timestamp fromUnixSeconds(long long seconds) {
    return Timestamp(std::chrono::seconds(seconds));
}

bool allDigits(const std::string& text, size_t pos, size_t len) {
    for (size_t i = pos; i < pos + len; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(text[i]))) {
            return false;
        }
    }
    return true;
}

int daysInMonth(int year, int month) {
    static const int days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2 && time_utils::isLeapYear(year)) {
        return 29;
    }
    return days[month - 1];
}

} // namespace

Timestamp GNSSTime::toSystemTime() const {
    const long long seconds = constants::GPS_EPOCH_UNIX
                            + static_cast<long long>(week) * constants::SECONDS_PER_WEEK
                            + static_cast<long long>(tow);
    return fromUnixSeconds(seconds);
}

GNSSTime GNSSTime::fromSystemTime(const Timestamp& tp) {
    const long long total_seconds = toUnixSeconds(tp) - constants::GPS_EPOCH_UNIX;

    const long long week = floorDiv(total_seconds, constants::SECONDS_PER_WEEK);
    const double tow = static_cast<double>(total_seconds - week * constants::SECONDS_PER_WEEK);

    return GNSSTime(static_cast<int>(week), tow);
}

TimeWindow TimeWindow::fromStrings(const std::string& start_str, const std::string& end_str) {
    TimeWindow window;
    if (!time_utils::parseDateTime(start_str, window.start)) {
        throw std::invalid_argument("Invalid start datetime '" + start_str +
                                    "'. Use YYYY-MM-DD_HH:MM:SS (e.g. 2025-05-01_00:00:00)");
    }
    if (!time_utils::parseDateTime(end_str, window.end)) {
        throw std::invalid_argument("Invalid end datetime '" + end_str +
                                    "'. Use YYYY-MM-DD_HH:MM:SS (e.g. 2025-05-01_00:00:00)");
    }
    if (!window.isValid()) {
        throw std::invalid_argument("Window start " + start_str + " is after window end " + end_str);
    }
    return window;
}

std::vector<int> gpsWeekRange(const TimeWindow& window) {
    std::vector<int> weeks;
    if (!window.isValid()) {
        return weeks;
    }

    const int first = GNSSTime::fromSystemTime(window.start).week;
    const int last = GNSSTime::fromSystemTime(window.end).week;
    for (int week = first; week <= last; ++week) {
        weeks.push_back(week);
    }
    return weeks;
}

namespace time_utils {

bool isLeapYear(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

bool fromYearDayOfYear(int year, int day_of_year, int hour, int minute, Timestamp& out) {
    const int days_in_year = isLeapYear(year) ? 366 : 365;
    if (day_of_year < 1 || day_of_year > days_in_year) return false;
    if (hour < 0 || hour > 23) return false;
    if (minute < 0 || minute > 59) return false;

    const long long days = daysFromCivil(year, 1, 1) + (day_of_year - 1);
    out = fromUnixSeconds(days * constants::SECONDS_PER_DAY + hour * 3600LL + minute * 60LL);
    return true;
}

bool fromCalendar(int year, int month, int day, int hour, int minute, int second, Timestamp& out) {
    if (month < 1 || month > 12) return false;
    if (day < 1 || day > daysInMonth(year, month)) return false;
    if (hour < 0 || hour > 23) return false;
    if (minute < 0 || minute > 59) return false;
    if (second < 0 || second > 59) return false;

    const long long days = daysFromCivil(year, month, day);
    out = fromUnixSeconds(days * constants::SECONDS_PER_DAY + hour * 3600LL + minute * 60LL + second);
    return true;
}

bool parseDateTime(const std::string& text, Timestamp& out) {
    // YYYY-MM-DD_HH:MM:SS
    if (text.length() != 19) return false;
    if (text[4] != '-' || text[7] != '-' || text[10] != '_' ||
        text[13] != ':' || text[16] != ':') {
        return false;
    }
    if (!allDigits(text, 0, 4) || !allDigits(text, 5, 2) || !allDigits(text, 8, 2) ||
        !allDigits(text, 11, 2) || !allDigits(text, 14, 2) || !allDigits(text, 17, 2)) {
        return false;
    }

    return fromCalendar(std::stoi(text.substr(0, 4)),
                        std::stoi(text.substr(5, 2)),
                        std::stoi(text.substr(8, 2)),
                        std::stoi(text.substr(11, 2)),
                        std::stoi(text.substr(14, 2)),
                        std::stoi(text.substr(17, 2)),
                        out);
}

std::string formatDateTime(const Timestamp& ts) {
    const long long seconds = toUnixSeconds(ts);
    const long long days = floorDiv(seconds, constants::SECONDS_PER_DAY);
    const long long sod = seconds - days * constants::SECONDS_PER_DAY;

    int year, month, day;
    civilFromDays(days, year, month, day);

    std::ostringstream oss;
    oss << std::setfill('0')
        << std::setw(4) << year << "-"
        << std::setw(2) << month << "-"
        << std::setw(2) << day << " "
        << std::setw(2) << sod / 3600 << ":"
        << std::setw(2) << (sod % 3600) / 60 << ":"
        << std::setw(2) << sod % 60;
    return oss.str();
}

void toYearDayOfYear(const Timestamp& ts, int& year, int& day_of_year, int& hour, int& minute) {
    const long long seconds = toUnixSeconds(ts);
    const long long days = floorDiv(seconds, constants::SECONDS_PER_DAY);
    const long long sod = seconds - days * constants::SECONDS_PER_DAY;

    int month, day;
    civilFromDays(days, year, month, day);
    day_of_year = static_cast<int>(days - daysFromCivil(year, 1, 1)) + 1;
    hour = static_cast<int>(sod / 3600);
    minute = static_cast<int>((sod % 3600) / 60);
}

} // namespace time_utils

} // namespace libprecise
