#include "common/calendar_date.hpp"

#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <tuple>

namespace tokentally {

namespace {

std::time_t toEpochUtc(int year, int month, int day)
{
    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = 0;
    tm.tm_min = 0;
    tm.tm_sec = 0;
    return timegm(&tm);
}

CalendarDate fromEpochUtc(std::time_t time)
{
    std::tm tm{};
    gmtime_r(&time, &tm);
    CalendarDate date;
    date.year = tm.tm_year + 1900;
    date.month = tm.tm_mon + 1;
    date.day = tm.tm_mday;
    return date;
}

bool allDigits(const std::string &value, size_t pos, size_t count)
{
    for (size_t i = pos; i < pos + count; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(value[i]))) {
            return false;
        }
    }
    return true;
}

} // namespace

std::string CalendarDate::toString() const
{
    std::ostringstream out;
    out << std::setfill('0') << std::setw(4) << year << '-'
        << std::setw(2) << month << '-'
        << std::setw(2) << day;
    return out.str();
}

std::optional<CalendarDate> CalendarDate::parse(const std::string &value)
{
    if (value.size() != 10 || value[4] != '-' || value[7] != '-') {
        return std::nullopt;
    }
    if (!allDigits(value, 0, 4) || !allDigits(value, 5, 2) || !allDigits(value, 8, 2)) {
        return std::nullopt;
    }

    CalendarDate date;
    date.year = std::stoi(value.substr(0, 4));
    date.month = std::stoi(value.substr(5, 2));
    date.day = std::stoi(value.substr(8, 2));
    if (date.month < 1 || date.month > 12 || date.day < 1 || date.day > 31) {
        return std::nullopt;
    }

    // timegm normalizes out-of-range days (e.g. Feb 30), so a round trip
    // rejects them.
    if (fromEpochUtc(toEpochUtc(date.year, date.month, date.day)) != date) {
        return std::nullopt;
    }
    return date;
}

CalendarDate CalendarDate::addDays(int days) const
{
    return fromEpochUtc(toEpochUtc(year, month, day) + static_cast<std::time_t>(days) * 86400);
}

CalendarDate CalendarDate::firstOfMonth() const
{
    CalendarDate date = *this;
    date.day = 1;
    return date;
}

CalendarDate CalendarDate::firstOfPreviousMonth() const
{
    CalendarDate date = firstOfMonth();
    if (date.month == 1) {
        date.year -= 1;
        date.month = 12;
    } else {
        date.month -= 1;
    }
    return date;
}

std::chrono::system_clock::time_point CalendarDate::startOfDayUtc() const
{
    return std::chrono::system_clock::from_time_t(toEpochUtc(year, month, day));
}

CalendarDate CalendarDate::fromTimePointUtc(std::chrono::system_clock::time_point timestamp)
{
    return fromEpochUtc(std::chrono::system_clock::to_time_t(timestamp));
}

CalendarDate CalendarDate::todayUtc()
{
    return fromTimePointUtc(std::chrono::system_clock::now());
}

bool operator==(const CalendarDate &a, const CalendarDate &b)
{
    return a.year == b.year && a.month == b.month && a.day == b.day;
}

bool operator!=(const CalendarDate &a, const CalendarDate &b)
{
    return !(a == b);
}

bool operator<(const CalendarDate &a, const CalendarDate &b)
{
    return std::tie(a.year, a.month, a.day) < std::tie(b.year, b.month, b.day);
}

bool operator<=(const CalendarDate &a, const CalendarDate &b)
{
    return !(b < a);
}

bool operator>(const CalendarDate &a, const CalendarDate &b)
{
    return b < a;
}

bool operator>=(const CalendarDate &a, const CalendarDate &b)
{
    return !(a < b);
}

} // namespace tokentally
