#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace tokentally {

// A proleptic Gregorian calendar day with no time zone attached. Snapshot
// rows are keyed by its ISO form, so lexical and chronological order agree.
struct CalendarDate {
    int year = 1970;
    int month = 1;
    int day = 1;

    // "YYYY-MM-DD"
    std::string toString() const;
    static std::optional<CalendarDate> parse(const std::string &value);

    CalendarDate addDays(int days) const;
    CalendarDate firstOfMonth() const;
    CalendarDate firstOfPreviousMonth() const;

    std::chrono::system_clock::time_point startOfDayUtc() const;

    static CalendarDate fromTimePointUtc(std::chrono::system_clock::time_point timestamp);
    static CalendarDate todayUtc();
};

bool operator==(const CalendarDate &a, const CalendarDate &b);
bool operator!=(const CalendarDate &a, const CalendarDate &b);
bool operator<(const CalendarDate &a, const CalendarDate &b);
bool operator<=(const CalendarDate &a, const CalendarDate &b);
bool operator>(const CalendarDate &a, const CalendarDate &b);
bool operator>=(const CalendarDate &a, const CalendarDate &b);

} // namespace tokentally
