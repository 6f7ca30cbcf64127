#pragma once
#include <ctime>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace zenbot {

struct CivilDate {
    int year = 1970;
    int month = 1;
    int day = 1;

    bool operator==(const CivilDate& o) const {
        return year == o.year && month == o.month && day == o.day;
    }
};

int64_t days_from_civil(int year, int month, int day);
CivilDate civil_from_days(int64_t days);
CivilDate add_days(const CivilDate& d, int64_t n);
int weekday_of(const CivilDate& d);     // 0 = Monday ... 6 = Sunday

CivilDate local_date(std::time_t t);
std::string format_local(std::time_t t, const char* fmt);
std::string format_utc(std::time_t t, const char* fmt);

// Local UTC offset in seconds at instant t.
long local_utc_offset(std::time_t t);

// "HH:MM" / "H:MM" with optional am/pm anywhere in the text.
// Returns {hour, minute} in 24-hour form.
std::optional<std::pair<int, int>> parse_time_string(const std::string& text);

// today, tomorrow or a weekday name (next occurrence; same weekday means a
// week from today).
std::optional<CivilDate> resolve_date_expression(const std::string& expr, std::time_t now = std::time(nullptr));

// ISO-8601 local wall time with its UTC offset, e.g. 2026-02-18T09:15:00+05:30.
std::string combine_date_and_time(const CivilDate& date, int hour, int minute);

// Parses ISO-8601 date or date-time with optional seconds, fraction and
// Z/offset. Values without an offset are UTC.
std::optional<std::time_t> parse_iso_datetime(const std::string& text);

bool is_datetime_past(const std::string& iso, std::time_t now = std::time(nullptr));

// "Today at HH:MM", "Tomorrow at HH:MM" or "<Weekday> at HH:MM" in local
// time. Unparsable input comes back unchanged.
std::string format_reminder_when(const std::string& iso, std::time_t now = std::time(nullptr));

std::string local_iso_timestamp(std::time_t t);
std::string utc_iso_timestamp(std::time_t t);
std::string format_date_dmy(const CivilDate& d);

} // namespace zenbot
