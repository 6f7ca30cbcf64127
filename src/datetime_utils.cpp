#include "datetime_utils.hpp"
#include "utils.hpp"
#include <cctype>
#include <cstdio>

namespace zenbot {

// Howard Hinnant's civil calendar algorithms.
int64_t days_from_civil(int year, int month, int day) {
    int64_t y = year - (month <= 2 ? 1 : 0);
    int64_t era = (y >= 0 ? y : y - 399) / 400;
    int64_t yoe = y - era * 400;
    int64_t mp = (month + 9) % 12;
    int64_t doy = (153 * mp + 2) / 5 + day - 1;
    int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

CivilDate civil_from_days(int64_t z) {
    z += 719468;
    int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    int64_t doe = z - era * 146097;
    int64_t yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    int64_t y = yoe + era * 400;
    int64_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    int64_t mp = (5 * doy + 2) / 153;
    int64_t d = doy - (153 * mp + 2) / 5 + 1;
    int64_t m = mp < 10 ? mp + 3 : mp - 9;
    CivilDate out;
    out.year = static_cast<int>(y + (m <= 2 ? 1 : 0));
    out.month = static_cast<int>(m);
    out.day = static_cast<int>(d);
    return out;
}

CivilDate add_days(const CivilDate& d, int64_t n) {
    return civil_from_days(days_from_civil(d.year, d.month, d.day) + n);
}

int weekday_of(const CivilDate& d) {
    // 1970-01-01 was a Thursday (3 with Monday = 0).
    int64_t days = days_from_civil(d.year, d.month, d.day);
    int64_t wd = (days + 3) % 7;
    if (wd < 0) wd += 7;
    return static_cast<int>(wd);
}

static std::tm to_local_tm(std::time_t t) {
    std::tm tm{};
    localtime_r(&t, &tm);
    return tm;
}

static std::tm to_utc_tm(std::time_t t) {
    std::tm tm{};
    gmtime_r(&t, &tm);
    return tm;
}

CivilDate local_date(std::time_t t) {
    std::tm tm = to_local_tm(t);
    return CivilDate{tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday};
}

std::string format_local(std::time_t t, const char* fmt) {
    std::tm tm = to_local_tm(t);
    char buf[128];
    size_t n = std::strftime(buf, sizeof(buf), fmt, &tm);
    return std::string(buf, n);
}

std::string format_utc(std::time_t t, const char* fmt) {
    std::tm tm = to_utc_tm(t);
    char buf[128];
    size_t n = std::strftime(buf, sizeof(buf), fmt, &tm);
    return std::string(buf, n);
}

static int64_t tm_fields_to_epoch(const std::tm& tm) {
    return days_from_civil(tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday) * 86400 +
           tm.tm_hour * 3600 + tm.tm_min * 60 + tm.tm_sec;
}

long local_utc_offset(std::time_t t) {
    std::tm tm = to_local_tm(t);
    return static_cast<long>(tm_fields_to_epoch(tm) - static_cast<int64_t>(t));
}

static std::string format_offset(long offset_seconds) {
    char sign = offset_seconds < 0 ? '-' : '+';
    long a = offset_seconds < 0 ? -offset_seconds : offset_seconds;
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%c%02ld:%02ld", sign, a / 3600, (a % 3600) / 60);
    return buf;
}

static bool is_digit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

std::optional<std::pair<int, int>> parse_time_string(const std::string& text) {
    std::string s = to_lower(trim(text));

    for (size_t i = 0; i < s.size(); i++) {
        if (!is_digit(s[i])) continue;
        // Leftmost match first, preferring a two-digit hour.
        for (size_t hour_len : {size_t(2), size_t(1)}) {
            size_t colon = i + hour_len;
            if (colon + 2 >= s.size()) continue;
            bool hour_ok = true;
            for (size_t k = i; k < colon; k++) {
                if (!is_digit(s[k])) { hour_ok = false; break; }
            }
            if (!hour_ok || s[colon] != ':' || !is_digit(s[colon + 1]) || !is_digit(s[colon + 2])) continue;

            int hour = std::stoi(s.substr(i, hour_len));
            int minute = std::stoi(s.substr(colon + 1, 2));

            size_t p = colon + 3;
            while (p < s.size() && std::isspace(static_cast<unsigned char>(s[p]))) p++;
            std::string meridiem;
            if (s.compare(p, 2, "am") == 0) meridiem = "am";
            else if (s.compare(p, 2, "pm") == 0) meridiem = "pm";

            if (minute > 59) return std::nullopt;
            if (!meridiem.empty()) {
                if (hour < 1 || hour > 12) return std::nullopt;
                if (meridiem == "pm" && hour != 12) hour += 12;
                if (meridiem == "am" && hour == 12) hour = 0;
            } else if (hour > 23) {
                return std::nullopt;
            }
            return std::make_pair(hour, minute);
        }
    }
    return std::nullopt;
}

std::optional<CivilDate> resolve_date_expression(const std::string& expr, std::time_t now) {
    std::string text = to_lower(trim(expr));
    CivilDate today = local_date(now);

    if (text == "today") return today;
    if (text == "tomorrow") return add_days(today, 1);

    static const char* const weekdays[] = {
        "monday", "tuesday", "wednesday", "thursday", "friday", "saturday", "sunday"
    };
    for (int target = 0; target < 7; target++) {
        if (text != weekdays[target]) continue;
        int ahead = (target - weekday_of(today) + 7) % 7;
        if (ahead == 0) ahead = 7;
        return add_days(today, ahead);
    }
    return std::nullopt;
}

std::string combine_date_and_time(const CivilDate& date, int hour, int minute) {
    std::tm tm{};
    tm.tm_year = date.year - 1900;
    tm.tm_mon = date.month - 1;
    tm.tm_mday = date.day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = 0;
    tm.tm_isdst = -1;
    std::time_t t = std::mktime(&tm);
    long offset = (t == static_cast<std::time_t>(-1)) ? local_utc_offset(std::time(nullptr))
                                                       : local_utc_offset(t);

    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:00",
                  date.year, date.month, date.day, hour, minute);
    return std::string(buf) + format_offset(offset);
}

// Reads exactly n digits at pos.
static bool read_digits(const std::string& s, size_t& pos, size_t n, int& out) {
    if (pos + n > s.size()) return false;
    int v = 0;
    for (size_t i = 0; i < n; i++) {
        if (!is_digit(s[pos + i])) return false;
        v = v * 10 + (s[pos + i] - '0');
    }
    out = v;
    pos += n;
    return true;
}

std::optional<std::time_t> parse_iso_datetime(const std::string& text) {
    std::string s = trim(text);
    size_t pos = 0;
    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;

    if (!read_digits(s, pos, 4, year)) return std::nullopt;
    if (pos >= s.size() || s[pos++] != '-') return std::nullopt;
    if (!read_digits(s, pos, 2, month)) return std::nullopt;
    if (pos >= s.size() || s[pos++] != '-') return std::nullopt;
    if (!read_digits(s, pos, 2, day)) return std::nullopt;
    if (month < 1 || month > 12 || day < 1 || day > 31) return std::nullopt;
    if (civil_from_days(days_from_civil(year, month, day)).day != day) return std::nullopt;

    long offset = 0;
    if (pos < s.size()) {
        if (s[pos] != 'T' && s[pos] != 't' && s[pos] != ' ') return std::nullopt;
        pos++;
        if (!read_digits(s, pos, 2, hour)) return std::nullopt;
        if (pos >= s.size() || s[pos++] != ':') return std::nullopt;
        if (!read_digits(s, pos, 2, minute)) return std::nullopt;
        if (pos < s.size() && s[pos] == ':') {
            pos++;
            if (!read_digits(s, pos, 2, second)) return std::nullopt;
            if (pos < s.size() && (s[pos] == '.' || s[pos] == ',')) {
                pos++;
                size_t start = pos;
                while (pos < s.size() && is_digit(s[pos])) pos++;
                if (pos == start) return std::nullopt;
            }
        }
        if (hour > 23 || minute > 59 || second > 59) return std::nullopt;

        if (pos < s.size()) {
            char c = s[pos];
            if (c == 'Z' || c == 'z') {
                pos++;
            } else if (c == '+' || c == '-') {
                pos++;
                int oh = 0, om = 0;
                if (!read_digits(s, pos, 2, oh)) return std::nullopt;
                if (pos < s.size() && s[pos] == ':') pos++;
                if (pos < s.size() && !read_digits(s, pos, 2, om)) return std::nullopt;
                if (oh > 23 || om > 59) return std::nullopt;
                offset = (oh * 3600L + om * 60L) * (c == '-' ? -1 : 1);
            } else {
                return std::nullopt;
            }
        }
        if (pos != s.size()) return std::nullopt;
    }

    int64_t epoch = days_from_civil(year, month, day) * 86400 + hour * 3600 + minute * 60 + second - offset;
    return static_cast<std::time_t>(epoch);
}

bool is_datetime_past(const std::string& iso, std::time_t now) {
    auto t = parse_iso_datetime(iso);
    if (!t) return false;
    return *t <= now;
}

std::string format_reminder_when(const std::string& iso, std::time_t now) {
    auto t = parse_iso_datetime(iso);
    if (!t) return iso;

    CivilDate today = local_date(now);
    CivilDate target = local_date(*t);

    std::string label;
    if (target == today) label = "Today";
    else if (target == add_days(today, 1)) label = "Tomorrow";
    else label = format_local(*t, "%A");

    return label + " at " + format_local(*t, "%H:%M");
}

std::string local_iso_timestamp(std::time_t t) {
    return format_local(t, "%Y-%m-%dT%H:%M:%S") + format_offset(local_utc_offset(t));
}

std::string utc_iso_timestamp(std::time_t t) {
    return format_utc(t, "%Y-%m-%dT%H:%M:%S") + "+00:00";
}

std::string format_date_dmy(const CivilDate& d) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%02d.%02d.%04d", d.day, d.month, d.year);
    return buf;
}

} // namespace zenbot
