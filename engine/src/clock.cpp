#include "chronicle/clock.hpp"
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <mutex>
#include <random>

namespace chronicle {

namespace {

std::tm to_utc(std::time_t t) {
    std::tm tm {};
    gmtime_r(&t, &tm);
    return tm;
}

bool read_int(std::string_view s, size_t pos, size_t len, int& out) {
    if (pos + len > s.size()) return false;
    int v = 0;
    for (size_t i = pos; i < pos + len; ++i) {
        char c = s[i];
        if (c < '0' || c > '9') return false;
        v = v * 10 + (c - '0');
    }
    out = v;
    return true;
}

} // namespace

Clock system_clock() {
    return [] { return std::chrono::system_clock::now(); };
}

std::string format_timestamp(TimePoint tp) {
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
    std::time_t secs = static_cast<std::time_t>(ms / 1000);
    int millis = static_cast<int>(ms % 1000);
    if (millis < 0) {
        millis += 1000;
        secs -= 1;
    }
    const std::tm tm = to_utc(secs);
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                  tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                  tm.tm_hour, tm.tm_min, tm.tm_sec, millis);
    return std::string(buf);
}

std::optional<TimePoint> parse_timestamp(std::string_view s) {
    // YYYY-MM-DDTHH:MM:SS[.mmm]Z
    if (s.size() < 20) return std::nullopt;
    std::tm tm {};
    int year = 0, mon = 0, day = 0, hour = 0, min = 0, sec = 0, millis = 0;
    if (!read_int(s, 0, 4, year) || s[4] != '-' || !read_int(s, 5, 2, mon) || s[7] != '-' ||
        !read_int(s, 8, 2, day) || s[10] != 'T' || !read_int(s, 11, 2, hour) || s[13] != ':' ||
        !read_int(s, 14, 2, min) || s[16] != ':' || !read_int(s, 17, 2, sec)) {
        return std::nullopt;
    }
    size_t pos = 19;
    if (s[pos] == '.') {
        if (!read_int(s, pos + 1, 3, millis)) return std::nullopt;
        pos += 4;
    }
    if (pos != s.size() - 1 || s[pos] != 'Z') return std::nullopt;
    if (mon < 1 || mon > 12 || day < 1 || day > 31 || hour > 23 || min > 59 || sec > 60) return std::nullopt;
    tm.tm_year = year - 1900;
    tm.tm_mon = mon - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = min;
    tm.tm_sec = sec;
    const std::time_t t = timegm(&tm);
    return std::chrono::system_clock::from_time_t(t) + std::chrono::milliseconds(millis);
}

TimePoint hours_before(TimePoint tp, int64_t hours) {
    const int64_t available = std::chrono::duration_cast<std::chrono::hours>(tp.time_since_epoch()).count();
    if (hours >= available) return TimePoint {};
    return tp - std::chrono::hours(hours);
}

std::string format_date(TimePoint tp) { return format_timestamp(tp).substr(0, 10); }

std::optional<TimePoint> parse_date(std::string_view s) {
    if (s.size() != 10) return std::nullopt;
    std::string full(s);
    full += "T00:00:00.000Z";
    return parse_timestamp(full);
}

std::string make_id(std::string_view prefix) {
    static std::mutex mutex;
    static std::mt19937_64 rng {std::random_device {}()};
    uint64_t bits = 0;
    {
        std::lock_guard<std::mutex> lock(mutex);
        bits = rng();
    }
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    char buf[64];
    std::snprintf(buf, sizeof(buf), "_%lld_%016llx", static_cast<long long>(ms),
                  static_cast<unsigned long long>(bits));
    return std::string(prefix) + buf;
}

} // namespace chronicle
