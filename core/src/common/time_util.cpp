#include <common/time_util.hpp>
#include <common/errors.hpp>

#include <cstdio>
#include <iomanip>
#include <sstream>

namespace sg {
    int parse_time_of_day(const std::string& s) {
        int h = -1, m = -1, sec = 0;
        int used = 0;
        bool ok = std::sscanf(s.c_str(), "%d:%d%n", &h, &m, &used) == 2;
        if (ok && s[used] == ':') {
            int more = 0;
            ok = std::sscanf(s.c_str() + used, ":%d%n", &sec, &more) == 1;
            used += more;
        }
        // the whole string must be consumed
        if (!ok || static_cast<size_t>(used) != s.size()) {
            throw ConfigError("[Time] bad time of day '" + s + "'");
        }
        if (h < 0 || h > 23 || m < 0 || m > 59 || sec < 0 || sec > 59) {
            throw ConfigError("[Time] time of day out of range '" + s + "'");
        }
        return h * 3600 + m * 60 + sec;
    }

    TimePoint parse_datetime(const std::string& s) {
        std::tm tm{};
        std::istringstream in(s);
        in >> std::get_time(&tm, "%Y-%m-%d %H:%M:%S");
        std::string rest;
        if (in.fail() || in >> rest) {
            throw ConfigError("[Time] bad datetime '" + s + "', expected YYYY-MM-DD HH:MM:SS");
        }
        tm.tm_isdst = -1;
        const std::time_t t = std::mktime(&tm);
        if (t == static_cast<std::time_t>(-1)) {
            throw ConfigError("[Time] datetime not representable '" + s + "'");
        }
        return Clock::from_time_t(t);
    }

    std::tm local_tm(TimePoint tp) {
        const std::time_t t = Clock::to_time_t(tp);
        std::tm tm{};
        localtime_r(&t, &tm);
        return tm;
    }

    int seconds_of_day(TimePoint tp) {
        const std::tm tm = local_tm(tp);
        return tm.tm_hour * 3600 + tm.tm_min * 60 + tm.tm_sec;
    }

    int month_of(TimePoint tp) {
        return local_tm(tp).tm_mon + 1;
    }

    std::string format_datetime(TimePoint tp) {
        const std::tm tm = local_tm(tp);
        char buf[32];
        std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
        return buf;
    }

    std::string format_date(TimePoint tp) {
        const std::tm tm = local_tm(tp);
        char buf[16];
        std::strftime(buf, sizeof(buf), "%Y-%m-%d", &tm);
        return buf;
    }

    std::string format_clock_ms(TimePoint tp) {
        const std::tm tm = local_tm(tp);
        const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            tp.time_since_epoch()).count() % 1000;
        char buf[24];
        std::snprintf(buf, sizeof(buf), "%02d-%02d-%02d-%03d",
                      tm.tm_hour, tm.tm_min, tm.tm_sec, static_cast<int>(ms));
        return buf;
    }

    DailyWindow parse_daily_window(const std::string& start, const std::string& end) {
        DailyWindow w;
        w.start_s = parse_time_of_day(start);
        w.end_s = parse_time_of_day(end);
        return w;
    }
}
