#pragma once

#include <chrono>
#include <ctime>
#include <string>

namespace sg {
    using Clock = std::chrono::system_clock;
    using TimePoint = Clock::time_point;

    // Seconds since local midnight, parsed from "HH:MM" or "HH:MM:SS".
    // Throws ConfigError on malformed input.
    int parse_time_of_day(const std::string& s);

    // Local "YYYY-MM-DD HH:MM:SS". Throws ConfigError on malformed input.
    TimePoint parse_datetime(const std::string& s);

    std::tm local_tm(TimePoint tp);
    int seconds_of_day(TimePoint tp);
    int month_of(TimePoint tp); // 1..12

    std::string format_datetime(TimePoint tp);   // YYYY-MM-DD HH:MM:SS
    std::string format_date(TimePoint tp);       // YYYY-MM-DD
    std::string format_clock_ms(TimePoint tp);   // HH-MM-SS-mmm

    // Inclusive time-of-day window. end < start wraps past midnight,
    // start == end covers the whole day.
    struct DailyWindow {
        int start_s = 0;
        int end_s = 0;

        bool contains(int tod_s) const {
            if (start_s == end_s) return true;
            if (start_s < end_s) return tod_s >= start_s && tod_s <= end_s;
            return tod_s >= start_s || tod_s <= end_s;
        }

        bool contains(TimePoint tp) const { return contains(seconds_of_day(tp)); }
    };

    DailyWindow parse_daily_window(const std::string& start, const std::string& end);
}
