#pragma once

#include <common/time_util.hpp>

#include <optional>
#include <string>
#include <vector>

namespace sg {
    enum class DateType {
        Absolute = 1,     // [start, end] datetimes, expires at end
        MonthlyDaily = 2, // allowed months plus a daily window
        Daily = 3         // daily window, perpetual
    };

    class TimePolicy {
    public:
        TimePolicy() = default;

        static TimePolicy absolute(TimePoint start, TimePoint end);
        static TimePolicy monthly_daily(std::vector<int> months, DailyWindow window);
        static TimePolicy daily(DailyWindow window);

        // Builds a policy from deployment request fields. Type 1 expects
        // "YYYY-MM-DD HH:MM:SS" bounds, types 2 and 3 "HH:MM[:SS]".
        // Throws ConfigError.
        static TimePolicy parse(int date_type,
                                const std::string& start,
                                const std::string& end,
                                const std::vector<int>& months);

        bool permits(TimePoint now) const;
        std::optional<TimePoint> expiry() const;

        DateType type() const { return type_; }
        const std::vector<int>& months() const { return months_; }
        const DailyWindow& window() const { return window_; }
        std::string describe() const;

    private:
        DateType type_ = DateType::Daily;
        TimePoint start_{};
        TimePoint end_{};
        std::vector<int> months_;
        DailyWindow window_;
    };
}
