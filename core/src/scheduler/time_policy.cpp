#include <scheduler/time_policy.hpp>
#include <common/errors.hpp>

#include <algorithm>

namespace sg {
    TimePolicy TimePolicy::absolute(TimePoint start, TimePoint end) {
        TimePolicy p;
        p.type_ = DateType::Absolute;
        p.start_ = start;
        p.end_ = end;
        return p;
    }

    TimePolicy TimePolicy::monthly_daily(std::vector<int> months, DailyWindow window) {
        TimePolicy p;
        p.type_ = DateType::MonthlyDaily;
        p.months_ = std::move(months);
        p.window_ = window;
        return p;
    }

    TimePolicy TimePolicy::daily(DailyWindow window) {
        TimePolicy p;
        p.type_ = DateType::Daily;
        p.window_ = window;
        return p;
    }

    TimePolicy TimePolicy::parse(int date_type,
                                 const std::string& start,
                                 const std::string& end,
                                 const std::vector<int>& months) {
        switch (date_type) {
            case 1: {
                const TimePoint s = parse_datetime(start);
                const TimePoint e = parse_datetime(end);
                if (e < s) {
                    throw ConfigError("[TimePolicy] end '" + end + "' is before start '" + start + "'");
                }
                return absolute(s, e);
            }
            case 2: {
                if (months.empty()) {
                    throw ConfigError("[TimePolicy] dateType 2 requires at least one month");
                }
                for (int m : months) {
                    if (m < 1 || m > 12) {
                        throw ConfigError("[TimePolicy] month out of range: " + std::to_string(m));
                    }
                }
                return monthly_daily(months, parse_daily_window(start, end));
            }
            case 3:
                return daily(parse_daily_window(start, end));
            default:
                throw ConfigError("[TimePolicy] unsupported dateType " + std::to_string(date_type));
        }
    }

    bool TimePolicy::permits(TimePoint now) const {
        switch (type_) {
            case DateType::Absolute:
                return now >= start_ && now <= end_;
            case DateType::MonthlyDaily: {
                const int month = month_of(now);
                if (std::find(months_.begin(), months_.end(), month) == months_.end()) return false;
                return window_.contains(now);
            }
            case DateType::Daily:
                return window_.contains(now);
        }
        return false;
    }

    std::optional<TimePoint> TimePolicy::expiry() const {
        if (type_ == DateType::Absolute) return end_;
        return std::nullopt;
    }

    std::string TimePolicy::describe() const {
        switch (type_) {
            case DateType::Absolute:
                return "absolute " + format_datetime(start_) + " .. " + format_datetime(end_);
            case DateType::MonthlyDaily: {
                std::string s = "months [";
                for (size_t i = 0; i < months_.size(); ++i) {
                    if (i) s += ",";
                    s += std::to_string(months_[i]);
                }
                return s + "] daily " + std::to_string(window_.start_s) + "s.." +
                       std::to_string(window_.end_s) + "s";
            }
            case DateType::Daily:
                return "daily " + std::to_string(window_.start_s) + "s.." +
                       std::to_string(window_.end_s) + "s";
        }
        return "unknown";
    }
}
