#pragma once

#include <alarm/alarm_rule.hpp>
#include <common/errors.hpp>
#include <pipeline/types.hpp>

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace sg {
    // Receives emitted alarms. Must not block.
    struct IAlarmSink {
        virtual ~IAlarmSink() = default;
        virtual bool submit(const AlarmRule& rule, const AlarmEvent& event) = 0;
    };

    struct AlarmStats {
        int64_t total = 0;
        int64_t high = 0;
        int64_t medium = 0;
        int64_t low = 0;
        size_t rules = 0;
        size_t tracked_sessions = 0;
    };

    Severity severity_for(float confidence, const AlarmLevels& levels);

    class AlarmEngine {
    public:
        AlarmEngine(AlarmLevels levels, IAlarmSink* sink);

        Status add_rule(const AlarmRule& rule);
        Status update_rule(const AlarmRule& rule);
        Status remove_rule(const std::string& rule_id);
        Status set_enabled(const std::string& rule_id, bool enabled);
        std::optional<AlarmRule> rule(const std::string& rule_id) const;
        std::vector<AlarmRule> rules() const;

        // Runs every enabled rule over one result and returns the events it
        // emitted (also handed to the sink).
        std::vector<AlarmEvent> evaluate(const DetectionResult& result);

        void reset_session(const std::string& session_id);
        AlarmStats stats() const;

    private:
        struct RuleState {
            std::map<std::string, int> consecutive; // per class
            std::optional<TimePoint> last_triggered;
        };

        struct SessionAlarmState {
            std::mutex mtx;
            std::unordered_map<std::string, RuleState> by_rule;
        };

        std::shared_ptr<SessionAlarmState> state_for_(const std::string& session_id);
        void evaluate_rule_(const AlarmRule& rule, const DetectionResult& result,
                            RuleState& st, std::vector<AlarmEvent>& out);
        static Status validate_(const AlarmRule& rule);

        AlarmLevels levels_;
        IAlarmSink* sink_;

        mutable std::shared_mutex rules_mtx_;
        std::vector<AlarmRule> rules_; // registration order

        mutable std::mutex states_mtx_;
        std::unordered_map<std::string, std::shared_ptr<SessionAlarmState>> states_;

        std::atomic<int64_t> total_{0};
        std::atomic<int64_t> high_{0};
        std::atomic<int64_t> medium_{0};
        std::atomic<int64_t> low_{0};
    };
}
