#include <alarm/alarm_engine.hpp>

#include <algorithm>
#include <iostream>

namespace sg {
    namespace {
        bool listed(const std::vector<std::string>& allow, const std::string& v) {
            return allow.empty() || std::find(allow.begin(), allow.end(), v) != allow.end();
        }
    } // namespace

    Severity severity_for(float confidence, const AlarmLevels& levels) {
        if (confidence >= levels.high) return Severity::High;
        if (confidence >= levels.medium) return Severity::Medium;
        return Severity::Low;
    }

    AlarmEngine::AlarmEngine(AlarmLevels levels, IAlarmSink* sink)
        : levels_(levels), sink_(sink) {}

    Status AlarmEngine::validate_(const AlarmRule& rule) {
        if (rule.id.empty()) return Status::error(ErrorCode::ConfigError, "rule id is empty");
        if (rule.consecutive_frames < 1) {
            return Status::error(ErrorCode::ConfigError, "rule " + rule.id + ": consecutive_frames must be >= 1");
        }
        if (!(rule.min_confidence >= 0.0f && rule.min_confidence <= 1.0f)) {
            return Status::error(ErrorCode::ConfigError, "rule " + rule.id + ": min_confidence outside [0, 1]");
        }
        if (rule.cooldown.count() < 0) {
            return Status::error(ErrorCode::ConfigError, "rule " + rule.id + ": negative cooldown");
        }
        return Status::success();
    }

    Status AlarmEngine::add_rule(const AlarmRule& rule) {
        Status st = validate_(rule);
        if (!st.ok()) return st;

        std::unique_lock lk(rules_mtx_);
        for (const auto& r : rules_) {
            if (r.id == rule.id) return Status::error(ErrorCode::DuplicateId, "rule " + rule.id + " exists");
        }
        rules_.push_back(rule);
        std::cout << "[AlarmEngine](add_rule) " << rule.id << " (" << rule.name << ")\n";
        return Status::success();
    }

    Status AlarmEngine::update_rule(const AlarmRule& rule) {
        Status st = validate_(rule);
        if (!st.ok()) return st;

        std::unique_lock lk(rules_mtx_);
        for (auto& r : rules_) {
            if (r.id == rule.id) {
                r = rule;
                return Status::success();
            }
        }
        return Status::error(ErrorCode::NotFound, "rule " + rule.id + " not found");
    }

    Status AlarmEngine::remove_rule(const std::string& rule_id) {
        {
            std::unique_lock lk(rules_mtx_);
            auto it = std::find_if(rules_.begin(), rules_.end(),
                                   [&](const AlarmRule& r) { return r.id == rule_id; });
            if (it == rules_.end()) return Status::error(ErrorCode::NotFound, "rule " + rule_id + " not found");
            rules_.erase(it);
        }

        std::lock_guard lk(states_mtx_);
        for (auto& kv : states_) {
            std::lock_guard slk(kv.second->mtx);
            kv.second->by_rule.erase(rule_id);
        }
        return Status::success();
    }

    Status AlarmEngine::set_enabled(const std::string& rule_id, bool enabled) {
        std::unique_lock lk(rules_mtx_);
        for (auto& r : rules_) {
            if (r.id == rule_id) {
                r.enabled = enabled;
                return Status::success();
            }
        }
        return Status::error(ErrorCode::NotFound, "rule " + rule_id + " not found");
    }

    std::optional<AlarmRule> AlarmEngine::rule(const std::string& rule_id) const {
        std::shared_lock lk(rules_mtx_);
        for (const auto& r : rules_) {
            if (r.id == rule_id) return r;
        }
        return std::nullopt;
    }

    std::vector<AlarmRule> AlarmEngine::rules() const {
        std::shared_lock lk(rules_mtx_);
        return rules_;
    }

    std::shared_ptr<AlarmEngine::SessionAlarmState> AlarmEngine::state_for_(const std::string& session_id) {
        std::lock_guard lk(states_mtx_);
        auto& st = states_[session_id];
        if (!st) st = std::make_shared<SessionAlarmState>();
        return st;
    }

    std::vector<AlarmEvent> AlarmEngine::evaluate(const DetectionResult& result) {
        std::vector<AlarmEvent> emitted;
        auto state = state_for_(result.session_id);

        std::vector<AlarmRule> fired_rules;
        {
            std::shared_lock rlk(rules_mtx_);
            std::lock_guard slk(state->mtx);
            for (const auto& rule : rules_) {
                if (!rule.enabled) continue;
                if (!listed(rule.session_ids, result.session_id)) continue;
                if (rule.time_range && !rule.time_range->contains(result.timestamp)) continue;

                const size_t before = emitted.size();
                evaluate_rule_(rule, result, state->by_rule[rule.id], emitted);
                for (size_t i = before; i < emitted.size(); ++i) fired_rules.push_back(rule);
            }
        }

        for (size_t i = 0; i < emitted.size(); ++i) {
            const AlarmEvent& ev = emitted[i];
            ++total_;
            switch (ev.severity) {
                case Severity::High: ++high_; break;
                case Severity::Medium: ++medium_; break;
                case Severity::Low: ++low_; break;
            }
            if (sink_ && !sink_->submit(fired_rules[i], ev)) {
                std::cerr << "[AlarmEngine](evaluate) notification for rule " << ev.rule_id
                          << " session " << ev.session_id << " was not queued\n";
            }
        }
        return emitted;
    }

    void AlarmEngine::evaluate_rule_(const AlarmRule& rule, const DetectionResult& result,
                                     RuleState& st, std::vector<AlarmEvent>& out) {
        // best detection per qualifying class in this frame
        std::map<std::string, const Detection*> best;
        for (const auto& d : result.detections) {
            if (d.confidence < rule.min_confidence) continue;
            if (!listed(rule.class_names, d.class_name)) continue;
            auto& slot = best[d.class_name];
            if (!slot || d.confidence > slot->confidence) slot = &d;
        }

        for (auto it = st.consecutive.begin(); it != st.consecutive.end();) {
            if (!best.count(it->first)) it = st.consecutive.erase(it);
            else ++it;
        }

        const bool cooling = st.last_triggered &&
                             (result.timestamp < *st.last_triggered ||
                              result.timestamp - *st.last_triggered < rule.cooldown);
        if (cooling) return;

        for (const auto& kv : best) {
            int& count = st.consecutive[kv.first];
            ++count;
            if (count < rule.consecutive_frames) continue;

            const Detection& d = *kv.second;
            AlarmEvent ev;
            ev.rule_id = rule.id;
            ev.session_id = result.session_id;
            ev.timestamp = result.timestamp;
            ev.severity = severity_for(d.confidence, levels_);
            ev.confidence = d.confidence;
            ev.class_name = d.class_name;
            ev.bbox = d.bbox;
            ev.consecutive_count = count;
            ev.frame_id = result.frame_id;
            ev.media_url = result.media_url;
            ev.target = result.target;
            out.push_back(std::move(ev));

            count = 0;
            if (!st.last_triggered || result.timestamp > *st.last_triggered) {
                st.last_triggered = result.timestamp;
            }
        }
    }

    void AlarmEngine::reset_session(const std::string& session_id) {
        std::lock_guard lk(states_mtx_);
        states_.erase(session_id);
    }

    AlarmStats AlarmEngine::stats() const {
        AlarmStats s;
        s.total = total_.load();
        s.high = high_.load();
        s.medium = medium_.load();
        s.low = low_.load();
        {
            std::shared_lock lk(rules_mtx_);
            s.rules = rules_.size();
        }
        std::lock_guard lk(states_mtx_);
        s.tracked_sessions = states_.size();
        return s;
    }
}
