#include <notify/bus_channel.hpp>
#include <notify/callback_channel.hpp>
#include <notify/dispatcher.hpp>
#include <notify/log_channel.hpp>
#include <notify/payload.hpp>

#include "test_support.hpp"

#include <map>
#include <memory>
#include <sstream>
#include <string>

using sgtest::check;

namespace {
    sg::AlarmRule rule_with(std::vector<sg::ChannelKind> channels) {
        sg::AlarmRule r;
        r.id = "r1";
        r.name = "rule one";
        r.channels = std::move(channels);
        return r;
    }

    sg::AlarmEvent event_for(const std::string& url = "http://cb.local/alarm") {
        sg::AlarmEvent ev;
        ev.rule_id = "r1";
        ev.session_id = "scene_s1_dev1";
        ev.timestamp = sg::parse_datetime("2025-01-10 12:00:00");
        ev.severity = sg::Severity::High;
        ev.confidence = 0.9f;
        ev.class_name = "fire";
        ev.bbox = {1, 2, 3, 4};
        ev.consecutive_count = 3;
        ev.frame_id = 7;
        ev.media_url = "http://media/x.jpg";
        ev.target.callback_url = url;
        ev.target.scene_id = "s1";
        ev.target.device_id = "dev1";
        return ev;
    }

    sg::NotificationTask task_for(const std::string& url) {
        sg::NotificationTask t;
        t.rule = rule_with({sg::ChannelKind::Callback});
        t.event = event_for(url);
        t.channels = t.rule.channels;
        return t;
    }

    class FakePublisher : public sg::IMessagePublisher {
    public:
        bool publish(const std::string& topic, const std::string& payload, std::string& err) override {
            last_topic = topic;
            last_payload = payload;
            if (!ok) err = "broker unavailable";
            return ok;
        }

        bool ok = true;
        std::string last_topic;
        std::string last_payload;
    };

    int64_t count_of(const std::map<sg::ChannelKind, int64_t>& m, sg::ChannelKind k) {
        auto it = m.find(k);
        return it == m.end() ? 0 : it->second;
    }

    void test_channel_failure_is_isolated() {
        sg::NotificationDispatcher d(16, 2);
        auto failing = std::make_shared<sgtest::RecordingChannel>(sg::ChannelKind::Callback, true);
        auto logging = std::make_shared<sgtest::RecordingChannel>(sg::ChannelKind::Log);
        d.add_channel(failing);
        d.add_channel(logging);
        d.start();

        for (int i = 0; i < 5; ++i) {
            check(d.submit(rule_with({sg::ChannelKind::Callback, sg::ChannelKind::Log}), event_for()),
                  "submit should be accepted");
        }
        d.shutdown();

        const auto st = d.stats();
        check(logging->count() == 5, "log channel still delivers every task");
        check(failing->attempts == 5, "failing channel was attempted for every task");
        check(count_of(st.failed, sg::ChannelKind::Callback) == 5, "callback failures counted");
        check(count_of(st.delivered, sg::ChannelKind::Log) == 5, "log deliveries counted");
        check(st.enqueued == 5 && st.dropped == 0, "enqueue accounting");
    }

    void test_full_queue_drops_new_tasks() {
        sg::NotificationDispatcher d(2, 1);
        auto log = std::make_shared<sgtest::RecordingChannel>(sg::ChannelKind::Log);
        d.add_channel(log);

        // not started: nothing drains the queue
        check(d.submit(rule_with({sg::ChannelKind::Log}), event_for()), "first fits");
        check(d.submit(rule_with({sg::ChannelKind::Log}), event_for()), "second fits");
        check(!d.submit(rule_with({sg::ChannelKind::Log}), event_for()), "third is dropped");
        check(d.stats().dropped == 1, "drop counted");
        check(d.stats().queued == 2, "two queued");

        d.shutdown();
        check(log->count() == 2, "shutdown drains queued tasks");
        check(!d.submit(rule_with({sg::ChannelKind::Log}), event_for()), "submit after shutdown rejected");
    }

    void test_shutdown_drains_in_flight_work() {
        sg::NotificationDispatcher d(100, 2);
        auto slow = std::make_shared<sgtest::RecordingChannel>(sg::ChannelKind::Log);
        slow->delay = std::chrono::milliseconds(5);
        d.add_channel(slow);
        d.start();
        for (int i = 0; i < 20; ++i) d.submit(rule_with({sg::ChannelKind::Log}), event_for());
        d.shutdown();
        check(slow->count() == 20, "every accepted task is delivered before shutdown returns");
    }

    void test_unconfigured_channel_is_skipped() {
        sg::NotificationDispatcher d(4, 1);
        auto log = std::make_shared<sgtest::RecordingChannel>(sg::ChannelKind::Log);
        d.add_channel(log);
        d.start();
        d.submit(rule_with({sg::ChannelKind::Bus, sg::ChannelKind::Log}), event_for());
        d.shutdown();
        const auto st = d.stats();
        check(log->count() == 1, "configured channel delivered");
        check(st.failed.count(sg::ChannelKind::Bus) == 0, "missing bus channel is not a failure");
    }

    void test_circuit_breaker_opens_after_ten_failures() {
        int calls = 0;
        sg::CallbackChannel ch([&](const std::string&, const std::string&, std::string& err) {
            ++calls;
            err = "connection refused";
            return false;
        });

        const auto task = task_for("http://down.local/cb");
        int thrown = 0;
        for (int i = 0; i < 11; ++i) {
            try {
                ch.deliver(task);
            } catch (const sg::NotificationChannelError&) {
                ++thrown;
            }
        }
        check(thrown == 11, "every failed or refused delivery throws");
        check(calls == 10, "no request once the circuit is open");
        check(ch.breaker().failures("http://down.local/cb") == 10, "ten consecutive failures");
        check(!ch.breaker().allow("http://down.local/cb"), "target disabled");
        check(ch.breaker().open_targets().size() == 1, "one open target");

        check(ch.breaker().allow("http://other.local/cb"), "other targets unaffected");

        ch.breaker().reset("http://down.local/cb");
        check(ch.breaker().allow("http://down.local/cb"), "reset re-enables the target");
        try {
            ch.deliver(task);
        } catch (const sg::NotificationChannelError&) {
        }
        check(calls == 11, "request sent again after reset");
    }

    void test_success_clears_failure_streak() {
        bool fail = true;
        sg::CallbackChannel ch([&](const std::string&, const std::string&, std::string& err) {
            if (fail) err = "HTTP 500";
            return !fail;
        });
        const auto task = task_for("http://flaky.local/cb");
        for (int i = 0; i < 5; ++i) {
            try {
                ch.deliver(task);
            } catch (const sg::NotificationChannelError&) {
            }
        }
        check(ch.breaker().failures("http://flaky.local/cb") == 5, "five failures counted");
        fail = false;
        ch.deliver(task);
        check(ch.breaker().failures("http://flaky.local/cb") == 0, "success resets the streak");
    }

    void test_callback_without_url_is_skipped() {
        int calls = 0;
        sg::CallbackChannel ch([&](const std::string&, const std::string&, std::string&) {
            ++calls;
            return true;
        });
        check(!ch.deliver(task_for("")), "callback without a url reports a skip");
        check(calls == 0, "no request without a callback url");
        check(ch.deliver(task_for("http://cb.local/alarm")), "callback with a url reports delivery");
    }

    void test_skipped_callback_not_counted_as_delivered() {
        int calls = 0;
        sg::NotificationDispatcher d(4, 1);
        d.add_channel(std::make_shared<sg::CallbackChannel>(
            [&](const std::string&, const std::string&, std::string&) {
                ++calls;
                return true;
            }));
        d.start();
        d.submit(rule_with({sg::ChannelKind::Callback}), event_for(""));
        d.submit(rule_with({sg::ChannelKind::Callback}), event_for("http://cb.local/alarm"));
        d.shutdown();

        const auto st = d.stats();
        check(calls == 1, "only the task with a url was posted");
        check(count_of(st.delivered, sg::ChannelKind::Callback) == 1, "one callback delivered");
        check(count_of(st.skipped, sg::ChannelKind::Callback) == 1, "url-less callback counted as skipped");
        check(count_of(st.failed, sg::ChannelKind::Callback) == 0, "skip is not a failure");
    }

    void test_callback_payload_fields() {
        std::string body;
        sg::CallbackChannel ch([&](const std::string&, const std::string& b, std::string&) {
            body = b;
            return true;
        });
        ch.deliver(task_for("http://cb.local/alarm"));
        check(body.find("\"deviceGbCode\":\"dev1\"") != std::string::npos, "payload has the device");
        check(body.find("\"alarmTime\":\"2025-01-10 12:00:00\"") != std::string::npos, "payload has the time");
        check(body.find("\"level\":\"high\"") != std::string::npos, "payload has the level");
        check(body.find("\"pic\":\"http://media/x.jpg\"") != std::string::npos, "payload has the picture");
    }

    void test_bus_channel_publishes_platform_message() {
        auto pub = std::make_shared<FakePublisher>();
        sg::BusChannel bus(pub, "sceneguard/alarms");
        sg::NotificationTask t = task_for("");
        bus.deliver(t);
        check(pub->last_topic == "sceneguard/alarms", "published to configured topic");
        check(pub->last_payload ==
                  R"({"scene":"s1","deviceGbCode":"dev1","alarmTime":"2025-01-10 12:00:00","pic":"http://media/x.jpg","record":""})",
              "bus payload layout");

        pub->ok = false;
        bool threw = false;
        try {
            bus.deliver(t);
        } catch (const sg::NotificationChannelError&) {
            threw = true;
        }
        check(threw, "publish failure surfaces as NotificationChannelError");
    }

    void test_log_channel_line() {
        std::ostringstream out;
        sg::LogChannel log(out);
        log.deliver(task_for(""));
        const std::string line = out.str();
        check(line.find("[ALARM]") == 0, "alarm line prefix");
        check(line.find("rule=r1") != std::string::npos, "alarm line names the rule");
        check(line.find("class=fire") != std::string::npos, "alarm line names the class");
        check(log.written() == 1, "written counter");
    }

    void test_json_escape() {
        check(sg::json_escape("a\"b\\c\n") == "a\\\"b\\\\c\\n", "quotes, backslashes and newlines escaped");
    }
}

int main() {
    test_channel_failure_is_isolated();
    test_full_queue_drops_new_tasks();
    test_shutdown_drains_in_flight_work();
    test_unconfigured_channel_is_skipped();
    test_circuit_breaker_opens_after_ten_failures();
    test_success_clears_failure_streak();
    test_callback_without_url_is_skipped();
    test_skipped_callback_not_counted_as_delivered();
    test_callback_payload_fields();
    test_bus_channel_publishes_platform_message();
    test_log_channel_line();
    test_json_escape();

    return sgtest::finish("dispatcher");
}
