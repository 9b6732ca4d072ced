#pragma once

#include <notify/channel.hpp>

#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace sg {
    // Posts body to url. Returns false and fills err on failure.
    using HttpPoster = std::function<bool(const std::string& url, const std::string& body, std::string& err)>;

    // cpp-httplib poster with connect/read timeouts.
    HttpPoster make_http_poster(int timeout_s);

    // Consecutive failure tracking per target. Every warn_every-th failure is
    // logged as a warning; reaching threshold opens the circuit until reset().
    class CircuitBreaker {
    public:
        explicit CircuitBreaker(int threshold = 10, int warn_every = 3);

        bool allow(const std::string& target) const;
        void record_success(const std::string& target);
        // Returns the consecutive failure count after this failure.
        int record_failure(const std::string& target, const std::string& reason);
        void reset(const std::string& target);

        int failures(const std::string& target) const;
        std::vector<std::string> open_targets() const;

    private:
        struct TargetState {
            int consecutive = 0;
            bool open = false;
        };

        int threshold_;
        int warn_every_;
        mutable std::mutex mtx_;
        std::unordered_map<std::string, TargetState> targets_;
    };

    class CallbackChannel : public INotificationChannel {
    public:
        CallbackChannel(HttpPoster poster, int failure_threshold = 10, int warn_every = 3);

        ChannelKind kind() const override { return ChannelKind::Callback; }
        // Events without a callback url are skipped silently.
        bool deliver(const NotificationTask& task) override;

        CircuitBreaker& breaker() { return breaker_; }

    private:
        HttpPoster poster_;
        CircuitBreaker breaker_;
    };
}
