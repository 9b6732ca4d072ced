#include <notify/callback_channel.hpp>
#include <notify/payload.hpp>
#include <common/errors.hpp>

#include <httplib.h>
#include <iostream>

namespace sg {
    HttpPoster make_http_poster(int timeout_s) {
        return [timeout_s](const std::string& url, const std::string& body, std::string& err) {
            // split "scheme://host[:port]" from the path
            const size_t scheme_end = url.find("://");
            const size_t path_start = url.find('/', scheme_end == std::string::npos ? 0 : scheme_end + 3);
            const std::string origin = path_start == std::string::npos ? url : url.substr(0, path_start);
            const std::string path = path_start == std::string::npos ? "/" : url.substr(path_start);

            httplib::Client cli(origin);
            cli.set_connection_timeout(timeout_s, 0);
            cli.set_read_timeout(timeout_s, 0);
            cli.set_write_timeout(timeout_s, 0);

            auto res = cli.Post(path.c_str(), body, "application/json");
            if (!res) {
                err = httplib::to_string(res.error());
                return false;
            }
            if (res->status < 200 || res->status >= 300) {
                err = "HTTP " + std::to_string(res->status);
                return false;
            }
            return true;
        };
    }

    CircuitBreaker::CircuitBreaker(int threshold, int warn_every)
        : threshold_(threshold < 1 ? 1 : threshold), warn_every_(warn_every < 1 ? 1 : warn_every) {}

    bool CircuitBreaker::allow(const std::string& target) const {
        std::lock_guard lk(mtx_);
        auto it = targets_.find(target);
        return it == targets_.end() || !it->second.open;
    }

    void CircuitBreaker::record_success(const std::string& target) {
        std::lock_guard lk(mtx_);
        auto it = targets_.find(target);
        if (it != targets_.end()) it->second.consecutive = 0;
    }

    int CircuitBreaker::record_failure(const std::string& target, const std::string& reason) {
        std::lock_guard lk(mtx_);
        TargetState& st = targets_[target];
        const int n = ++st.consecutive;
        if (n >= threshold_ && !st.open) {
            st.open = true;
            std::cerr << "[Callback](record_failure) " << target << " failed " << n
                      << " times in a row, disabled until reset: " << reason << "\n";
        } else if (n % warn_every_ == 0) {
            std::cerr << "[Callback](record_failure) " << target << " failed " << n
                      << " times in a row: " << reason << "\n";
        }
        return n;
    }

    void CircuitBreaker::reset(const std::string& target) {
        std::lock_guard lk(mtx_);
        targets_.erase(target);
    }

    int CircuitBreaker::failures(const std::string& target) const {
        std::lock_guard lk(mtx_);
        auto it = targets_.find(target);
        return it == targets_.end() ? 0 : it->second.consecutive;
    }

    std::vector<std::string> CircuitBreaker::open_targets() const {
        std::lock_guard lk(mtx_);
        std::vector<std::string> out;
        for (const auto& kv : targets_) {
            if (kv.second.open) out.push_back(kv.first);
        }
        return out;
    }

    CallbackChannel::CallbackChannel(HttpPoster poster, int failure_threshold, int warn_every)
        : poster_(std::move(poster)), breaker_(failure_threshold, warn_every) {}

    bool CallbackChannel::deliver(const NotificationTask& task) {
        const std::string& url = task.event.target.callback_url;
        if (url.empty()) return false;

        if (!breaker_.allow(url)) {
            throw NotificationChannelError("callback " + url + " disabled after repeated failures");
        }

        std::string err;
        bool ok = false;
        try {
            ok = poster_(url, callback_payload(task), err);
        } catch (const std::exception& e) {
            err = e.what();
        }

        if (!ok) {
            breaker_.record_failure(url, err);
            throw NotificationChannelError("callback " + url + " failed: " + err);
        }
        breaker_.record_success(url);
        return true;
    }
}
