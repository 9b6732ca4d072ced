#pragma once

#include <condition_variable>
#include <deque>
#include <chrono>
#include <mutex>

namespace sg {
    // Fixed-capacity MPMC queue. After close() producers are rejected while
    // consumers keep draining what is left.
    template <class T>
    class BoundedQueue {
    public:
        explicit BoundedQueue(size_t capacity) : cap_(capacity) {}

        // Rejects the new item when full.
        bool try_push(T v) {
            {
                std::lock_guard lk(m_);
                if (closed_ || q_.size() >= cap_) return false;
                q_.push_back(std::move(v));
            }
            cv_.notify_one();
            return true;
        }

        bool try_pop(T& out) {
            std::lock_guard lk(m_);
            if (q_.empty()) return false;
            out = std::move(q_.front());
            q_.pop_front();
            return true;
        }

        // False on timeout, or when closed and empty.
        bool pop_for(T& out, std::chrono::milliseconds d) {
            std::unique_lock lk(m_);
            if (!cv_.wait_for(lk, d, [&]{ return closed_ || !q_.empty(); })) return false;
            if (q_.empty()) return false;
            out = std::move(q_.front());
            q_.pop_front();
            return true;
        }

        void close() {
            {
                std::lock_guard lk(m_);
                closed_ = true;
            }
            cv_.notify_all();
        }

        bool closed() const {
            std::lock_guard lk(m_);
            return closed_;
        }

        size_t size() const {
            std::lock_guard lk(m_);
            return q_.size();
        }

        size_t capacity() const { return cap_; }
    private:
        size_t cap_;
        mutable std::mutex m_;
        std::condition_variable cv_;
        std::deque<T> q_;
        bool closed_ = false;
    };
}
