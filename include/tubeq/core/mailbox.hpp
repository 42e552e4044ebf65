// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <algorithm>
#include <cstddef>
#include <deque>
#include <mutex>
#include <utility>

namespace tubeq::core {

// Many producers, one consumer. Workers post immutable messages; the control
// thread drains a bounded batch per tick.
template<typename T>
class Mailbox {
public:
    Mailbox() = default;

    Mailbox(const Mailbox&) = delete;
    Mailbox& operator=(const Mailbox&) = delete;

    void post(T message) {
        std::lock_guard<std::mutex> lock(mutex_);
        queue_.push_back(std::move(message));
    }

    // Hand at most `max` messages to `fn`, oldest first. Messages are moved
    // out under the lock and delivered without it, so `fn` may post again.
    template<typename Fn>
    std::size_t drain(std::size_t max, Fn&& fn) {
        std::deque<T> batch;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            const auto n = std::min(max, queue_.size());
            for (std::size_t i = 0; i < n; ++i) {
                batch.push_back(std::move(queue_.front()));
                queue_.pop_front();
            }
        }
        for (auto& message : batch) {
            fn(std::move(message));
        }
        return batch.size();
    }

    [[nodiscard]] bool empty() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.empty();
    }

    [[nodiscard]] std::size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

private:
    std::deque<T> queue_;
    mutable std::mutex mutex_;
};

} // namespace tubeq::core
