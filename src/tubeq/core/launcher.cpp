// Copyright (c) 2026 changcheng967. All rights reserved.

#include <tubeq/core/launcher.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <exception>

namespace tubeq::core {

ThreadLauncher::~ThreadLauncher() {
    std::vector<Worker> workers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        workers.swap(workers_);
    }
    // jthread destructors join
    workers.clear();
}

void ThreadLauncher::launch(Task task) {
    reap();

    auto done = std::make_shared<std::atomic<bool>>(false);
    std::jthread thread([task = std::move(task), done]() {
        try {
            task();
        } catch (const std::exception& e) {
            spdlog::error("Background task failed: {}", e.what());
        }
        done->store(true, std::memory_order_release);
    });

    std::lock_guard<std::mutex> lock(mutex_);
    workers_.push_back({std::move(done), std::move(thread)});
}

std::size_t ThreadLauncher::running() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<std::size_t>(std::ranges::count_if(workers_, [](const Worker& w) {
        return !w.done->load(std::memory_order_acquire);
    }));
}

void ThreadLauncher::reap() noexcept {
    std::vector<Worker> finished;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<Worker> alive;
        alive.reserve(workers_.size());
        for (auto& w : workers_) {
            if (w.done->load(std::memory_order_acquire)) {
                finished.push_back(std::move(w));
            } else {
                alive.push_back(std::move(w));
            }
        }
        workers_.swap(alive);
    }
    // Joined outside the lock
    finished.clear();
}

} // namespace tubeq::core
