// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace tubeq::core {

// Runs background work. Workers talk back only through mailboxes.
class Launcher {
public:
    using Task = std::function<void()>;

    virtual ~Launcher() = default;

    virtual void launch(Task task) = 0;
};

// One std::jthread per task. Finished threads are reaped on the next launch,
// the rest are joined on destruction. Superseded work runs to completion.
class ThreadLauncher final : public Launcher {
public:
    ThreadLauncher() = default;
    ~ThreadLauncher() override;

    ThreadLauncher(const ThreadLauncher&) = delete;
    ThreadLauncher& operator=(const ThreadLauncher&) = delete;

    void launch(Task task) override;

    [[nodiscard]] std::size_t running() const noexcept;

private:
    struct Worker {
        std::shared_ptr<std::atomic<bool>> done;
        std::jthread thread;
    };

    void reap() noexcept;

    std::vector<Worker> workers_;
    mutable std::mutex mutex_;
};

} // namespace tubeq::core
