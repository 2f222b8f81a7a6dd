#pragma once

#include "viewport/fps_sampler.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace clubnet {

/// Cancel handle of a scheduled task. Copies share the same task;
/// a default-constructed handle refers to nothing.
class TaskHandle {
public:
    TaskHandle() = default;

    void cancel() {
        if (cancelled_) *cancelled_ = true;
    }

    bool active() const { return cancelled_ && !*cancelled_; }

private:
    friend class TaskScheduler;
    explicit TaskHandle(std::shared_ptr<bool> cancelled) : cancelled_(std::move(cancelled)) {}

    std::shared_ptr<bool> cancelled_;
};

// ─── Task Scheduler ────────────────────────────────────────────
// Recurring tasks driven by the host's timer or frame callback.
// A task runs on the first tick at or after its due time and is then
// due one interval after that tick, so late or irregular ticks never
// cause catch-up bursts.

class TaskScheduler {
public:
    using Task = std::function<void(TimePoint now)>;

    TaskHandle scheduleRecurring(const std::string& name, std::chrono::milliseconds interval,
                                 Task task, TimePoint now);

    /// Run every due task. Returns the number of tasks run.
    size_t tick(TimePoint now);

    /// Cancel every task. Idempotent.
    void cancelAll();

    /// Tasks not yet cancelled.
    size_t activeCount() const;

private:
    struct Entry {
        std::string name;
        std::chrono::milliseconds interval;
        TimePoint next_due;
        Task task;
        std::shared_ptr<bool> cancelled;
    };

    std::vector<Entry> entries_;
};

} // namespace clubnet
