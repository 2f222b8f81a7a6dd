#include "viewport/task_scheduler.hpp"
#include "util/log.hpp"

#include <algorithm>

namespace clubnet {

TaskHandle TaskScheduler::scheduleRecurring(const std::string& name,
                                            std::chrono::milliseconds interval,
                                            Task task, TimePoint now) {
    auto cancelled = std::make_shared<bool>(false);
    entries_.push_back({name, interval, now + interval, std::move(task), cancelled});
    CLUBNET_LOG_DEBUG("scheduled '%s' every %lld ms", name.c_str(),
                      static_cast<long long>(interval.count()));
    return TaskHandle(cancelled);
}

size_t TaskScheduler::tick(TimePoint now) {
    size_t ran = 0;
    // Tasks may schedule more tasks while running; only the ones present
    // at the start of the tick are considered.
    const size_t count = entries_.size();
    for (size_t i = 0; i < count && i < entries_.size(); i++) {
        if (*entries_[i].cancelled || now < entries_[i].next_due) continue;
        entries_[i].next_due = now + entries_[i].interval;
        Task task = entries_[i].task;
        task(now);
        ran++;
    }

    entries_.erase(std::remove_if(entries_.begin(), entries_.end(),
                                  [](const Entry& e) { return *e.cancelled; }),
                   entries_.end());
    return ran;
}

void TaskScheduler::cancelAll() {
    for (auto& e : entries_) *e.cancelled = true;
    entries_.clear();
}

size_t TaskScheduler::activeCount() const {
    return static_cast<size_t>(std::count_if(entries_.begin(), entries_.end(),
                                             [](const Entry& e) { return !*e.cancelled; }));
}

} // namespace clubnet
