#include "DeferredTasks.h"

#include <algorithm>
#include <iterator>

namespace Engine {

TaskId DeferredTaskQueue::schedule(double delaySeconds, std::function<void()> fn) {
    if (!fn) return kInvalidTask;
    Task t;
    t.id = nextId_++;
    t.remaining = std::max(0.0, delaySeconds);
    t.fn = std::move(fn);
    tasks_.push_back(std::move(t));
    return tasks_.back().id;
}

bool DeferredTaskQueue::cancel(TaskId id) {
    auto it = std::find_if(tasks_.begin(), tasks_.end(), [id](const Task& t) { return t.id == id; });
    if (it == tasks_.end()) return false;
    tasks_.erase(it);
    return true;
}

bool DeferredTaskQueue::isPending(TaskId id) const {
    return std::any_of(tasks_.begin(), tasks_.end(), [id](const Task& t) { return t.id == id; });
}

int DeferredTaskQueue::update(const TimeStep& step) {
    std::vector<Task> due;
    for (auto& t : tasks_) {
        t.remaining -= step.deltaSeconds;
    }
    auto split = std::stable_partition(tasks_.begin(), tasks_.end(), [](const Task& t) { return t.remaining > 0.0; });
    std::move(split, tasks_.end(), std::back_inserter(due));
    tasks_.erase(split, tasks_.end());

    // A callback may schedule or cancel tasks; the due list is already detached.
    for (auto& t : due) {
        t.fn();
    }
    return static_cast<int>(due.size());
}

}  // namespace Engine
