// One-shot delayed callbacks advanced by the owning loop's time step.
#pragma once

#include <cstdint>
#include <functional>
#include <vector>

#include "Time.h"

namespace Engine {

using TaskId = std::uint32_t;
constexpr TaskId kInvalidTask = 0;

class DeferredTaskQueue {
public:
    TaskId schedule(double delaySeconds, std::function<void()> fn);
    bool cancel(TaskId id);
    bool isPending(TaskId id) const;
    void clear() { tasks_.clear(); }
    std::size_t pendingCount() const { return tasks_.size(); }

    // Runs every task whose delay has elapsed; returns how many fired.
    int update(const TimeStep& step);

private:
    struct Task {
        TaskId id{kInvalidTask};
        double remaining{0.0};
        std::function<void()> fn;
    };

    std::vector<Task> tasks_;
    TaskId nextId_{1};
};

}  // namespace Engine
