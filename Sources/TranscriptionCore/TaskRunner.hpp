#pragma once

#include "CancellationToken.hpp"
#include "Types.hpp"

#include <chrono>
#include <functional>
#include <string>

namespace vnt {

/// Device conditions a deferred task waits for.
struct TaskConstraints {
    bool                      requires_charging        = true;
    bool                      requires_battery_not_low = true;
    std::chrono::milliseconds initial_delay{0};
};

/// Whether `device` currently satisfies `constraints` (initial delay aside).
inline bool constraints_satisfied(const TaskConstraints& constraints,
                                  const DeviceInfo& device) {
    if (constraints.requires_charging && !device.charging) return false;
    if (constraints.requires_battery_not_low && device.battery_low) return false;
    return true;
}

enum class TaskStatus {
    done,    // finished, successfully or not; drop it
    retry    // run again later
};

/// Body of a deferred task.  Receives the device snapshot it was started
/// under and a token that is raised if the runner wants it to stop.
using DeferredTask =
    std::function<TaskStatus(const DeviceInfo& device, const CancellationToken& cancel)>;

/// Executes uniquely named tasks in the background once their constraints
/// hold.
class TaskRunner {
public:
    virtual ~TaskRunner() = default;

    /// Enqueue `task` under `name`.  If a task with that name is already
    /// queued or running, the existing one is kept and false is returned.
    virtual bool submit_unique(const std::string& name,
                               const TaskConstraints& constraints,
                               DeferredTask task) = 0;

    /// Drop a queued task or signal a running one.  False if unknown.
    virtual bool cancel(const std::string& name) = 0;

    /// Whether a task with `name` is queued or running.
    virtual bool is_scheduled(const std::string& name) const = 0;
};

} // namespace vnt
