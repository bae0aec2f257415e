#pragma once

#include "TaskRunner.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace vnt {

/// Background worker pool for deferred, constraint-gated tasks.
///
/// A task becomes eligible once its initial delay has elapsed and the latest
/// device snapshot (see update_device_state) satisfies its constraints.
/// Eligible tasks run in submission order.  If the device stops satisfying a
/// running task's constraints, its cancellation token is raised and the task
/// goes back to the queue to resume when conditions return.
///
/// Starts with a default DeviceInfo (not charging), so nothing that requires
/// charging runs until the host reports device state.
class ConstrainedWorkQueue : public TaskRunner {
public:
    /// @param retry_delay  Wait before re-running a task that returned retry.
    explicit ConstrainedWorkQueue(size_t num_threads = 1,
                                  std::chrono::milliseconds retry_delay = std::chrono::seconds(30));
    ~ConstrainedWorkQueue() override;

    // Non-copyable, non-movable
    ConstrainedWorkQueue(const ConstrainedWorkQueue&) = delete;
    ConstrainedWorkQueue& operator=(const ConstrainedWorkQueue&) = delete;

    /// Start the worker threads.
    void start();

    /// Signal running tasks, wait for the workers and drop queued tasks.
    void stop();

    bool is_running() const { return running_; }

    /// Publish a new device snapshot.  Wakes workers and preempts running
    /// tasks whose constraints no longer hold.
    void update_device_state(const DeviceInfo& device);

    DeviceInfo device_state() const;

    bool submit_unique(const std::string& name,
                       const TaskConstraints& constraints,
                       DeferredTask task) override;

    bool cancel(const std::string& name) override;

    bool is_scheduled(const std::string& name) const override;

    size_t queued_count() const;
    size_t running_count() const;

    /// Block until no task is queued or running, or `timeout` passes.
    /// Returns true if idle.
    bool wait_until_idle(std::chrono::milliseconds timeout) const;

private:
    using Clock = std::chrono::steady_clock;

    struct Entry {
        TaskConstraints                    constraints;
        DeferredTask                       task;
        Clock::time_point                  ready_at;
        uint64_t                           sequence = 0;
        std::shared_ptr<CancellationToken> token;
        bool                               running   = false;
        bool                               preempted = false;   // constraints lapsed mid-run
        bool                               removed   = false;   // cancel() while running
    };

    void worker_loop();

    /// Name of the next eligible task, or empty.  Sets `next_wake` to the
    /// earliest future ready time when nothing is eligible.  Expects mu_ held.
    std::string next_eligible_locked(Clock::time_point now,
                                     Clock::time_point& next_wake) const;

    size_t                       num_threads_;
    std::chrono::milliseconds    retry_delay_;
    std::vector<std::thread>     workers_;
    std::atomic<bool>            running_{false};

    mutable std::mutex              mu_;
    std::condition_variable         cv_;
    mutable std::condition_variable idle_cv_;
    std::map<std::string, Entry>    entries_;
    DeviceInfo                      device_;
    uint64_t                        next_sequence_ = 0;
};

} // namespace vnt
