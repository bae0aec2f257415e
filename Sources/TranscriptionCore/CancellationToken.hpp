#pragma once

#include <atomic>

namespace vnt {

/// Cooperative cancellation flag shared between a task runner and a running
/// task.  The task polls it between steps.
class CancellationToken {
public:
    void cancel() { cancelled_.store(true); }
    void reset() { cancelled_.store(false); }
    bool is_cancelled() const { return cancelled_.load(); }

private:
    std::atomic<bool> cancelled_{false};
};

} // namespace vnt
