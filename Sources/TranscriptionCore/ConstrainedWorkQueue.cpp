#include "ConstrainedWorkQueue.hpp"

#include "Logger.hpp"

#include <exception>

namespace vnt {

ConstrainedWorkQueue::ConstrainedWorkQueue(size_t num_threads,
                                           std::chrono::milliseconds retry_delay)
    : num_threads_(num_threads), retry_delay_(retry_delay) {
    if (num_threads_ == 0) {
        num_threads_ = 1; // Ensure at least one thread
    }
}

ConstrainedWorkQueue::~ConstrainedWorkQueue() {
    stop();
}

// ---------------------------------------------------------------------------
// start / stop
// ---------------------------------------------------------------------------

void ConstrainedWorkQueue::start() {
    if (running_) {
        return;
    }
    running_ = true;

    workers_.reserve(num_threads_);
    for (size_t i = 0; i < num_threads_; ++i) {
        workers_.emplace_back(&ConstrainedWorkQueue::worker_loop, this);
    }
}

void ConstrainedWorkQueue::stop() {
    {
        std::lock_guard<std::mutex> lock(mu_);
        if (!running_ && workers_.empty()) {
            return;
        }
        running_ = false;
        for (auto& kv : entries_) {
            if (kv.second.running) kv.second.token->cancel();
        }
    }
    cv_.notify_all();

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();

    {
        std::lock_guard<std::mutex> lock(mu_);
        if (!entries_.empty()) {
            Logger::info("[ConstrainedWorkQueue] Dropping " + std::to_string(entries_.size())
                         + " queued task(s) on shutdown");
        }
        entries_.clear();
    }
    idle_cv_.notify_all();
}

// ---------------------------------------------------------------------------
// Device state
// ---------------------------------------------------------------------------

void ConstrainedWorkQueue::update_device_state(const DeviceInfo& device) {
    {
        std::lock_guard<std::mutex> lock(mu_);
        device_ = device;
        for (auto& kv : entries_) {
            Entry& e = kv.second;
            if (e.running && !constraints_satisfied(e.constraints, device_)) {
                Logger::info("[ConstrainedWorkQueue] Constraints no longer met, stopping " + kv.first);
                e.preempted = true;
                e.token->cancel();
            }
        }
    }
    cv_.notify_all();
}

DeviceInfo ConstrainedWorkQueue::device_state() const {
    std::lock_guard<std::mutex> lock(mu_);
    return device_;
}

// ---------------------------------------------------------------------------
// submit_unique / cancel
// ---------------------------------------------------------------------------

bool ConstrainedWorkQueue::submit_unique(const std::string& name,
                                         const TaskConstraints& constraints,
                                         DeferredTask task) {
    if (!task) {
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(mu_);
        if (entries_.count(name)) {
            Logger::debug("[ConstrainedWorkQueue] Keeping existing task " + name);
            return false;
        }

        Entry e;
        e.constraints = constraints;
        e.task        = std::move(task);
        e.ready_at    = Clock::now() + constraints.initial_delay;
        e.sequence    = next_sequence_++;
        e.token       = std::make_shared<CancellationToken>();
        entries_.emplace(name, std::move(e));
    }
    cv_.notify_one();
    return true;
}

bool ConstrainedWorkQueue::cancel(const std::string& name) {
    {
        std::lock_guard<std::mutex> lock(mu_);
        auto it = entries_.find(name);
        if (it == entries_.end()) {
            return false;
        }
        if (it->second.running) {
            it->second.removed = true;
            it->second.token->cancel();
            return true;
        }
        entries_.erase(it);
    }
    idle_cv_.notify_all();
    return true;
}

bool ConstrainedWorkQueue::is_scheduled(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mu_);
    return entries_.count(name) > 0;
}

size_t ConstrainedWorkQueue::queued_count() const {
    std::lock_guard<std::mutex> lock(mu_);
    size_t n = 0;
    for (const auto& kv : entries_) {
        if (!kv.second.running) ++n;
    }
    return n;
}

size_t ConstrainedWorkQueue::running_count() const {
    std::lock_guard<std::mutex> lock(mu_);
    size_t n = 0;
    for (const auto& kv : entries_) {
        if (kv.second.running) ++n;
    }
    return n;
}

bool ConstrainedWorkQueue::wait_until_idle(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(mu_);
    return idle_cv_.wait_for(lock, timeout, [this] { return entries_.empty(); });
}

// ---------------------------------------------------------------------------
// Worker
// ---------------------------------------------------------------------------

std::string ConstrainedWorkQueue::next_eligible_locked(Clock::time_point now,
                                                       Clock::time_point& next_wake) const {
    std::string best;
    uint64_t best_sequence = 0;

    for (const auto& kv : entries_) {
        const Entry& e = kv.second;
        if (e.running || !constraints_satisfied(e.constraints, device_)) {
            continue;
        }
        if (e.ready_at > now) {
            if (e.ready_at < next_wake) next_wake = e.ready_at;
            continue;
        }
        if (best.empty() || e.sequence < best_sequence) {
            best = kv.first;
            best_sequence = e.sequence;
        }
    }
    return best;
}

void ConstrainedWorkQueue::worker_loop() {
    std::unique_lock<std::mutex> lock(mu_);

    while (running_) {
        Clock::time_point next_wake = Clock::time_point::max();
        const std::string name = next_eligible_locked(Clock::now(), next_wake);

        if (name.empty()) {
            if (next_wake == Clock::time_point::max()) {
                cv_.wait(lock);
            } else {
                cv_.wait_until(lock, next_wake);
            }
            continue;
        }

        Entry& entry = entries_.at(name);
        entry.running   = true;
        entry.preempted = false;
        entry.token     = std::make_shared<CancellationToken>();

        DeferredTask task = entry.task;
        std::shared_ptr<CancellationToken> token = entry.token;
        const DeviceInfo device = device_;

        lock.unlock();

        TaskStatus status = TaskStatus::done;
        try {
            status = task(device, *token);
        } catch (const std::exception& e) {
            Logger::error("[ConstrainedWorkQueue] Task " + name + " threw: " + e.what());
            status = TaskStatus::done;
        } catch (...) {
            Logger::error("[ConstrainedWorkQueue] Task " + name + " threw a non-standard exception");
            status = TaskStatus::done;
        }

        lock.lock();

        auto it = entries_.find(name);
        if (it == entries_.end()) {
            continue;
        }
        Entry& finished = it->second;
        finished.running = false;

        if (finished.removed || status == TaskStatus::done) {
            entries_.erase(it);
            idle_cv_.notify_all();
            continue;
        }

        // Preempted tasks resume as soon as constraints hold again.
        finished.ready_at = finished.preempted ? Clock::now() : Clock::now() + retry_delay_;
        Logger::debug("[ConstrainedWorkQueue] Requeued " + name);
        cv_.notify_all();
    }
}

} // namespace vnt
