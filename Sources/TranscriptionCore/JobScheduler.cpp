#include "JobScheduler.hpp"

#include "Logger.hpp"

#include <functional>
#include <set>
#include <utility>

namespace vnt {

JobScheduler::JobScheduler(const TranscriptionJob& job,
                           TaskRunner& runner,
                           TaskConstraints constraints)
    : job_(job), runner_(runner), constraints_(constraints) {}

std::string JobScheduler::work_name(int64_t entity_id, const std::string& audio_path) {
    return "audio_transcription_" + std::to_string(entity_id) + "_"
         + std::to_string(std::hash<std::string>{}(audio_path));
}

// ---------------------------------------------------------------------------
// schedule
// ---------------------------------------------------------------------------

bool JobScheduler::schedule(int64_t entity_id,
                            const std::string& audio_path,
                            bool consent_granted) {
    if (!consent_granted) {
        Logger::debug("[JobScheduler] Transcription consent not granted, skipping entity "
                      + std::to_string(entity_id));
        return false;
    }
    if (!job_.can_accept(entity_id, audio_path)) {
        Logger::warn("[JobScheduler] Invalid request: entity " + std::to_string(entity_id)
                     + ", path '" + audio_path + "'");
        return false;
    }

    const std::string name = work_name(entity_id, audio_path);

    std::lock_guard<std::mutex> guard(schedule_mu_);
    if (runner_.is_scheduled(name) || in_flight_.count(name) > 0) {
        Logger::debug("[JobScheduler] Transcription already queued or running: " + name);
        return true;
    }

    // Pending record first, so it exists before the task can possibly run.
    if (!job_.reconcile_pending(entity_id, audio_path)) {
        Logger::error("[JobScheduler] Could not create pending record for " + name);
        return false;
    }

    TranscriptionRequest request;
    request.entity_id       = entity_id;
    request.audio_path      = audio_path;
    request.consent_granted = true;

    const bool submitted = runner_.submit_unique(
        name, constraints_,
        [this, request](const DeviceInfo& device, const CancellationToken& cancel) {
            JobOutcome outcome = run_serialised(request, device, cancel);
            return outcome.kind == JobOutcome::Kind::cancelled ? TaskStatus::retry
                                                               : TaskStatus::done;
        });

    if (submitted) {
        Logger::info("[JobScheduler] Scheduled transcription for entity "
                     + std::to_string(entity_id) + " (" + name + ")");
    } else {
        Logger::debug("[JobScheduler] Transcription already queued: " + name);
    }
    return true;
}

bool JobScheduler::cancel(int64_t entity_id, const std::string& audio_path) {
    const std::string name = work_name(entity_id, audio_path);
    const bool cancelled = runner_.cancel(name);
    if (cancelled) {
        Logger::info("[JobScheduler] Cancelled " + name);
    }
    return cancelled;
}

bool JobScheduler::is_scheduled(int64_t entity_id, const std::string& audio_path) const {
    const std::string name = work_name(entity_id, audio_path);
    return runner_.is_scheduled(name) || is_in_flight(name);
}

// ---------------------------------------------------------------------------
// run_serialised
// ---------------------------------------------------------------------------

namespace {

/// Keeps a work name in the in-flight set for the lifetime of a run.
class InFlightMark {
public:
    InFlightMark(std::mutex& mu, std::multiset<std::string>& names, std::string name)
        : mu_(mu), names_(names), name_(std::move(name)) {
        std::lock_guard<std::mutex> lock(mu_);
        names_.insert(name_);
    }
    ~InFlightMark() {
        std::lock_guard<std::mutex> lock(mu_);
        auto it = names_.find(name_);
        if (it != names_.end()) names_.erase(it);
    }

private:
    std::mutex&                 mu_;
    std::multiset<std::string>& names_;
    std::string                 name_;
};

} // namespace

JobOutcome JobScheduler::run_serialised(const TranscriptionRequest& request,
                                        const DeviceInfo& device,
                                        const CancellationToken& cancel) {
    const std::string name = work_name(request.entity_id, request.audio_path);
    InFlightMark mark(schedule_mu_, in_flight_, name);

    std::shared_ptr<std::mutex> lock = pair_lock(name);
    std::lock_guard<std::mutex> guard(*lock);
    return job_.run(request, device, cancel);
}

bool JobScheduler::is_in_flight(const std::string& name) const {
    std::lock_guard<std::mutex> lock(schedule_mu_);
    return in_flight_.count(name) > 0;
}

std::shared_ptr<std::mutex> JobScheduler::pair_lock(const std::string& name) {
    std::lock_guard<std::mutex> lock(locks_mu_);

    // Drop locks nobody holds any more.
    for (auto it = pair_locks_.begin(); it != pair_locks_.end();) {
        if (it->second.expired()) it = pair_locks_.erase(it);
        else ++it;
    }

    std::shared_ptr<std::mutex> m = pair_locks_[name].lock();
    if (!m) {
        m = std::make_shared<std::mutex>();
        pair_locks_[name] = m;
    }
    return m;
}

} // namespace vnt
