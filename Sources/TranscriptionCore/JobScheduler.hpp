#pragma once

#include "TaskRunner.hpp"
#include "TranscriptionJob.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>

namespace vnt {

/// Turns "a clip was recorded" into a deferred TranscriptionJob.
///
/// schedule() does nothing without consent.  With consent it creates the
/// pending stats record right away (size and duration captured now) and
/// submits a uniquely named task, so repeated calls for the same clip never
/// produce a second record or a second queued task.
///
/// Runs for the same (entity, clip) pair are serialised; different pairs run
/// independently.  schedule() never waits for a run: a pair that is queued
/// or running is already covered and the call returns at once.
class JobScheduler {
public:
    /// `job` and `runner` must outlive the scheduler.
    JobScheduler(const TranscriptionJob& job,
                 TaskRunner& runner,
                 TaskConstraints constraints);

    /// Returns true if the clip is queued (now or by an earlier call).
    bool schedule(int64_t entity_id, const std::string& audio_path, bool consent_granted);

    /// Remove the queued task for this clip.  The pending record stays.
    bool cancel(int64_t entity_id, const std::string& audio_path);

    bool is_scheduled(int64_t entity_id, const std::string& audio_path) const;

    /// Run the job for a pair on the calling thread, serialised against any
    /// queued run of the same pair.
    JobOutcome run_serialised(const TranscriptionRequest& request,
                              const DeviceInfo& device,
                              const CancellationToken& cancel);

    /// "audio_transcription_<entity>_<hash of path>"
    static std::string work_name(int64_t entity_id, const std::string& audio_path);

    const TaskConstraints& constraints() const { return constraints_; }

private:
    std::shared_ptr<std::mutex> pair_lock(const std::string& name);
    bool is_in_flight(const std::string& name) const;

    const TranscriptionJob& job_;
    TaskRunner&             runner_;
    TaskConstraints         constraints_;

    std::mutex                                        locks_mu_;
    std::map<std::string, std::weak_ptr<std::mutex>>  pair_locks_;

    // Guards the pending-record step of schedule() and in_flight_.  Never
    // held across a run.
    mutable std::mutex                                schedule_mu_;
    std::multiset<std::string>                        in_flight_;
};

} // namespace vnt
