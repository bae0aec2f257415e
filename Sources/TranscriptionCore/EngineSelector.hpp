#pragma once

#include "LanguageIdentifier.hpp"
#include "ModelArtifactManager.hpp"
#include "PipelineConfig.hpp"
#include "SpeechEngine.hpp"

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace vnt {

/// Picks the engine a job runs with.  Candidates are tried in order and the
/// first one that reports itself available on the device wins; NoOpEngine
/// is the last resort.  Selection is repeated for every job, so a device that
/// gains Wi-Fi or storage picks up a better engine next time.
class EngineSelector {
public:
    /// Builds an engine bound to the device snapshot it will run under.
    using EngineFactory =
        std::function<std::unique_ptr<SpeechEngine>(const DeviceInfo&)>;

    struct Candidate {
        std::string   engine_id;
        EngineFactory factory;
    };

    explicit EngineSelector(std::vector<Candidate> candidates);

    /// Default priority: remote-cloud (only when an API key is configured),
    /// then whisper-tiny.  `models` must outlive the selector.
    static EngineSelector with_default_engines(
        const PipelineConfig& config,
        ModelArtifactManager& models,
        std::shared_ptr<const LanguageIdentifier> language);

    /// Best available engine for `device`.  Never returns null.
    std::unique_ptr<SpeechEngine> select(const DeviceInfo& device) const;

    /// Engine by identifier, or null if unknown.  "noop" always resolves.
    std::unique_ptr<SpeechEngine> create_by_id(const std::string& engine_id,
                                               const DeviceInfo& device) const;

    /// Identifiers of every candidate available on `device`, in priority order.
    std::vector<std::string> available_engine_ids(const DeviceInfo& device) const;

private:
    std::vector<Candidate> candidates_;
};

} // namespace vnt
