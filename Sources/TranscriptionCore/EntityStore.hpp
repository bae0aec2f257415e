#pragma once

#include <cstdint>
#include <string>

namespace vnt {

/// The records voice notes are attached to.  The pipeline only checks
/// existence and writes the finished transcript back.
class EntityStore {
public:
    virtual ~EntityStore() = default;

    virtual bool entity_exists(int64_t entity_id) const = 0;

    /// Store the transcript and its language on the entity.
    virtual bool update_transcript(int64_t entity_id,
                                   const std::string& text,
                                   const std::string& language_code) = 0;
};

} // namespace vnt
