#pragma once

#include "PipelineConfig.hpp"

#include <string>

namespace vnt {

/// Loads and saves PipelineConfig as JSON.
class ConfigLoader {
public:
    /// Read `path`.  A missing file yields the defaults; a malformed file
    /// yields the defaults and logs an error.  Unknown keys are ignored and
    /// absent keys keep their default value.
    static PipelineConfig load(const std::string& path);

    /// Parse a JSON document held in memory.
    static PipelineConfig parse(const std::string& json_text);

    /// Write `config` to `path`, pretty-printed.  Returns false on I/O error.
    static bool save(const std::string& path, const PipelineConfig& config);
};

} // namespace vnt
