#pragma once

#include <filesystem>
#include <string>
#include <string_view>

#include "telemux/core/error.hpp"
#include "telemux/core/recording/session.hpp"
#include "telemux/core/stream/descriptor.hpp"

namespace telemux::core::recording {

/*
===============================================================================
Recording metadata document (metadata.json)
===============================================================================

Written twice per recording:

  start : {"recording": {id, label, startedAt, startedAtIso, downsample},
           "stream":    <descriptor>,
           "backend":   {telemux, platform, compiler, cplusplus, discovery}}

  stop  : the document on disk is reloaded and its "recording" block gains
          stoppedAt, stoppedAtIso, durationSeconds, sampleCount and format.
          Every other member is carried over untouched.

Both writes go through write_file_atomic().
===============================================================================
*/

struct BackendInfo {
    std::string telemux;
    std::string platform;
    std::string compiler;
    long        cplusplus{0};
    std::string discovery;
};

// Build / host identification; `discovery_version` comes from the source
[[nodiscard]]
BackendInfo collect_backend_info(std::string discovery_version);

[[nodiscard]]
std::string make_initial_metadata(const Session& s, const stream::Descriptor& d, const BackendInfo& backend);

// Merges the stop fields of `s` into `existing`. When `existing` is not a
// JSON object the result holds only the recording block.
[[nodiscard]]
std::string make_final_metadata(std::string_view existing, const Session& s);

// Reloads s.metadata_path (falling back to `initial_document` when it cannot
// be read) and atomically rewrites it with the stop fields.
[[nodiscard]]
Error write_final_metadata(const Session& s, std::string_view initial_document);

} // namespace telemux::core::recording
