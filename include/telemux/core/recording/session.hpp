#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace lcr::json { class Writer; }

namespace telemux::core::recording {

/*
===============================================================================
 recording::Session
===============================================================================

Value snapshot of one recording, taken under the manager lock. Callers never
hold a reference into the manager's live state; a snapshot does not change
after it is returned.

JSON rendering:

  {"id","streamUid","streamName","label","startedAt","startedAtIso",
   "stoppedAt","stoppedAtIso","sampleCount","downsample","dir","metadata",
   "data","archive","active"}

Absent stop fields and an empty label render as null.
===============================================================================
*/
struct Session {
    std::string id;
    std::string stream_uid;
    std::string stream_name;
    std::string label;

    std::filesystem::path dir;
    std::filesystem::path metadata_path;
    std::filesystem::path data_path;
    std::filesystem::path archive_path;

    double                started_at{0.0};
    std::optional<double> stopped_at;

    std::uint64_t sample_count{0};
    std::uint32_t downsample{1};

    bool active{false};

    [[nodiscard]] std::optional<double> duration_seconds() const noexcept {
        if (!stopped_at) return std::nullopt;
        const double d = *stopped_at - started_at;
        return d > 0.0 ? d : 0.0;
    }

    // Suggested file name when serving the archive
    [[nodiscard]] std::string download_name() const;
};

void write_json(lcr::json::Writer& w, const Session& s);

[[nodiscard]]
std::string to_json(const Session& s);

} // namespace telemux::core::recording
