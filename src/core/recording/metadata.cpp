#include "telemux/core/recording/metadata.hpp"

#include <cstdint>
#include <fstream>
#include <sstream>

#include <sys/utsname.h>

#include "simdjson.h"

#include "telemux/version.hpp"
#include "telemux/core/timestamp.hpp"
#include "telemux/core/recording/data_file.hpp"
#include "lcr/json.hpp"
#include "lcr/log/logger.hpp"

namespace telemux::core::recording {

namespace {

// Keys of the "recording" block rewritten on stop
bool is_stop_field(std::string_view key) noexcept {
    return key == "stoppedAt" || key == "stoppedAtIso" || key == "durationSeconds" ||
           key == "sampleCount" || key == "format";
}

// Re-emits a parsed DOM value through the writer, keeping member order
void write_element(lcr::json::Writer& w, const simdjson::dom::element& el) {
    using simdjson::dom::element_type;

    switch (el.type()) {
    case element_type::OBJECT: {
        simdjson::dom::object obj;
        if (el.get(obj)) { w.null(); return; }
        w.begin_object();
        for (auto field : obj) {
            w.key(field.key);
            write_element(w, field.value);
        }
        w.end_object();
        return;
    }
    case element_type::ARRAY: {
        simdjson::dom::array arr;
        if (el.get(arr)) { w.null(); return; }
        w.begin_array();
        for (auto child : arr) {
            write_element(w, child);
        }
        w.end_array();
        return;
    }
    case element_type::INT64: {
        std::int64_t v;
        if (el.get(v)) { w.null(); return; }
        w.value(v);
        return;
    }
    case element_type::UINT64: {
        std::uint64_t v;
        if (el.get(v)) { w.null(); return; }
        w.value(v);
        return;
    }
    case element_type::DOUBLE: {
        double v;
        if (el.get(v)) { w.null(); return; }
        w.value(v);
        return;
    }
    case element_type::STRING: {
        std::string_view v;
        if (el.get(v)) { w.null(); return; }
        w.value(v);
        return;
    }
    case element_type::BOOL: {
        bool v;
        if (el.get(v)) { w.null(); return; }
        w.value(v);
        return;
    }
    case element_type::NULL_VALUE:
        w.null();
        return;
    }
    w.null();
}

void write_stop_fields(lcr::json::Writer& w, const Session& s) {
    const double stopped_at = s.stopped_at.value_or(s.started_at);
    w.key("stoppedAt").value(stopped_at);
    w.key("stoppedAtIso").value(to_iso8601(stopped_at));
    w.key("durationSeconds").value(s.duration_seconds().value_or(0.0));
    w.key("sampleCount").value(s.sample_count);
    w.key("format").begin_object();
    w.key("data").value("ndjson");
    w.key("schema").begin_object();
    w.key("t").value("source_timestamp");
    w.key("d").value("channel_data");
    w.end_object();
    w.end_object();
}

void write_recording_block(lcr::json::Writer& w, const simdjson::dom::object* existing, const Session& s) {
    w.begin_object();
    if (existing) {
        for (auto field : *existing) {
            if (is_stop_field(field.key)) continue;
            w.key(field.key);
            write_element(w, field.value);
        }
    }
    write_stop_fields(w, s);
    w.end_object();
}

bool read_file(const std::filesystem::path& path, std::string& out) {
    std::ifstream in(path, std::ios::binary);
    if (!in) return false;
    std::ostringstream ss;
    ss << in.rdbuf();
    if (in.bad()) return false;
    out = ss.str();
    return true;
}

} // namespace

BackendInfo collect_backend_info(std::string discovery_version) {
    BackendInfo info;
    info.telemux = telemux::version();

    struct utsname u{};
    if (::uname(&u) == 0) {
        info.platform = std::string(u.sysname) + " " + u.release + " " + u.machine;
    } else {
        info.platform = "unknown";
    }

#if defined(__clang__)
    info.compiler = "clang " __clang_version__;
#elif defined(__GNUC__)
    info.compiler = "gcc " __VERSION__;
#else
    info.compiler = "unknown";
#endif
    info.cplusplus = static_cast<long>(__cplusplus);
    info.discovery = std::move(discovery_version);
    return info;
}

std::string make_initial_metadata(const Session& s, const stream::Descriptor& d, const BackendInfo& backend) {
    std::string out;
    lcr::json::Writer w(out, 2);

    w.begin_object();

    w.key("recording").begin_object();
    w.key("id").value(s.id);
    if (s.label.empty()) {
        w.key("label").null();
    } else {
        w.key("label").value(s.label);
    }
    w.key("startedAt").value(s.started_at);
    w.key("startedAtIso").value(to_iso8601(s.started_at));
    w.key("downsample").value(static_cast<std::uint64_t>(s.downsample));
    w.end_object();

    w.key("stream");
    stream::write_json(w, d);

    w.key("backend").begin_object();
    w.key("telemux").value(backend.telemux);
    w.key("platform").value(backend.platform);
    w.key("compiler").value(backend.compiler);
    w.key("cplusplus").value(static_cast<std::int64_t>(backend.cplusplus));
    w.key("discovery").value(backend.discovery);
    w.end_object();

    w.end_object();
    out += '\n';
    return out;
}

std::string make_final_metadata(std::string_view existing, const Session& s) {
    simdjson::dom::parser parser;
    simdjson::dom::element root;
    simdjson::dom::object obj;

    const simdjson::padded_string padded(existing);
    const bool parsed = !parser.parse(padded).get(root) && !root.get(obj);
    if (!parsed) {
        TM_WARN("[RECORDER] Metadata for " << s.id << " is not a JSON object, rebuilding");
    }

    std::string out;
    lcr::json::Writer w(out, 2);
    w.begin_object();

    bool wrote_recording = false;
    if (parsed) {
        for (auto field : obj) {
            if (field.key == "recording") {
                simdjson::dom::object rec;
                w.key("recording");
                write_recording_block(w, field.value.get(rec) ? nullptr : &rec, s);
                wrote_recording = true;
                continue;
            }
            w.key(field.key);
            write_element(w, field.value);
        }
    }
    if (!wrote_recording) {
        w.key("recording");
        write_recording_block(w, nullptr, s);
    }

    w.end_object();
    out += '\n';
    return out;
}

Error write_final_metadata(const Session& s, std::string_view initial_document) {
    std::string existing;
    if (!read_file(s.metadata_path, existing)) {
        TM_WARN("[RECORDER] Cannot reload " << s.metadata_path.string() << ", using initial document");
        existing.assign(initial_document);
    }
    return write_file_atomic(s.metadata_path, make_final_metadata(existing, s));
}

} // namespace telemux::core::recording
