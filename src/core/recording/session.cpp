#include "telemux/core/recording/session.hpp"

#include "telemux/core/recording/naming.hpp"
#include "telemux/core/timestamp.hpp"
#include "lcr/json.hpp"

namespace telemux::core::recording {

std::string Session::download_name() const {
    return make_download_name(stream_name, id);
}

void write_json(lcr::json::Writer& w, const Session& s) {
    w.begin_object();
    w.key("id").value(s.id);
    w.key("streamUid").value(s.stream_uid);
    w.key("streamName").value(s.stream_name);
    if (s.label.empty()) {
        w.key("label").null();
    } else {
        w.key("label").value(s.label);
    }
    w.key("startedAt").value(s.started_at);
    w.key("startedAtIso").value(to_iso8601(s.started_at));
    if (s.stopped_at) {
        w.key("stoppedAt").value(*s.stopped_at);
        w.key("stoppedAtIso").value(to_iso8601(*s.stopped_at));
    } else {
        w.key("stoppedAt").null();
        w.key("stoppedAtIso").null();
    }
    w.key("sampleCount").value(s.sample_count);
    w.key("downsample").value(static_cast<std::uint64_t>(s.downsample));
    w.key("dir").value(s.dir.string());
    w.key("metadata").value(s.metadata_path.string());
    w.key("data").value(s.data_path.string());
    w.key("archive").value(s.archive_path.string());
    w.key("active").value(s.active);
    w.end_object();
}

std::string to_json(const Session& s) {
    std::string out;
    lcr::json::Writer w(out);
    write_json(w, s);
    return out;
}

} // namespace telemux::core::recording
