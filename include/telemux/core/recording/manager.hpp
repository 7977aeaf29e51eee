#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include "telemux/core/error.hpp"
#include "telemux/core/timestamp.hpp"
#include "telemux/core/config/recording.hpp"
#include "telemux/core/source/concepts.hpp"
#include "telemux/core/stream/descriptor.hpp"
#include "telemux/core/inlet/manager.hpp"
#include "telemux/core/archive/tar_lz4.hpp"
#include "telemux/core/recording/session.hpp"
#include "telemux/core/recording/naming.hpp"
#include "telemux/core/recording/metadata.hpp"
#include "telemux/core/recording/data_file.hpp"
#include "telemux/core/recording/writer.hpp"
#include "lcr/format.hpp"
#include "lcr/log/logger.hpp"


namespace telemux::core::recording {

struct Config {
    std::filesystem::path     root           = std::filesystem::path(config::recording::default_root);
    std::size_t               queue_capacity = config::recording::queue_capacity;
    std::size_t               flush_lines    = config::recording::flush_lines;
    std::chrono::milliseconds flush_interval = config::recording::flush_interval;
    std::chrono::milliseconds poll_interval  = config::recording::poll_interval;
};

/*
===============================================================================
 recording::Manager
===============================================================================

Persists subscribed streams to disk while relaying continues.

start():
  1. allocate a 12-hex id and a start time
  2. create <root>/<YYYYMMDDTHHMMSSZ>_<slug>_<id> exclusively
  3. write the initial metadata.json
  4. subscribe to the shared inlet with a large private queue
  5. launch the write task (recording::Writer) appending samples.ndjson

stop() (idempotent):
  1. record the stop time
  2. stop the write task (one final flush)
  3. release the inlet subscription
  4. rewrite metadata.json with stop fields, then build recording.tar.lz4

Sessions are never removed; list() reports them in start order. Every
accessor returns value snapshots.

A single mutex serializes start/stop/list/get. It is held across the inlet
open in start() and across finalization in stop().
===============================================================================
*/
template<source::SourceConcept Source>
class Manager {
public:
    using handle_type = typename Source::handle_type;

    Manager(Source& source, inlet::Manager<Source>& inlets, Config config = {})
        : inlets_(inlets)
        , config_(std::move(config))
        , backend_(collect_backend_info(source.version()))
    {}

    ~Manager() {
        stop_all();
    }

    Manager(const Manager&) = delete;
    Manager& operator=(const Manager&) = delete;

    [[nodiscard]]
    const Config& config() const noexcept { return config_; }

    // ---------------------------------------------------------------------
    // Lifecycle
    // ---------------------------------------------------------------------

    // Starts recording `uid`. `label` (optional) names the directory instead
    // of the stream name. Downsample factors below 1 are clamped to 1.
    [[nodiscard]]
    Error start(std::string_view uid, const handle_type& handle, const stream::Descriptor& descriptor,
                std::string_view label, int downsample, Session& out) {
        const std::uint32_t ds = downsample < 1 ? 1u : static_cast<std::uint32_t>(downsample);

        std::lock_guard lock(mutex_);

        auto live = std::make_unique<Live>();
        Session& s = live->session;
        s.id          = make_recording_id();
        s.stream_uid  = std::string(uid);
        s.stream_name = descriptor.name;
        s.label       = std::string(label);
        s.started_at  = now_seconds();
        s.downsample  = ds;
        s.dir = config_.root / make_directory_name(s.started_at, label.empty() ? std::string_view(descriptor.name) : label, s.id);
        s.metadata_path = s.dir / config::recording::metadata_file;
        s.data_path     = s.dir / config::recording::data_file;
        s.archive_path  = s.dir / config::recording::archive_file;

        Error err = create_directory_(s.dir);
        if (err != Error::None) {
            return err;
        }

        live->initial_document = make_initial_metadata(s, descriptor, backend_);
        err = write_file_atomic(s.metadata_path, live->initial_document);
        if (err != Error::None) {
            return err;
        }

        err = inlets_.subscribe(uid, handle, config_.queue_capacity, live->queue);
        if (err != Error::None) {
            TM_ERROR("[RECORDER] Cannot subscribe " << uid << " for recording " << s.id << ": " << to_string(err));
            return err;
        }

        WriterConfig wcfg;
        wcfg.flush_lines    = config_.flush_lines;
        wcfg.flush_interval = config_.flush_interval;
        wcfg.poll_interval  = config_.poll_interval;
        live->writer = std::make_unique<Writer>(live->queue, s.data_path, ds, wcfg);

        err = live->writer->start();
        if (err != Error::None) {
            inlets_.unsubscribe(uid, live->queue);
            return err;
        }

        s.active = true;
        TM_INFO("[RECORDER] Recording " << s.id << " started for " << uid << " -> " << s.dir.string());
        out = snapshot_(*live);
        sessions_.push_back(std::move(live));
        return Error::None;
    }

    // Stops a recording. Stopping an already stopped recording returns the
    // same snapshot and touches no file.
    [[nodiscard]]
    Error stop(std::string_view id, Session& out) {
        std::lock_guard lock(mutex_);

        Live* live = find_(id);
        if (!live) {
            return Error::NotFound;
        }
        if (live->session.stopped_at) {
            out = snapshot_(*live);
            return Error::None;
        }

        const Error err = finalize_(*live);
        out = snapshot_(*live);
        return err;
    }

    // Stops every active recording; called on destruction
    void stop_all() {
        std::lock_guard lock(mutex_);
        for (auto& live : sessions_) {
            if (!live->session.stopped_at) {
                const Error err = finalize_(*live);
                if (err != Error::None) {
                    TM_ERROR("[RECORDER] Shutdown of recording " << live->session.id << " incomplete: " << to_string(err));
                }
            }
        }
    }

    // ---------------------------------------------------------------------
    // Queries
    // ---------------------------------------------------------------------

    [[nodiscard]]
    std::vector<Session> list() const {
        std::lock_guard lock(mutex_);
        std::vector<Session> out;
        out.reserve(sessions_.size());
        for (const auto& live : sessions_) {
            out.push_back(snapshot_(*live));
        }
        return out;
    }

    [[nodiscard]]
    std::optional<Session> get(std::string_view id) const {
        std::lock_guard lock(mutex_);
        const Live* live = find_(id);
        if (!live) return std::nullopt;
        return snapshot_(*live);
    }

    // Write-task health of an active recording (NotFound for unknown ids)
    [[nodiscard]]
    Error writer_error(std::string_view id) const {
        std::lock_guard lock(mutex_);
        const Live* live = find_(id);
        if (!live) return Error::NotFound;
        return live->writer ? live->writer->error() : Error::None;
    }

private:
    struct Live {
        Session session;
        inlet::Subscriber queue;
        std::unique_ptr<Writer> writer;
        std::string initial_document;
    };

    inlet::Manager<Source>& inlets_;
    Config config_;
    BackendInfo backend_;

    mutable std::mutex mutex_;
    std::vector<std::unique_ptr<Live>> sessions_;

private:
    Live* find_(std::string_view id) const {
        auto it = std::find_if(sessions_.begin(), sessions_.end(),
                               [&](const auto& l) { return l->session.id == id; });
        return it == sessions_.end() ? nullptr : it->get();
    }

    static Session snapshot_(const Live& live) {
        Session s = live.session;
        if (live.writer && !s.stopped_at) {
            s.sample_count = live.writer->sample_count();
        }
        s.active = !s.stopped_at.has_value();
        return s;
    }

    Error create_directory_(const std::filesystem::path& dir) {
        std::error_code ec;
        std::filesystem::create_directories(config_.root, ec);
        if (ec) {
            TM_ERROR("[RECORDER] Cannot create recordings root " << config_.root.string() << ": " << ec.message());
            return Error::IoFailure;
        }
        const bool created = std::filesystem::create_directory(dir, ec);
        if (ec) {
            TM_ERROR("[RECORDER] Cannot create " << dir.string() << ": " << ec.message());
            return Error::IoFailure;
        }
        if (!created) {
            TM_ERROR("[RECORDER] Recording directory already exists: " << dir.string());
            return Error::AlreadyExists;
        }
        sync_directory(config_.root);
        return Error::None;
    }

    // Called with mutex_ held
    Error finalize_(Live& live) {
        Session& s = live.session;
        s.stopped_at = now_seconds();

        if (live.writer) {
            live.writer->stop();
            // Lines on disk: equals the accepted count unless a write failed
            s.sample_count = live.writer->lines_written();
        }
        if (live.queue) {
            inlets_.unsubscribe(s.stream_uid, live.queue);
            live.queue.reset();
        }
        s.active = false;

        const Error meta_err = write_final_metadata(s, live.initial_document);
        if (meta_err != Error::None) {
            TM_ERROR("[RECORDER] Cannot finalize metadata for " << s.id << ": " << to_string(meta_err));
        }

        std::uint64_t archive_size = 0;
        const Error archive_err = archive::write_tar_lz4(
            s.archive_path,
            {
                {std::string(config::recording::metadata_file), s.metadata_path},
                {std::string(config::recording::data_file),     s.data_path},
            },
            archive_size);
        if (archive_err != Error::None) {
            TM_ERROR("[RECORDER] Failed to create recording archive for " << s.id << ": " << to_string(archive_err));
        }

        TM_INFO("[RECORDER] Recording " << s.id << " stopped (" << lcr::format_number_exact(s.sample_count)
                << " sample(s), " << lcr::format_duration(s.duration_seconds().value_or(0.0)) << ")");
        return meta_err;
    }
};

} // namespace telemux::core::recording
