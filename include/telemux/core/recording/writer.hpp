#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <thread>
#include <utility>

#include "telemux/core/error.hpp"
#include "telemux/core/config/recording.hpp"
#include "telemux/core/stream/sample_queue.hpp"
#include "telemux/core/recording/data_file.hpp"
#include "lcr/metrics/atomic/counter.hpp"
#include "lcr/log/logger.hpp"


namespace telemux::core::recording {

struct WriterConfig {
    std::size_t               flush_lines    = config::recording::flush_lines;
    std::chrono::milliseconds flush_interval = config::recording::flush_interval;
    std::chrono::milliseconds poll_interval  = config::recording::poll_interval;
};

/*
===============================================================================
 recording::Writer
===============================================================================

Write task of one recording. Drains a private SampleQueue, keeps every
`downsample`-th sample, renders it as one NDJSON line and appends buffered
lines to the data file:

  • flush when flush_lines lines are buffered or flush_interval elapsed
    since the previous flush, whichever comes first
  • every flush is append + fdatasync
  • stop() joins the worker, which performs exactly one final flush of the
    lines still buffered

sample_count() counts lines accepted into the buffer; lines_written()
counts lines that reached the data file. They agree after a clean stop.

An I/O failure is logged and ends the worker; the count freezes and the
failure stays observable through error() until the owner stops it.
===============================================================================
*/
class Writer {
public:
    Writer(std::shared_ptr<stream::SampleQueue> queue, std::filesystem::path data_path,
           std::uint32_t downsample, WriterConfig config = {})
        : queue_(std::move(queue))
        , data_path_(std::move(data_path))
        , downsample_(downsample == 0 ? 1 : downsample)
        , config_(config)
    {}

    ~Writer() { stop(); }

    Writer(const Writer&) = delete;
    Writer& operator=(const Writer&) = delete;

    // Opens the data file and launches the worker
    [[nodiscard]]
    Error start() {
        if (worker_.joinable()) {
            return Error::InvalidState;
        }
        const Error err = file_.open(data_path_);
        if (err != Error::None) {
            return err;
        }
        running_.store(true, std::memory_order_release);
        worker_ = std::thread(&Writer::run_loop_, this);
        return Error::None;
    }

    // Request stop and join the worker (final flush included)
    void stop() {
        running_.store(false, std::memory_order_release);
        if (worker_.joinable()) {
            worker_.join();
        }
        file_.close();
    }

    [[nodiscard]]
    std::uint64_t sample_count() const noexcept {
        return sample_count_.load();
    }

    // Lines durably appended to the data file
    [[nodiscard]]
    std::uint64_t lines_written() const noexcept {
        return lines_written_.load();
    }

    [[nodiscard]]
    std::uint64_t flush_count() const noexcept {
        return flushes_.load();
    }

    // Error::None while healthy
    [[nodiscard]]
    Error error() const noexcept {
        return error_.load(std::memory_order_acquire);
    }

private:
    std::shared_ptr<stream::SampleQueue> queue_;
    std::filesystem::path data_path_;
    std::uint32_t downsample_;
    WriterConfig config_;

    DataFile file_;
    std::thread worker_;
    std::atomic<bool> running_{false};
    std::atomic<Error> error_{Error::None};

    lcr::metrics::atomic::counter64 sample_count_;
    lcr::metrics::atomic::counter64 lines_written_;
    lcr::metrics::atomic::counter64 flushes_;

private:
    // ---------------------------------------------------------------------
    // Worker thread main loop
    // ---------------------------------------------------------------------
    void run_loop_() {
        using clock = std::chrono::steady_clock;

        std::string buf;
        std::size_t buffered = 0;
        std::uint64_t sample_idx = 0;
        auto last_flush = clock::now();

        while (running_.load(std::memory_order_acquire)) {
            stream::SamplePtr sample;
            if (queue_->pop(sample, config_.poll_interval)) {
                ++sample_idx;
                if (sample_idx % downsample_ == 0) {
                    stream::append_json(buf, *sample);
                    buf += '\n';
                    ++buffered;
                    sample_count_.inc();
                }
            }

            if (buffered == 0) {
                continue;
            }
            const auto now = clock::now();
            if (buffered >= config_.flush_lines || now - last_flush >= config_.flush_interval) {
                if (!flush_(buf, buffered)) {
                    return;
                }
                last_flush = now;
            }
        }

        // Final flush on stop; a failure is recorded in error_
        if (buffered > 0) {
            flush_(buf, buffered);
        }
    }

    bool flush_(std::string& buf, std::size_t& buffered) {
        const Error err = file_.append_and_sync(buf);
        if (err != Error::None) {
            TM_ERROR("[RECORDER] Write task for " << data_path_.string() << " failed: " << to_string(err)
                     << " (" << buffered << " line(s) lost)");
            error_.store(err, std::memory_order_release);
            return false;
        }
        TM_TRACE("[RECORDER] Flushed " << buffered << " line(s) to " << data_path_.string());
        lines_written_.inc(buffered);
        flushes_.inc();
        buf.clear();
        buffered = 0;
        return true;
    }
};

} // namespace telemux::core::recording
