#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <mutex>

#include "telemux/core/stream/sample.hpp"
#include "lcr/local/ring_buffer.hpp"
#include "lcr/metrics/atomic/counter.hpp"

namespace telemux::core::stream {

/*
===============================================================================
 stream::SampleQueue
===============================================================================

Bounded FIFO between one inlet pull worker (producer) and one subscriber
(consumer: a relay session or a recording writer).

Overflow policy: drop-oldest. The producer never blocks; when the queue is
full the oldest queued sample is evicted and the new one appended, so a slow
consumer always sees the freshest window of `capacity` samples.

Capacity is clamped to >= 1.
===============================================================================
*/
class SampleQueue {
public:
    explicit SampleQueue(std::size_t capacity)
        : ring_(capacity == 0 ? 1 : capacity)
    {}

    SampleQueue(const SampleQueue&) = delete;
    SampleQueue& operator=(const SampleQueue&) = delete;

    // Producer side. Returns true when an older sample was evicted.
    bool push(SamplePtr sample) noexcept {
        bool evicted;
        {
            std::lock_guard lock(mutex_);
            evicted = ring_.push_overwrite(std::move(sample));
        }
        if (evicted) {
            evicted_.inc();
        }
        cv_.notify_one();
        return evicted;
    }

    // Consumer side. Waits up to `timeout` for a sample.
    [[nodiscard]]
    bool pop(SamplePtr& out, std::chrono::milliseconds timeout) {
        std::unique_lock lock(mutex_);
        if (!cv_.wait_for(lock, timeout, [&] { return !ring_.empty(); })) {
            return false;
        }
        return ring_.pop(out);
    }

    [[nodiscard]]
    bool try_pop(SamplePtr& out) noexcept {
        std::lock_guard lock(mutex_);
        return ring_.pop(out);
    }

    [[nodiscard]]
    std::size_t size() const noexcept {
        std::lock_guard lock(mutex_);
        return ring_.size();
    }

    [[nodiscard]]
    std::size_t capacity() const noexcept {
        return ring_.capacity();
    }

    // Samples discarded by drop-oldest since construction
    [[nodiscard]]
    std::uint64_t evicted() const noexcept {
        return evicted_.load();
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    lcr::local::ring_buffer<SamplePtr> ring_;
    lcr::metrics::atomic::counter64 evicted_;
};

} // namespace telemux::core::stream
