#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <ostream>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include "telemux/core/error.hpp"
#include "telemux/core/config/inlet.hpp"
#include "telemux/core/source/concepts.hpp"
#include "telemux/core/stream/sample_queue.hpp"
#include "telemux/core/inlet/telemetry.hpp"
#include "lcr/log/logger.hpp"


namespace telemux::core::inlet {

// Private queue handed to each subscriber. The manager keeps a second
// reference for fan-out until the subscriber unsubscribes.
using Subscriber = std::shared_ptr<stream::SampleQueue>;

struct Config {
    std::chrono::milliseconds open_timeout = config::inlet::open_timeout;
    std::size_t               pull_batch   = config::inlet::pull_batch;
    std::chrono::milliseconds pull_timeout = config::inlet::pull_timeout;
    std::chrono::milliseconds idle_sleep   = config::inlet::idle_sleep;
};

/*
===============================================================================
 inlet::Manager
===============================================================================

Shares one upstream inlet per stream uid between any number of subscribers.

  • First subscribe for a uid opens the inlet (bounded by open_timeout) and
    starts its pull worker.
  • Every subscribe returns a fresh private SampleQueue.
  • The pull worker fans each pulled sample out to every subscriber queue
    with drop-oldest overflow; it never blocks on a slow consumer.
  • The unsubscribe that drops the reference count to zero stops the worker,
    closes the inlet and erases the entry before returning.

Invariant: an entry (and therefore an open inlet) exists iff its reference
count is > 0. The one exception is a worker that died on a pull failure:
the entry stays, orphaned, until its last subscriber leaves.

-------------------------------------------------------------------------------
Locking
-------------------------------------------------------------------------------

  mutex_              inlet map, reference counts, open/teardown
  Managed::subs_mutex subscriber vector (shared with the pull worker)

The pull worker only ever takes subs_mutex, so joining it while holding
mutex_ cannot deadlock. Opening happens inside mutex_: concurrent first
subscribers for the same uid wait for one open instead of racing two.
===============================================================================
*/
template<source::SourceConcept Source>
class Manager {
public:
    using handle_type = typename Source::handle_type;
    using inlet_type  = typename Source::inlet_type;

    explicit Manager(Source& source, Config config = {}) noexcept
        : source_(source)
        , config_(config)
    {}

    ~Manager() {
        shutdown();
    }

    Manager(const Manager&) = delete;
    Manager& operator=(const Manager&) = delete;

    // ---------------------------------------------------------------------
    // Subscription
    // ---------------------------------------------------------------------

    // Returns a new private queue through `out`. On open failure nothing is
    // left behind and `out` is untouched.
    [[nodiscard]]
    Error subscribe(std::string_view uid, const handle_type& handle, std::size_t queue_capacity,
                    Subscriber& out) {
        std::lock_guard lock(mutex_);

        auto it = inlets_.find(uid);
        if (it == inlets_.end()) {
            TM_INFO("[INLET] Opening inlet for stream " << uid);

            auto inlet = std::make_unique<inlet_type>(source_.open_inlet(handle));
            const Error err = inlet->open(config_.open_timeout);
            if (err != Error::None) {
                TM_ERROR("[INLET] Failed to open inlet for " << uid << ": " << to_string(err));
                inlet->close();
                return err == Error::Timeout ? Error::Timeout : Error::ConnectionFailed;
            }

            auto managed = std::make_unique<Managed>();
            managed->uid        = std::string(uid);
            managed->inlet      = std::move(inlet);
            managed->generation = ++next_generation_;
            it = inlets_.emplace(managed->uid, std::move(managed)).first;
        }

        Managed& m = *it->second;
        auto queue = std::make_shared<stream::SampleQueue>(queue_capacity);
        {
            std::lock_guard subs_lock(m.subs_mutex);
            m.subscribers.push_back(queue);
        }
        ++m.ref_count;

        // First subscriber is registered before the worker starts so the
        // earliest samples are not lost.
        if (!m.worker.joinable()) {
            m.running.store(true, std::memory_order_release);
            m.pulling.store(true, std::memory_order_release);
            m.worker = std::thread(&Manager::pull_loop_, this, std::ref(m));
        }

        TM_INFO("[INLET] Subscriber added to " << uid << " (refs=" << m.ref_count << ")");
        out = std::move(queue);
        return Error::None;
    }

    // Removes `subscriber` from `uid`. Unknown uids and queues are ignored.
    // Tears the inlet down when the last reference goes away.
    void unsubscribe(std::string_view uid, const Subscriber& subscriber) {
        std::lock_guard lock(mutex_);

        auto it = inlets_.find(uid);
        if (it == inlets_.end()) {
            return;
        }

        Managed& m = *it->second;
        bool removed = false;
        {
            std::lock_guard subs_lock(m.subs_mutex);
            auto pos = std::find(m.subscribers.begin(), m.subscribers.end(), subscriber);
            if (pos != m.subscribers.end()) {
                m.subscribers.erase(pos);
                removed = true;
            }
        }
        if (removed) {
            --m.ref_count;
        }
        TM_INFO("[INLET] Subscriber removed from " << uid << " (refs=" << m.ref_count << ")");

        if (m.ref_count == 0) {
            teardown_(m);
            inlets_.erase(it);
        }
    }

    // Stops every worker and closes every inlet regardless of reference counts
    void shutdown() {
        std::lock_guard lock(mutex_);
        for (auto& [uid, m] : inlets_) {
            teardown_(*m);
        }
        inlets_.clear();
    }

    // ---------------------------------------------------------------------
    // Observation
    // ---------------------------------------------------------------------

    [[nodiscard]]
    std::size_t ref_count(std::string_view uid) const {
        std::lock_guard lock(mutex_);
        auto it = inlets_.find(uid);
        return it == inlets_.end() ? 0 : it->second->ref_count;
    }

    [[nodiscard]]
    std::size_t subscriber_count(std::string_view uid) const {
        std::lock_guard lock(mutex_);
        auto it = inlets_.find(uid);
        if (it == inlets_.end()) return 0;
        std::lock_guard subs_lock(it->second->subs_mutex);
        return it->second->subscribers.size();
    }

    [[nodiscard]]
    bool is_open(std::string_view uid) const {
        std::lock_guard lock(mutex_);
        return inlets_.find(uid) != inlets_.end();
    }

    // False once the worker has exited (stopped or failed)
    [[nodiscard]]
    bool is_pulling(std::string_view uid) const {
        std::lock_guard lock(mutex_);
        auto it = inlets_.find(uid);
        return it != inlets_.end() && it->second->pulling.load(std::memory_order_acquire);
    }

    // Distinguishes successive inlets opened for the same uid; 0 when absent
    [[nodiscard]]
    std::uint64_t generation(std::string_view uid) const {
        std::lock_guard lock(mutex_);
        auto it = inlets_.find(uid);
        return it == inlets_.end() ? 0 : it->second->generation;
    }

    [[nodiscard]]
    std::vector<std::string> active_inlets() const {
        std::lock_guard lock(mutex_);
        std::vector<std::string> out;
        out.reserve(inlets_.size());
        for (const auto& [uid, m] : inlets_) {
            out.push_back(uid);
        }
        return out;
    }

    // Returns false when uid has no inlet
    bool telemetry_dump(std::string_view uid, std::ostream& os) const {
        std::lock_guard lock(mutex_);
        auto it = inlets_.find(uid);
        if (it == inlets_.end()) return false;
        os << "[" << uid << "] generation " << it->second->generation;
        it->second->telemetry.debug_dump(os);
        return true;
    }

private:
    struct Managed {
        std::string uid;
        std::unique_ptr<inlet_type> inlet;
        std::size_t ref_count{0};
        std::uint64_t generation{0};

        std::mutex subs_mutex;
        std::vector<Subscriber> subscribers;

        std::thread worker;
        std::atomic<bool> running{false};
        std::atomic<bool> pulling{false};

        telemetry::Inlet telemetry;
    };

    Source& source_;
    Config config_;

    mutable std::mutex mutex_;
    std::map<std::string, std::unique_ptr<Managed>, std::less<>> inlets_;
    std::uint64_t next_generation_{0};

private:
    // Called with mutex_ held
    void teardown_(Managed& m) {
        TM_INFO("[INLET] Closing inlet for " << m.uid);
        m.running.store(false, std::memory_order_release);
        if (m.worker.joinable()) {
            m.worker.join();
        }
        m.inlet->close();
        std::lock_guard subs_lock(m.subs_mutex);
        m.subscribers.clear();
    }

    // ---------------------------------------------------------------------
    // Pull worker
    // ---------------------------------------------------------------------
    void pull_loop_(Managed& m) {
        std::vector<stream::SamplePtr> batch;
        batch.reserve(config_.pull_batch);

        while (m.running.load(std::memory_order_acquire)) {
            batch.clear();
            m.telemetry.pull_calls_total.inc();
            const Error err = m.inlet->pull(batch, config_.pull_batch, config_.pull_timeout);

            if (err == Error::Cancelled) {
                break;
            }
            if (err != Error::None && err != Error::Timeout) {
                m.telemetry.pull_errors_total.inc();
                TM_ERROR("[INLET] Pull loop error for " << m.uid << ": " << to_string(err));
                break;
            }
            if (batch.empty()) {
                std::this_thread::sleep_for(config_.idle_sleep);
                continue;
            }

            m.telemetry.samples_pulled_total.inc(batch.size());
            fan_out_(m, batch);
        }

        m.pulling.store(false, std::memory_order_release);
    }

    void fan_out_(Managed& m, const std::vector<stream::SamplePtr>& batch) {
        std::lock_guard subs_lock(m.subs_mutex);
        for (const auto& sample : batch) {
            for (const auto& queue : m.subscribers) {
                if (queue->push(sample)) {
                    m.telemetry.samples_evicted_total.inc();
                }
                m.telemetry.samples_fanned_out_total.inc();
            }
        }
    }
};

} // namespace telemux::core::inlet
