#pragma once

#include <chrono>
#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include "telemux/core/error.hpp"
#include "telemux/core/source/concepts.hpp"
#include "telemux/core/stream/descriptor.hpp"
#include "lcr/log/logger.hpp"

namespace telemux::core::stream {

/*
===============================================================================
 stream::Resolver
===============================================================================

Cache of the most recent discovery generation.

resolve() asks the source for every reachable stream and swaps the whole
cache in one step: uids missing from the new generation disappear, the rest
are replaced. Concurrent resolves are last-writer-wins. A failed resolve
leaves the previous generation untouched.

Handles returned by get_handle() are not revalidated; a handle obtained
before a later resolve may refer to a stream that has since vanished.
===============================================================================
*/
template<source::SourceConcept Source>
class Resolver {
public:
    using handle_type = typename Source::handle_type;
    using entry_type  = source::Discovered<handle_type>;

    explicit Resolver(Source& source) noexcept
        : source_(source)
    {}

    Resolver(const Resolver&) = delete;
    Resolver& operator=(const Resolver&) = delete;

    // Runs discovery for up to `timeout`, replaces the cache and returns the
    // new generation's descriptors (discovery order) through `out`.
    [[nodiscard]]
    Error resolve(std::chrono::milliseconds timeout, std::vector<Descriptor>& out) {
        std::vector<entry_type> found;
        const Error err = source_.resolve(timeout, found);
        if (err != Error::None) {
            TM_WARN("[RESOLVER] Discovery failed (" << to_string(err) << "), keeping "
                    << size() << " cached stream(s)");
            return err;
        }

        std::vector<entry_type> entries;
        std::unordered_map<std::string, std::size_t> index;
        entries.reserve(found.size());
        for (auto& e : found) {
            fill_default_channel_names(e.descriptor);
            auto it = index.find(e.descriptor.uid);
            if (it != index.end()) {
                entries[it->second] = std::move(e);
                continue;
            }
            index.emplace(e.descriptor.uid, entries.size());
            entries.push_back(std::move(e));
        }

        out.clear();
        out.reserve(entries.size());
        for (const auto& e : entries) {
            out.push_back(e.descriptor);
        }

        {
            std::lock_guard lock(mutex_);
            entries_ = std::move(entries);
            index_   = std::move(index);
        }

        TM_INFO("[RESOLVER] Resolved " << out.size() << " stream(s)");
        return Error::None;
    }

    // Descriptor and handle of one uid, taken from the same generation
    [[nodiscard]]
    std::optional<entry_type> get(std::string_view uid) const {
        std::lock_guard lock(mutex_);
        const entry_type* e = find_(uid);
        if (!e) return std::nullopt;
        return *e;
    }

    [[nodiscard]]
    std::optional<Descriptor> get_descriptor(std::string_view uid) const {
        std::lock_guard lock(mutex_);
        const entry_type* e = find_(uid);
        if (!e) return std::nullopt;
        return e->descriptor;
    }

    [[nodiscard]]
    std::optional<handle_type> get_handle(std::string_view uid) const {
        std::lock_guard lock(mutex_);
        const entry_type* e = find_(uid);
        if (!e) return std::nullopt;
        return e->handle;
    }

    [[nodiscard]]
    std::size_t size() const noexcept {
        std::lock_guard lock(mutex_);
        return entries_.size();
    }

    // Snapshot of the current generation, discovery order
    [[nodiscard]]
    std::vector<Descriptor> descriptors() const {
        std::lock_guard lock(mutex_);
        std::vector<Descriptor> out;
        out.reserve(entries_.size());
        for (const auto& e : entries_) {
            out.push_back(e.descriptor);
        }
        return out;
    }

private:
    Source& source_;

    mutable std::mutex mutex_;
    std::vector<entry_type> entries_;
    std::unordered_map<std::string, std::size_t> index_;

    const entry_type* find_(std::string_view uid) const {
        auto it = index_.find(std::string(uid));
        return it == index_.end() ? nullptr : &entries_[it->second];
    }
};

} // namespace telemux::core::stream
