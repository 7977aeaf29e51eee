#pragma once

#include <atomic>
#include <cstdint>
#include <ostream>
#include <type_traits>


namespace lcr {
namespace metrics {
namespace atomic {

// ---------------------------------------------------------------------------
// counter - cumulative event count shared between one writer thread and any
// number of observers.
//
// Relaxed ordering throughout: a value read from another thread is a
// monotonic lower bound of the true count and says nothing about the data
// the counted events produced. Each counter owns a cache line so counters
// bumped by different workers never share one.
// ---------------------------------------------------------------------------
template<typename T = std::uint64_t>
struct alignas(64) counter {
    static_assert(std::is_unsigned_v<T>, "counter requires an unsigned type");

    counter() noexcept = default;

    counter(const counter&) = delete;
    counter& operator=(const counter&) = delete;

    inline void inc(T n = 1) noexcept {
        value_.fetch_add(n, std::memory_order_relaxed);
    }

    [[nodiscard]]
    inline T load() const noexcept {
        return value_.load(std::memory_order_relaxed);
    }

    friend std::ostream& operator<<(std::ostream& os, const counter& c) {
        return os << c.load();
    }

private:
    std::atomic<T> value_{0};
};

using counter32 = counter<std::uint32_t>;
using counter64 = counter<std::uint64_t>;

static_assert(std::is_standard_layout_v<counter64>, "counter64 must be standard layout");
static_assert(sizeof(counter64) == 64, "counter64 must fill exactly one cache line");

} // namespace atomic
} // namespace metrics
} // namespace lcr
