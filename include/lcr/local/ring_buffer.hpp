#pragma once

#include <cstddef>
#include <utility>
#include <vector>


namespace lcr {
namespace local {

//------------------------------------------------------------------------------
// Single-threaded bounded ring buffer with runtime capacity.
//
// Characteristics:
//   • O(1) push/pop, storage allocated once at construction
//   • Exactly `capacity` usable slots (no sentinel slot)
//   • push() rejects when full, push_overwrite() evicts the oldest element
//
// Thread-safety:
//   - NOT thread-safe. Callers serialize access (see SampleQueue).
//
// Example:
//   ring_buffer<int> ring(4);
//   for (int i = 0; i < 6; ++i) ring.push_overwrite(i);   // 0 and 1 evicted
//   int v;
//   ring.pop(v);                                          // v == 2
//------------------------------------------------------------------------------
template <typename T>
class ring_buffer {
public:
    explicit ring_buffer(std::size_t capacity)
        : buffer_(capacity == 0 ? 1 : capacity)
    {}

    ring_buffer(const ring_buffer&) = delete;
    ring_buffer& operator=(const ring_buffer&) = delete;
    ring_buffer(ring_buffer&&) noexcept = default;
    ring_buffer& operator=(ring_buffer&&) noexcept = default;

    inline bool push(T item) noexcept {
        if (size_ == buffer_.size()) [[unlikely]]
            return false; // full
        buffer_[(head_ + size_) % buffer_.size()] = std::move(item);
        ++size_;
        return true;
    }

    // Returns true when an element had to be evicted to make room
    inline bool push_overwrite(T item) noexcept {
        bool evicted = false;
        if (size_ == buffer_.size()) {
            buffer_[head_] = T{};
            head_ = (head_ + 1) % buffer_.size();
            --size_;
            evicted = true;
        }
        buffer_[(head_ + size_) % buffer_.size()] = std::move(item);
        ++size_;
        return evicted;
    }

    inline bool pop(T& out) noexcept {
        if (size_ == 0) [[unlikely]]
            return false; // empty
        out = std::move(buffer_[head_]);
        buffer_[head_] = T{};
        head_ = (head_ + 1) % buffer_.size();
        --size_;
        return true;
    }

    [[nodiscard]] inline bool empty() const noexcept { return size_ == 0; }
    [[nodiscard]] inline bool full() const noexcept { return size_ == buffer_.size(); }
    [[nodiscard]] inline std::size_t size() const noexcept { return size_; }
    [[nodiscard]] inline std::size_t capacity() const noexcept { return buffer_.size(); }

    inline void clear() noexcept {
        while (size_ > 0) {
            buffer_[head_] = T{};
            head_ = (head_ + 1) % buffer_.size();
            --size_;
        }
        head_ = 0;
    }

private:
    std::vector<T> buffer_;
    std::size_t head_{0};
    std::size_t size_{0};
};

} // namespace local
} // namespace lcr
