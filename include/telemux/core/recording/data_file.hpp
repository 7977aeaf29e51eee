#pragma once

#include <filesystem>
#include <string_view>

#include "telemux/core/error.hpp"

namespace telemux::core::recording {

// ----------------------------------------------------------------------------
// DataFile - append-only file handle with durable appends.
//
// Every append_and_sync() writes the whole buffer (retrying short writes)
// and then fdatasync()s, so a successful return means the bytes survive a
// crash. Move-only; closes on destruction.
// ----------------------------------------------------------------------------
class DataFile {
public:
    DataFile() noexcept = default;
    ~DataFile() { close(); }

    DataFile(const DataFile&) = delete;
    DataFile& operator=(const DataFile&) = delete;

    DataFile(DataFile&& other) noexcept : fd_(other.fd_) { other.fd_ = -1; }
    DataFile& operator=(DataFile&& other) noexcept {
        if (this != &other) {
            close();
            fd_ = other.fd_;
            other.fd_ = -1;
        }
        return *this;
    }

    // Creates the file if missing; existing content is kept
    [[nodiscard]] Error open(const std::filesystem::path& path) noexcept;

    [[nodiscard]] Error append_and_sync(std::string_view bytes) noexcept;

    void close() noexcept;

    [[nodiscard]] bool is_open() const noexcept { return fd_ >= 0; }

private:
    int fd_{-1};
};

// Writes `content` to `path` through a temporary sibling file:
// write + fdatasync + rename + directory sync. Readers see either the old
// or the new content, never a partial file.
[[nodiscard]]
Error write_file_atomic(const std::filesystem::path& path, std::string_view content) noexcept;

// Best-effort fdatasync of a directory entry table
void sync_directory(const std::filesystem::path& dir) noexcept;

} // namespace telemux::core::recording
