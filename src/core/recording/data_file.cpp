#include "telemux/core/recording/data_file.hpp"

#include <cerrno>
#include <cstring>
#include <string>
#include <system_error>

#include <fcntl.h>
#include <unistd.h>

#include "lcr/log/logger.hpp"

namespace telemux::core::recording {

namespace {

// Writes all of `bytes`, retrying on EINTR and short writes
bool write_all(int fd, std::string_view bytes) noexcept {
    const char* p = bytes.data();
    std::size_t left = bytes.size();
    while (left > 0) {
        const ssize_t n = ::write(fd, p, left);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        p += n;
        left -= static_cast<std::size_t>(n);
    }
    return true;
}

} // namespace

Error DataFile::open(const std::filesystem::path& path) noexcept {
    close();
    fd_ = ::open(path.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
    if (fd_ < 0) {
        TM_ERROR("[RECORDER] Cannot open " << path.string() << ": " << std::strerror(errno));
        return Error::IoFailure;
    }
    return Error::None;
}

Error DataFile::append_and_sync(std::string_view bytes) noexcept {
    if (fd_ < 0) {
        return Error::InvalidState;
    }
    if (!write_all(fd_, bytes)) {
        TM_ERROR("[RECORDER] Write failed: " << std::strerror(errno));
        return Error::IoFailure;
    }
    if (::fdatasync(fd_) != 0) {
        TM_ERROR("[RECORDER] fdatasync failed: " << std::strerror(errno));
        return Error::IoFailure;
    }
    return Error::None;
}

void DataFile::close() noexcept {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

void sync_directory(const std::filesystem::path& dir) noexcept {
    const int dir_fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (dir_fd < 0) {
        TM_WARN("[RECORDER] Cannot open directory " << dir.string() << " for sync: " << std::strerror(errno));
        return;
    }
    if (::fdatasync(dir_fd) != 0) {
        TM_WARN("[RECORDER] Directory sync failed for " << dir.string() << ": " << std::strerror(errno));
    }
    ::close(dir_fd);
}

Error write_file_atomic(const std::filesystem::path& path, std::string_view content) noexcept {
    std::filesystem::path tmp_path = path;
    tmp_path += ".tmp";

    const int fd = ::open(tmp_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) {
        TM_ERROR("[RECORDER] Cannot create " << tmp_path.string() << ": " << std::strerror(errno));
        return Error::IoFailure;
    }
    if (!write_all(fd, content) || ::fdatasync(fd) != 0) {
        TM_ERROR("[RECORDER] Cannot write " << tmp_path.string() << ": " << std::strerror(errno));
        ::close(fd);
        ::unlink(tmp_path.c_str());
        return Error::IoFailure;
    }
    if (::close(fd) != 0) {
        ::unlink(tmp_path.c_str());
        return Error::IoFailure;
    }

    std::error_code ec;
    std::filesystem::rename(tmp_path, path, ec);
    if (ec) {
        TM_ERROR("[RECORDER] Cannot rename " << tmp_path.string() << ": " << ec.message());
        ::unlink(tmp_path.c_str());
        return Error::IoFailure;
    }

    sync_directory(path.parent_path());
    return Error::None;
}

} // namespace telemux::core::recording
