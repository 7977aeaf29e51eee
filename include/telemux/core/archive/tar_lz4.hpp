#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "telemux/core/error.hpp"

namespace telemux::core::archive {

/*
===============================================================================
 .tar.lz4 archives
===============================================================================

A POSIX ustar stream compressed as a single LZ4 frame. Readable with stock
tools:

    lz4 -dc recording.tar.lz4 | tar x

Members are regular files stored flat (no directories), in the order given.
Sizes beyond the 11-digit octal field (8 GiB and up) use the GNU base-256
encoding, which GNU tar and bsdtar both read.
The archive is assembled in a temporary sibling file and renamed into place
only after a successful fdatasync, so a reader never observes a truncated
archive under the final name.
===============================================================================
*/

struct Member {
    std::string           name;    // name inside the archive (< 100 bytes)
    std::filesystem::path source;  // file to copy from
};

struct Entry {
    std::string   name;
    std::string   content; // empty when listed
    std::uint64_t size{0};
    std::uint64_t mtime{0};
};

// Archive size in bytes is returned through `out_size` on success
[[nodiscard]]
Error write_tar_lz4(const std::filesystem::path& target, const std::vector<Member>& members,
                    std::uint64_t& out_size) noexcept;

// Decompresses and unpacks a whole archive into memory
[[nodiscard]]
Error read_tar_lz4(const std::filesystem::path& source, std::vector<Entry>& out) noexcept;

// Streams an archive and reports names, sizes and mtimes without keeping
// member content
[[nodiscard]]
Error list_tar_lz4(const std::filesystem::path& source, std::vector<Entry>& out) noexcept;

} // namespace telemux::core::archive
