#include "telemux/core/archive/tar_lz4.hpp"

#include <array>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <new>
#include <string_view>
#include <system_error>
#include <vector>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <lz4frame.h>

#include "lcr/format.hpp"
#include "lcr/log/logger.hpp"

namespace telemux::core::archive {

namespace {

constexpr std::size_t BLOCK_SIZE = 512;
constexpr std::size_t CHUNK_SIZE = 1 << 20; // 1 MiB

using Block = std::array<char, BLOCK_SIZE>;

// ----------------------------------------------------------------------------
// ustar header
// ----------------------------------------------------------------------------

// Largest size the 11-digit octal field can announce (8 GiB - 1)
constexpr std::uint64_t MAX_OCTAL_SIZE = 077777777777ULL;

// Writes `value` as zero-padded octal into field[0..width-1) plus NUL
void put_octal(char* field, std::size_t width, std::uint64_t value) noexcept {
    std::snprintf(field, width, "%0*llo", static_cast<int>(width - 1),
                  static_cast<unsigned long long>(value));
}

// Size field: octal when it fits, otherwise the GNU base-256 form
// (high bit of the first byte set, value big-endian in the rest)
void put_size(char* field, std::uint64_t size) noexcept {
    if (size <= MAX_OCTAL_SIZE) {
        put_octal(field, 12, size);
        return;
    }
    field[0] = static_cast<char>(0x80);
    for (std::size_t i = 11; i >= 1; --i) {
        field[i] = static_cast<char>(size & 0xff);
        size >>= 8;
    }
}

bool make_header(Block& block, std::string_view name, std::uint64_t size, std::uint64_t mtime) noexcept {
    if (name.empty() || name.size() >= 100) return false;

    block.fill('\0');
    char* h = block.data();

    std::memcpy(h, name.data(), name.size()); // name[100]
    put_octal(h + 100, 8, 0644);              // mode
    put_octal(h + 108, 8, 0);                 // uid
    put_octal(h + 116, 8, 0);                 // gid
    put_size(h + 124, size);                  // size
    put_octal(h + 136, 12, mtime);            // mtime
    std::memset(h + 148, ' ', 8);             // chksum placeholder
    h[156] = '0';                             // typeflag: regular file
    std::memcpy(h + 257, "ustar", 6);         // magic (with NUL)
    std::memcpy(h + 263, "00", 2);            // version

    unsigned sum = 0;
    for (char c : block) sum += static_cast<unsigned char>(c);
    std::snprintf(h + 148, 7, "%06o", sum);
    h[154] = '\0';
    h[155] = ' ';
    return true;
}

// Numeric header field, octal or base-256
std::uint64_t parse_number(const char* field, std::size_t width) noexcept {
    const auto first = static_cast<unsigned char>(field[0]);
    if (first & 0x80) {
        std::uint64_t v = first & 0x7f;
        for (std::size_t i = 1; i < width; ++i) {
            v = (v << 8) | static_cast<unsigned char>(field[i]);
        }
        return v;
    }

    std::uint64_t v = 0;
    for (std::size_t i = 0; i < width; ++i) {
        const char c = field[i];
        if (c == ' ' && v == 0) continue;
        if (c < '0' || c > '7') break;
        v = (v << 3) + static_cast<std::uint64_t>(c - '0');
    }
    return v;
}

bool is_zero_block(const char* p) noexcept {
    for (std::size_t i = 0; i < BLOCK_SIZE; ++i) {
        if (p[i] != '\0') return false;
    }
    return true;
}

// ----------------------------------------------------------------------------
// Lz4FrameWriter - streams bytes through one LZ4 frame into a file descriptor
// ----------------------------------------------------------------------------
class Lz4FrameWriter {
public:
    explicit Lz4FrameWriter(int fd) noexcept : fd_(fd) {}

    ~Lz4FrameWriter() {
        if (cctx_) LZ4F_freeCompressionContext(cctx_);
    }

    Lz4FrameWriter(const Lz4FrameWriter&) = delete;
    Lz4FrameWriter& operator=(const Lz4FrameWriter&) = delete;

    [[nodiscard]] bool begin() {
        std::memset(&prefs_, 0, sizeof(prefs_));
        prefs_.frameInfo.blockSizeID = LZ4F_max4MB;
        prefs_.frameInfo.blockMode = LZ4F_blockLinked;
        prefs_.frameInfo.contentChecksumFlag = LZ4F_contentChecksumEnabled;

        const LZ4F_errorCode_t err = LZ4F_createCompressionContext(&cctx_, LZ4F_VERSION);
        if (LZ4F_isError(err)) {
            TM_ERROR("[ARCHIVE] LZ4F_createCompressionContext: " << LZ4F_getErrorName(err));
            cctx_ = nullptr;
            return false;
        }

        out_buf_.resize(LZ4F_compressBound(CHUNK_SIZE, &prefs_));
        const std::size_t header_size = LZ4F_compressBegin(cctx_, out_buf_.data(), out_buf_.size(), &prefs_);
        if (LZ4F_isError(header_size)) {
            TM_ERROR("[ARCHIVE] LZ4F_compressBegin: " << LZ4F_getErrorName(header_size));
            return false;
        }
        return emit_(header_size);
    }

    [[nodiscard]] bool write(const char* data, std::size_t size) noexcept {
        while (size > 0) {
            const std::size_t n = size < CHUNK_SIZE ? size : CHUNK_SIZE;
            const std::size_t c_size = LZ4F_compressUpdate(cctx_, out_buf_.data(), out_buf_.size(),
                                                           data, n, nullptr);
            if (LZ4F_isError(c_size)) {
                TM_ERROR("[ARCHIVE] LZ4F_compressUpdate: " << LZ4F_getErrorName(c_size));
                return false;
            }
            if (!emit_(c_size)) return false;
            data += n;
            size -= n;
        }
        return true;
    }

    [[nodiscard]] bool end() noexcept {
        const std::size_t c_size = LZ4F_compressEnd(cctx_, out_buf_.data(), out_buf_.size(), nullptr);
        if (LZ4F_isError(c_size)) {
            TM_ERROR("[ARCHIVE] LZ4F_compressEnd: " << LZ4F_getErrorName(c_size));
            return false;
        }
        return emit_(c_size);
    }

private:
    int fd_;
    LZ4F_compressionContext_t cctx_{nullptr};
    LZ4F_preferences_t prefs_{};
    std::vector<char> out_buf_;

    bool emit_(std::size_t n) noexcept {
        const char* p = out_buf_.data();
        while (n > 0) {
            const ssize_t w = ::write(fd_, p, n);
            if (w < 0) {
                if (errno == EINTR) continue;
                TM_ERROR("[ARCHIVE] write: " << std::strerror(errno));
                return false;
            }
            p += w;
            n -= static_cast<std::size_t>(w);
        }
        return true;
    }
};

// Copies one regular file into the frame as a tar member
bool append_member(Lz4FrameWriter& frame, const Member& m, std::vector<char>& buf) {
    struct stat st{};
    if (::stat(m.source.c_str(), &st) != 0 || !S_ISREG(st.st_mode)) {
        TM_ERROR("[ARCHIVE] Not a regular file: " << m.source.string());
        return false;
    }

    Block header;
    if (!make_header(header, m.name, static_cast<std::uint64_t>(st.st_size),
                     static_cast<std::uint64_t>(st.st_mtime))) {
        TM_ERROR("[ARCHIVE] Invalid member name: " << m.name);
        return false;
    }
    if (!frame.write(header.data(), header.size())) return false;

    std::ifstream in(m.source, std::ios::binary);
    if (!in) {
        TM_ERROR("[ARCHIVE] Cannot open " << m.source.string());
        return false;
    }

    // Exactly the size announced in the header, even if the file grows
    std::uint64_t left = static_cast<std::uint64_t>(st.st_size);
    while (left > 0) {
        const std::size_t want = left < buf.size() ? static_cast<std::size_t>(left) : buf.size();
        in.read(buf.data(), static_cast<std::streamsize>(want));
        const std::streamsize got = in.gcount();
        if (got <= 0) {
            TM_ERROR("[ARCHIVE] Short read on " << m.source.string());
            return false;
        }
        if (!frame.write(buf.data(), static_cast<std::size_t>(got))) return false;
        left -= static_cast<std::uint64_t>(got);
    }

    const std::size_t pad = (BLOCK_SIZE - static_cast<std::size_t>(st.st_size) % BLOCK_SIZE) % BLOCK_SIZE;
    if (pad > 0) {
        Block zeros{};
        if (!frame.write(zeros.data(), pad)) return false;
    }
    return true;
}

bool write_archive_body(int fd, const std::vector<Member>& members) {
    Lz4FrameWriter frame(fd);
    if (!frame.begin()) return false;

    std::vector<char> buf(CHUNK_SIZE);
    for (const auto& m : members) {
        if (!append_member(frame, m, buf)) return false;
    }

    // End-of-archive marker: two zero blocks
    Block zeros{};
    if (!frame.write(zeros.data(), zeros.size())) return false;
    if (!frame.write(zeros.data(), zeros.size())) return false;

    return frame.end();
}

// ----------------------------------------------------------------------------
// TarParser - incremental ustar reader fed with decompressed bytes
// ----------------------------------------------------------------------------
class TarParser {
public:
    explicit TarParser(bool keep_content) noexcept : keep_content_(keep_content) {}

    void feed(const char* p, std::size_t n) {
        while (n > 0 && !ended_) {
            if (content_left_ > 0) {
                const std::size_t take = clamp_(content_left_, n);
                if (keep_content_) entries_.back().content.append(p, take);
                content_left_ -= take;
                p += take;
                n -= take;
                continue;
            }
            if (pad_left_ > 0) {
                const std::size_t take = clamp_(pad_left_, n);
                pad_left_ -= take;
                p += take;
                n -= take;
                continue;
            }

            const std::size_t take = clamp_(BLOCK_SIZE - fill_, n);
            std::memcpy(header_.data() + fill_, p, take);
            fill_ += take;
            p += take;
            n -= take;
            if (fill_ < BLOCK_SIZE) continue;

            fill_ = 0;
            const char* h = header_.data();
            if (is_zero_block(h)) {
                ended_ = true;
                continue;
            }
            Entry e;
            e.name.assign(h, strnlen(h, 100));
            e.size  = parse_number(h + 124, 12);
            e.mtime = parse_number(h + 136, 12);
            content_left_ = e.size;
            pad_left_ = (BLOCK_SIZE - e.size % BLOCK_SIZE) % BLOCK_SIZE;
            entries_.push_back(std::move(e));
        }
    }

    // End-of-archive marker seen
    [[nodiscard]] bool complete() const noexcept { return ended_; }

    [[nodiscard]] std::vector<Entry>& entries() noexcept { return entries_; }

private:
    bool keep_content_;
    Block header_{};
    std::size_t fill_{0};
    std::uint64_t content_left_{0};
    std::uint64_t pad_left_{0};
    bool ended_{false};
    std::vector<Entry> entries_;

    static std::size_t clamp_(std::uint64_t want, std::size_t avail) noexcept {
        return want < avail ? static_cast<std::size_t>(want) : avail;
    }
};

// Streams the single LZ4 frame of `source` through the parser
bool decompress_into(const std::filesystem::path& source, TarParser& parser) {
    std::ifstream in(source, std::ios::binary);
    if (!in) return false;

    LZ4F_decompressionContext_t dctx;
    const LZ4F_errorCode_t err = LZ4F_createDecompressionContext(&dctx, LZ4F_VERSION);
    if (LZ4F_isError(err)) return false;

    struct ContextGuard {
        LZ4F_decompressionContext_t ctx;
        ~ContextGuard() { LZ4F_freeDecompressionContext(ctx); }
    } guard{dctx};

    std::vector<char> in_buf(CHUNK_SIZE);
    std::vector<char> out_buf(4 * CHUNK_SIZE);
    std::size_t hint = 1;

    while (hint != 0) {
        in.read(in_buf.data(), static_cast<std::streamsize>(in_buf.size()));
        const std::streamsize got = in.gcount();
        if (got <= 0) {
            // Input ended before the frame did
            return false;
        }

        const char* src = in_buf.data();
        std::size_t src_left = static_cast<std::size_t>(got);
        while (src_left > 0) {
            std::size_t dst_size = out_buf.size();
            std::size_t src_size = src_left;
            hint = LZ4F_decompress(dctx, out_buf.data(), &dst_size, src, &src_size, nullptr);
            if (LZ4F_isError(hint)) {
                TM_ERROR("[ARCHIVE] LZ4F_decompress: " << LZ4F_getErrorName(hint));
                return false;
            }
            parser.feed(out_buf.data(), dst_size);
            src += src_size;
            src_left -= src_size;
            if (hint == 0) break; // frame complete
        }
    }
    return true;
}

Error read_archive(const std::filesystem::path& source, bool keep_content, std::vector<Entry>& out) noexcept {
    try {
        TarParser parser(keep_content);
        if (!decompress_into(source, parser) || !parser.complete()) {
            return Error::IoFailure;
        }
        out = std::move(parser.entries());
        return Error::None;
    } catch (const std::bad_alloc&) {
        TM_ERROR("[ARCHIVE] Out of memory reading " << source.string());
        return Error::IoFailure;
    }
}

} // namespace

Error write_tar_lz4(const std::filesystem::path& target, const std::vector<Member>& members,
                    std::uint64_t& out_size) noexcept {
    try {
        std::filesystem::path tmp_path = target;
        tmp_path += ".tmp";

        const int fd = ::open(tmp_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
        if (fd < 0) {
            TM_ERROR("[ARCHIVE] Cannot create " << tmp_path.string() << ": " << std::strerror(errno));
            return Error::IoFailure;
        }

        bool ok = false;
        try {
            ok = write_archive_body(fd, members) && ::fdatasync(fd) == 0;
        } catch (const std::bad_alloc&) {
            TM_ERROR("[ARCHIVE] Out of memory writing " << tmp_path.string());
        }
        struct stat st{};
        const bool sized = ok && ::fstat(fd, &st) == 0;
        if (::close(fd) != 0 || !ok || !sized) {
            ::unlink(tmp_path.c_str());
            return Error::IoFailure;
        }

        std::error_code ec;
        std::filesystem::rename(tmp_path, target, ec);
        if (ec) {
            TM_ERROR("[ARCHIVE] Cannot rename " << tmp_path.string() << ": " << ec.message());
            ::unlink(tmp_path.c_str());
            return Error::IoFailure;
        }

        const int dir_fd = ::open(target.parent_path().c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
        if (dir_fd >= 0) {
            if (::fdatasync(dir_fd) != 0) {
                TM_WARN("[ARCHIVE] Directory sync failed for " << target.parent_path().string());
            }
            ::close(dir_fd);
        }

        out_size = static_cast<std::uint64_t>(st.st_size);
        TM_DEBUG("[ARCHIVE] Wrote " << target.string() << " (" << members.size() << " member(s), "
                 << lcr::format_bytes(out_size) << ")");
        return Error::None;
    } catch (const std::bad_alloc&) {
        TM_ERROR("[ARCHIVE] Out of memory preparing " << target.string());
        return Error::IoFailure;
    }
}

Error read_tar_lz4(const std::filesystem::path& source, std::vector<Entry>& out) noexcept {
    return read_archive(source, true, out);
}

Error list_tar_lz4(const std::filesystem::path& source, std::vector<Entry>& out) noexcept {
    return read_archive(source, false, out);
}

} // namespace telemux::core::archive
