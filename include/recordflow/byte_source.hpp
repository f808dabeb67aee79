#pragma once

/**
 * @file byte_source.hpp
 * @brief Buffered, optionally decompressed byte streams over local files.
 *
 * Reading is layered. A @ref FileInputStream pulls raw bytes from disk, an
 * optional decompressing stream (@ref ZlibInputStream for GZIP and ZLIB,
 * @ref ZstdInputStream for ZSTD) inflates them and a @ref ByteSource adds a
 * read-ahead buffer plus the line and fixed-size helpers the record readers
 * are written against.
 *
 * The buffer size only decides how many bytes are requested from the layer
 * below in one call. Record boundaries are computed on the decoded stream so
 * a 10 byte buffer and a 1 MiB buffer yield identical records.
 */

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <limits>
#include <memory>
#include <string>
#include <system_error>
#include <vector>
#include <zlib.h>

#include "recordflow/config.hpp"
#include "recordflow/errors.hpp"

#if RECORDFLOW_HAS_ZSTD
#include <zstd.h>
#endif

namespace recordflow {

/// Compression envelope wrapped around a file.
enum class CompressionType { None, Gzip, Zlib, Zstd };

/// Map the user facing name ("", "GZIP", "ZLIB", "ZSTD") to the enum.
inline CompressionType parse_compression_type(const std::string& name) {
    if (name.empty())
        return CompressionType::None;
    if (name == "GZIP")
        return CompressionType::Gzip;
    if (name == "ZLIB")
        return CompressionType::Zlib;
    if (name == "ZSTD") {
        if (!zstd_available())
            throw InvalidArgumentError("ZSTD compression is not available in this build");
        return CompressionType::Zstd;
    }
    throw InvalidArgumentError("unsupported compression type '" + name + "'");
}

inline const char* compression_type_name(CompressionType type) {
    switch (type) {
    case CompressionType::Gzip:
        return "GZIP";
    case CompressionType::Zlib:
        return "ZLIB";
    case CompressionType::Zstd:
        return "ZSTD";
    case CompressionType::None:
    default:
        return "";
    }
}

/// Resolved read settings shared by every file of a dataset.
struct ReadOptions {
    CompressionType compression{CompressionType::None};
    std::size_t buffer_size{kDefaultBufferSize};
};

/// Validate a user supplied buffer size and convert it.
inline std::size_t checked_buffer_size(std::int64_t size) {
    if (size <= 0)
        throw InvalidArgumentError("buffer_size must be positive, got " + std::to_string(size));
    return static_cast<std::size_t>(size);
}

/// Fail with NotFoundError unless \p path names something readable as a file.
inline void require_readable_file(const std::string& path) {
    std::error_code ec;
    auto st = std::filesystem::status(path, ec);
    if (ec || !std::filesystem::exists(st))
        throw NotFoundError(path + ": no such file");
    if (std::filesystem::is_directory(st))
        throw NotFoundError(path + ": is a directory");
}

/// Size in bytes of a regular file on disk.
inline std::uint64_t file_size(const std::string& path) {
    require_readable_file(path);
    std::error_code ec;
    auto size = std::filesystem::file_size(path, ec);
    if (ec)
        throw NotFoundError(path + ": " + ec.message());
    return static_cast<std::uint64_t>(size);
}

// ---------------------------------------------------------------------------
// Unbuffered streams
// ---------------------------------------------------------------------------

/** Pull based stream of bytes. */
class InputStream {
  public:
    virtual ~InputStream() = default;

    /// Read up to \p n bytes into \p dst. Returns 0 only at end of stream.
    virtual std::size_t read(char* dst, std::size_t n) = 0;
};

/**
 * @brief Raw bytes of a local file.
 *
 * The standard library buffer is disabled so the owning @ref ByteSource is
 * the only layer deciding the I/O granularity.
 */
class FileInputStream : public InputStream {
  public:
    explicit FileInputStream(const std::string& path) : path_{path} {
        require_readable_file(path);
        in_.rdbuf()->pubsetbuf(nullptr, 0);
        in_.open(path, std::ios::binary);
        if (!in_)
            throw NotFoundError(path + ": failed to open for reading");
    }

    std::size_t read(char* dst, std::size_t n) override {
        if (n == 0 || in_.eof())
            return 0;
        in_.read(dst, static_cast<std::streamsize>(n));
        if (in_.bad())
            throw DataLossError(path_ + ": read failure");
        return static_cast<std::size_t>(in_.gcount());
    }

  private:
    std::string path_;
    std::ifstream in_{};
};

/**
 * @brief Streaming inflation of GZIP or ZLIB framed data.
 *
 * Concatenated gzip members are decoded back to back as gzip(1) does. A
 * stream that ends before the final deflate block, a bad header or a bad
 * checksum raises DataLossError.
 */
class ZlibInputStream : public InputStream {
  public:
    ZlibInputStream(std::unique_ptr<InputStream> inner, CompressionType type,
                    std::size_t buffer_size, std::string path)
        : inner_{std::move(inner)}, type_{type}, in_buf_(std::max<std::size_t>(buffer_size, 1)),
          path_{std::move(path)} {
        int window = type_ == CompressionType::Gzip ? 16 + MAX_WBITS : MAX_WBITS;
        if (inflateInit2(&strm_, window) != Z_OK)
            throw DataLossError(path_ + ": failed to initialise zlib stream");
    }

    ZlibInputStream(const ZlibInputStream&) = delete;
    ZlibInputStream& operator=(const ZlibInputStream&) = delete;

    ~ZlibInputStream() override { inflateEnd(&strm_); }

    std::size_t read(char* dst, std::size_t n) override {
        if (done_ || n == 0)
            return 0;
        n = std::min<std::size_t>(n, std::numeric_limits<uInt>::max());
        strm_.next_out = reinterpret_cast<Bytef*>(dst);
        strm_.avail_out = static_cast<uInt>(n);
        std::size_t produced = 0;
        while (produced == 0 && !done_) {
            if (strm_.avail_in == 0 && !inner_eof_)
                refill();
            int rc = inflate(&strm_, Z_NO_FLUSH);
            produced = n - strm_.avail_out;
            if (rc == Z_STREAM_END) {
                if (type_ == CompressionType::Gzip) {
                    if (strm_.avail_in == 0 && !inner_eof_)
                        refill();
                    if (strm_.avail_in > 0) {
                        // Another gzip member follows.
                        inflateReset(&strm_);
                        continue;
                    }
                }
                done_ = true;
            } else if (rc == Z_BUF_ERROR) {
                if (inner_eof_ && strm_.avail_in == 0 && produced == 0)
                    throw DataLossError(path_ + ": unexpected end of " +
                                        compression_type_name(type_) + " stream");
            } else if (rc != Z_OK) {
                throw DataLossError(path_ + ": corrupt " + compression_type_name(type_) +
                                    " stream (" + (strm_.msg ? strm_.msg : "inflate failed") +
                                    ")");
            }
        }
        return produced;
    }

  private:
    void refill() {
        std::size_t got = inner_->read(in_buf_.data(), in_buf_.size());
        if (got == 0)
            inner_eof_ = true;
        strm_.next_in = reinterpret_cast<Bytef*>(in_buf_.data());
        strm_.avail_in = static_cast<uInt>(got);
    }

    std::unique_ptr<InputStream> inner_;
    CompressionType type_;
    std::vector<char> in_buf_;
    std::string path_;
    z_stream strm_{};
    bool inner_eof_{false};
    bool done_{false};
};

#if RECORDFLOW_HAS_ZSTD
/** Streaming decoder for one or more zstd frames. */
class ZstdInputStream : public InputStream {
  public:
    ZstdInputStream(std::unique_ptr<InputStream> inner, std::size_t buffer_size, std::string path)
        : inner_{std::move(inner)}, in_buf_(std::max<std::size_t>(buffer_size, 1)),
          path_{std::move(path)}, dctx_{ZSTD_createDCtx()} {
        if (!dctx_)
            throw DataLossError(path_ + ": failed to create zstd context");
    }

    ZstdInputStream(const ZstdInputStream&) = delete;
    ZstdInputStream& operator=(const ZstdInputStream&) = delete;

    ~ZstdInputStream() override { ZSTD_freeDCtx(dctx_); }

    std::size_t read(char* dst, std::size_t n) override {
        if (n == 0)
            return 0;
        ZSTD_outBuffer out{dst, n, 0};
        while (out.pos == 0) {
            if (input_.pos == input_.size && !inner_eof_) {
                std::size_t got = inner_->read(in_buf_.data(), in_buf_.size());
                if (got == 0)
                    inner_eof_ = true;
                input_ = ZSTD_inBuffer{in_buf_.data(), got, 0};
            }
            std::size_t before = input_.pos;
            std::size_t ret = ZSTD_decompressStream(dctx_, &out, &input_);
            if (ZSTD_isError(ret))
                throw DataLossError(path_ + ": corrupt ZSTD stream (" + ZSTD_getErrorName(ret) +
                                    ")");
            if (out.pos == 0 && input_.pos == before && inner_eof_) {
                // No progress possible. Fine only at a frame boundary.
                if (frame_pending_)
                    throw DataLossError(path_ + ": unexpected end of ZSTD stream");
                return 0;
            }
            frame_pending_ = ret != 0;
        }
        return out.pos;
    }

  private:
    std::unique_ptr<InputStream> inner_;
    std::vector<char> in_buf_;
    std::string path_;
    ZSTD_DCtx* dctx_;
    ZSTD_inBuffer input_{nullptr, 0, 0};
    bool inner_eof_{false};
    bool frame_pending_{true};
};
#endif

// ---------------------------------------------------------------------------
// Buffered source
// ---------------------------------------------------------------------------

/**
 * @brief Read-ahead buffer over a file stream.
 *
 * Owns the file for as long as it lives; destroying the source closes it.
 * Offsets reported in error messages count decoded bytes.
 */
class ByteSource {
  public:
    /**
     * Open \p path for reading.
     *
     * @param path        local file to read
     * @param compression envelope to strip while reading
     * @param buffer_size read-ahead size in bytes, must be positive
     */
    static std::unique_ptr<ByteSource> open(const std::string& path,
                                            CompressionType compression = CompressionType::None,
                                            std::size_t buffer_size = default_buffer_size()) {
        if (buffer_size == 0)
            throw InvalidArgumentError("buffer_size must be positive");
        std::unique_ptr<InputStream> in = std::make_unique<FileInputStream>(path);
        switch (compression) {
        case CompressionType::Gzip:
        case CompressionType::Zlib:
            in = std::make_unique<ZlibInputStream>(std::move(in), compression, buffer_size, path);
            break;
        case CompressionType::Zstd:
#if RECORDFLOW_HAS_ZSTD
            in = std::make_unique<ZstdInputStream>(std::move(in), buffer_size, path);
            break;
#else
            throw InvalidArgumentError("ZSTD compression is not available in this build");
#endif
        case CompressionType::None:
        default:
            break;
        }
        return std::make_unique<ByteSource>(std::move(in), buffer_size, path);
    }

    static std::unique_ptr<ByteSource> open(const std::string& path, const ReadOptions& opts) {
        return open(path, opts.compression, opts.buffer_size);
    }

    ByteSource(std::unique_ptr<InputStream> in, std::size_t buffer_size, std::string path)
        : in_{std::move(in)}, buf_(buffer_size), path_{std::move(path)} {}

    const std::string& path() const { return path_; }

    /// Number of decoded bytes consumed so far.
    std::uint64_t offset() const { return offset_; }

    /// Replace \p out with up to \p max_bytes bytes. False only at end of stream.
    bool read_chunk(std::size_t max_bytes, std::string* out) {
        out->clear();
        if (max_bytes == 0)
            return true;
        if (pos_ == end_ && !fill())
            return false;
        std::size_t take = std::min(max_bytes, end_ - pos_);
        out->assign(buf_.data() + pos_, take);
        consume(take);
        return true;
    }

    /// Replace \p out with the next \p n bytes, fewer only at end of stream.
    /// @return the number of bytes stored in \p out
    std::size_t read_exact(std::size_t n, std::string* out) {
        out->clear();
        out->reserve(n);
        while (out->size() < n) {
            if (pos_ == end_ && !fill())
                break;
            std::size_t take = std::min(n - out->size(), end_ - pos_);
            out->append(buf_.data() + pos_, take);
            consume(take);
        }
        return out->size();
    }

    /**
     * Read one line into \p out without its terminator.
     *
     * Both "\n" and "\r\n" end a line. A final line lacking a terminator is
     * still returned. Returns false when no bytes remain.
     */
    bool read_line(std::string* out) {
        out->clear();
        bool any = false;
        while (true) {
            if (pos_ == end_ && !fill())
                return any;
            any = true;
            const char* start = buf_.data() + pos_;
            const void* nl = std::memchr(start, '\n', end_ - pos_);
            if (!nl) {
                out->append(start, end_ - pos_);
                consume(end_ - pos_);
                continue;
            }
            std::size_t len = static_cast<const char*>(nl) - start;
            out->append(start, len);
            consume(len + 1);
            if (!out->empty() && out->back() == '\r')
                out->pop_back();
            return true;
        }
    }

    /// Discard up to \p n bytes. Returns how many were skipped.
    std::size_t skip(std::size_t n) {
        std::size_t skipped = 0;
        while (skipped < n) {
            if (pos_ == end_ && !fill())
                break;
            std::size_t take = std::min(n - skipped, end_ - pos_);
            consume(take);
            skipped += take;
        }
        return skipped;
    }

  private:
    bool fill() {
        if (eof_)
            return false;
        std::size_t got = in_->read(buf_.data(), buf_.size());
        if (got == 0) {
            eof_ = true;
            return false;
        }
        pos_ = 0;
        end_ = got;
        return true;
    }

    void consume(std::size_t n) {
        pos_ += n;
        offset_ += n;
    }

    std::unique_ptr<InputStream> in_;
    std::vector<char> buf_;
    std::string path_;
    std::size_t pos_{0};
    std::size_t end_{0};
    std::uint64_t offset_{0};
    bool eof_{false};
};

} // namespace recordflow
