#pragma once

/**
 * @file record_writer.hpp
 * @brief Writers producing files the framed reader accepts.
 *
 * The output side mirrors @ref byte_source.hpp: a @ref FileOutputStream
 * writes raw bytes and @ref ZlibOutputStream or @ref ZstdOutputStream
 * compress on the way. @ref FramedRecordWriter frames each record with its
 * length and CRC-32C checksums.
 */

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <limits>
#include <memory>
#include <string>
#include <vector>
#include <zlib.h>

#include "recordflow/byte_source.hpp"
#include "recordflow/coding.hpp"
#include "recordflow/config.hpp"
#include "recordflow/crc32c.hpp"
#include "recordflow/errors.hpp"

#if RECORDFLOW_HAS_ZSTD
#include <zstd.h>
#endif

namespace recordflow {

/** Push based byte sink. */
class OutputStream {
  public:
    virtual ~OutputStream() = default;
    virtual void write(const char* data, std::size_t n) = 0;
    virtual void flush() = 0;
    /// Finish the stream. Further writes are invalid.
    virtual void close() = 0;
};

class FileOutputStream : public OutputStream {
  public:
    explicit FileOutputStream(const std::string& path)
        : path_{path}, out_{path, std::ios::binary | std::ios::trunc} {
        if (!out_)
            throw NotFoundError(path + ": failed to open for writing");
    }

    void write(const char* data, std::size_t n) override {
        out_.write(data, static_cast<std::streamsize>(n));
        check();
    }

    void flush() override {
        out_.flush();
        check();
    }

    void close() override {
        if (!out_.is_open())
            return;
        out_.close();
        check();
    }

  private:
    void check() {
        if (!out_)
            throw DataLossError(path_ + ": write failure");
    }

    std::string path_;
    std::ofstream out_;
};

/** GZIP or ZLIB framed deflate compression. */
class ZlibOutputStream : public OutputStream {
  public:
    ZlibOutputStream(std::unique_ptr<OutputStream> inner, CompressionType type,
                     std::size_t buffer_size = kDefaultBufferSize)
        : inner_{std::move(inner)}, out_buf_(std::max<std::size_t>(buffer_size, 64)) {
        int window = type == CompressionType::Gzip ? 16 + MAX_WBITS : MAX_WBITS;
        if (deflateInit2(&strm_, Z_DEFAULT_COMPRESSION, Z_DEFLATED, window, 8,
                         Z_DEFAULT_STRATEGY) != Z_OK)
            throw DataLossError("failed to initialise zlib stream");
    }

    ZlibOutputStream(const ZlibOutputStream&) = delete;
    ZlibOutputStream& operator=(const ZlibOutputStream&) = delete;

    ~ZlibOutputStream() override { deflateEnd(&strm_); }

    void write(const char* data, std::size_t n) override {
        while (n > 0) {
            std::size_t chunk = std::min<std::size_t>(n, std::numeric_limits<uInt>::max());
            strm_.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data));
            strm_.avail_in = static_cast<uInt>(chunk);
            drain(Z_NO_FLUSH);
            data += chunk;
            n -= chunk;
        }
    }

    void flush() override {
        drain(Z_SYNC_FLUSH);
        inner_->flush();
    }

    void close() override {
        if (closed_)
            return;
        closed_ = true;
        drain(Z_FINISH);
        inner_->close();
    }

  private:
    /// Run deflate until all pending input (and for Z_FINISH, the trailer)
    /// has been handed to the inner stream.
    void drain(int mode) {
        while (true) {
            strm_.next_out = reinterpret_cast<Bytef*>(out_buf_.data());
            strm_.avail_out = static_cast<uInt>(out_buf_.size());
            int rc = deflate(&strm_, mode);
            if (rc == Z_STREAM_ERROR)
                throw DataLossError("deflate failed");
            std::size_t have = out_buf_.size() - strm_.avail_out;
            if (have > 0)
                inner_->write(out_buf_.data(), have);
            if (mode == Z_FINISH ? rc == Z_STREAM_END
                                 : (strm_.avail_in == 0 && strm_.avail_out != 0))
                return;
        }
    }

    std::unique_ptr<OutputStream> inner_;
    std::vector<char> out_buf_;
    z_stream strm_{};
    bool closed_{false};
};

#if RECORDFLOW_HAS_ZSTD
class ZstdOutputStream : public OutputStream {
  public:
    explicit ZstdOutputStream(std::unique_ptr<OutputStream> inner, int level = 3)
        : inner_{std::move(inner)}, out_buf_(ZSTD_CStreamOutSize()), cctx_{ZSTD_createCCtx()} {
        if (!cctx_)
            throw DataLossError("failed to create zstd context");
        ZSTD_CCtx_setParameter(cctx_, ZSTD_c_compressionLevel, level);
    }

    ZstdOutputStream(const ZstdOutputStream&) = delete;
    ZstdOutputStream& operator=(const ZstdOutputStream&) = delete;

    ~ZstdOutputStream() override { ZSTD_freeCCtx(cctx_); }

    void write(const char* data, std::size_t n) override {
        ZSTD_inBuffer in{data, n, 0};
        while (in.pos < in.size)
            step(&in, ZSTD_e_continue);
    }

    void flush() override {
        ZSTD_inBuffer in{nullptr, 0, 0};
        while (step(&in, ZSTD_e_flush) != 0) {
        }
        inner_->flush();
    }

    void close() override {
        if (closed_)
            return;
        closed_ = true;
        ZSTD_inBuffer in{nullptr, 0, 0};
        while (step(&in, ZSTD_e_end) != 0) {
        }
        inner_->close();
    }

  private:
    std::size_t step(ZSTD_inBuffer* in, ZSTD_EndDirective mode) {
        ZSTD_outBuffer out{out_buf_.data(), out_buf_.size(), 0};
        std::size_t remaining = ZSTD_compressStream2(cctx_, &out, in, mode);
        if (ZSTD_isError(remaining))
            throw DataLossError(std::string("zstd compression failed: ") +
                                ZSTD_getErrorName(remaining));
        if (out.pos > 0)
            inner_->write(out_buf_.data(), out.pos);
        return remaining;
    }

    std::unique_ptr<OutputStream> inner_;
    std::vector<char> out_buf_;
    ZSTD_CCtx* cctx_;
    bool closed_{false};
};
#endif

/// Open \p path for writing through the requested compression.
inline std::unique_ptr<OutputStream> open_output_stream(const std::string& path,
                                                        CompressionType compression) {
    std::unique_ptr<OutputStream> out = std::make_unique<FileOutputStream>(path);
    switch (compression) {
    case CompressionType::Gzip:
    case CompressionType::Zlib:
        return std::make_unique<ZlibOutputStream>(std::move(out), compression);
    case CompressionType::Zstd:
#if RECORDFLOW_HAS_ZSTD
        return std::make_unique<ZstdOutputStream>(std::move(out));
#else
        throw InvalidArgumentError("ZSTD compression is not available in this build");
#endif
    case CompressionType::None:
    default:
        return out;
    }
}

/// Serialise one record in the framed layout.
inline std::string encode_framed_record(const std::string& record) {
    std::string out;
    out.reserve(record.size() + 16);
    put_fixed64(&out, record.size());
    put_fixed32(&out, crc32c::mask(crc32c::value(out.data(), sizeof(std::uint64_t))));
    out += record;
    put_fixed32(&out, crc32c::mask(crc32c::value(record.data(), record.size())));
    return out;
}

/**
 * @brief Write records readable by @ref FramedRecordReader.
 *
 * The file is finished by @ref close or, failing that, by the destructor.
 * Errors raised while closing from the destructor are reported on stderr.
 */
class FramedRecordWriter {
  public:
    explicit FramedRecordWriter(const std::string& path,
                                CompressionType compression = CompressionType::None)
        : path_{path}, out_{open_output_stream(path, compression)} {}

    FramedRecordWriter(const FramedRecordWriter&) = delete;
    FramedRecordWriter& operator=(const FramedRecordWriter&) = delete;

    ~FramedRecordWriter() {
        if (!out_)
            return;
        try {
            close();
        } catch (const Error& e) {
            std::cerr << "recordflow: " << e.what() << '\n';
        }
    }

    void write(const std::string& record) {
        if (!out_)
            throw FailedPreconditionError(path_ + ": writer is closed");
        auto frame = encode_framed_record(record);
        out_->write(frame.data(), frame.size());
        ++count_;
    }

    void flush() {
        if (out_)
            out_->flush();
    }

    void close() {
        if (!out_)
            return;
        auto out = std::move(out_);
        out->close();
    }

    std::size_t records_written() const { return count_; }

  private:
    std::string path_;
    std::unique_ptr<OutputStream> out_;
    std::size_t count_{0};
};

} // namespace recordflow
