#pragma once

/**
 * @file record_readers.hpp
 * @brief Record readers for the three supported on-disk formats.
 *
 * A @ref RecordReader turns the byte stream of one file into records. The
 * matching @ref RecordFormat knows how to open a file with the resolved
 * dataset settings, which lets @ref FileListDataset drive every format with
 * the same file-walking cursor.
 *
 * Supported formats:
 *   - TextLineReader:          one record per line, "\n" or "\r\n" terminated
 *   - FixedLengthRecordReader: equally sized records between a header and footer
 *   - FramedRecordReader:      length and CRC-32C protected frames (TFRecord layout)
 */

#include <cstddef>
#include <cstdint>
#include <memory>
#include <sstream>
#include <string>

#include "recordflow/byte_source.hpp"
#include "recordflow/coding.hpp"
#include "recordflow/config.hpp"
#include "recordflow/crc32c.hpp"
#include "recordflow/errors.hpp"

namespace recordflow {

/** Sequence of records read from a single file. */
class RecordReader {
  public:
    virtual ~RecordReader() = default;

    /// Store the next record in \p out. Returns false at a clean end of file.
    virtual bool read_record(std::string* out) = 0;
};

/** Capability to open one file as a @ref RecordReader. */
class RecordFormat {
  public:
    virtual ~RecordFormat() = default;

    virtual std::unique_ptr<RecordReader> open(const std::string& path) const = 0;

    /// Check a file before iteration starts. Formats without up front
    /// constraints accept every file.
    virtual void validate(const std::string& path) const { (void)path; }
};

// ---------------------------------------------------------------------------
// Text lines

class TextLineReader : public RecordReader {
  public:
    explicit TextLineReader(std::unique_ptr<ByteSource> src) : src_{std::move(src)} {}

    bool read_record(std::string* out) override { return src_->read_line(out); }

  private:
    std::unique_ptr<ByteSource> src_;
};

class TextLineFormat : public RecordFormat {
  public:
    explicit TextLineFormat(ReadOptions opts) : opts_{opts} {}

    std::unique_ptr<RecordReader> open(const std::string& path) const override {
        return std::make_unique<TextLineReader>(ByteSource::open(path, opts_));
    }

  private:
    ReadOptions opts_;
};

// ---------------------------------------------------------------------------
// Fixed length records

struct FixedLengthOptions {
    std::size_t record_bytes{1};
    std::size_t header_bytes{0};
    std::size_t footer_bytes{0};
};

/// Validate raw parameter values and convert them.
inline FixedLengthOptions make_fixed_length_options(std::int64_t record_bytes,
                                                    std::int64_t header_bytes,
                                                    std::int64_t footer_bytes) {
    if (record_bytes <= 0)
        throw InvalidArgumentError("record_bytes must be positive, got " +
                                   std::to_string(record_bytes));
    if (header_bytes < 0 || footer_bytes < 0)
        throw InvalidArgumentError("header_bytes and footer_bytes must not be negative");
    return FixedLengthOptions{static_cast<std::size_t>(record_bytes),
                              static_cast<std::size_t>(header_bytes),
                              static_cast<std::size_t>(footer_bytes)};
}

/// Throw InvalidArgumentError unless a file of \p size bytes holds a whole
/// number of records between header and footer.
inline void check_fixed_length_size(const std::string& path, std::uint64_t size,
                                    const FixedLengthOptions& opts) {
    std::uint64_t framing = opts.header_bytes + opts.footer_bytes;
    if (size < framing || (size - framing) % opts.record_bytes != 0) {
        std::ostringstream msg;
        msg << path << ": size " << size << " minus header " << opts.header_bytes
            << " and footer " << opts.footer_bytes << " bytes is not a multiple of record size "
            << opts.record_bytes;
        throw InvalidArgumentError(msg.str());
    }
}

/**
 * @brief Reader for equally sized binary records.
 *
 * The header is skipped once and the footer is never returned. The reader
 * keeps `footer_bytes` of look-ahead so it also works on decompressed
 * streams whose length is not known up front; a stream that ends with a
 * partial record raises InvalidArgumentError.
 */
class FixedLengthRecordReader : public RecordReader {
  public:
    FixedLengthRecordReader(std::unique_ptr<ByteSource> src, FixedLengthOptions opts)
        : src_{std::move(src)}, opts_{opts} {}

    bool read_record(std::string* out) override {
        if (!started_) {
            started_ = true;
            if (src_->skip(opts_.header_bytes) < opts_.header_bytes)
                fail_size();
        }
        std::size_t need = opts_.record_bytes + opts_.footer_bytes;
        while (pending_.size() < need) {
            if (src_->read_exact(need - pending_.size(), &chunk_) == 0)
                break;
            pending_ += chunk_;
        }
        if (pending_.size() < need) {
            if (pending_.size() == opts_.footer_bytes)
                return false;
            fail_size();
        }
        out->assign(pending_, 0, opts_.record_bytes);
        pending_.erase(0, opts_.record_bytes);
        return true;
    }

  private:
    void fail_size() const {
        std::ostringstream msg;
        msg << src_->path() << ": stream of " << src_->offset() + pending_.size()
            << " bytes does not hold whole records of " << opts_.record_bytes
            << " bytes between a " << opts_.header_bytes << " byte header and a "
            << opts_.footer_bytes << " byte footer";
        throw InvalidArgumentError(msg.str());
    }

    std::unique_ptr<ByteSource> src_;
    FixedLengthOptions opts_;
    std::string pending_{};
    std::string chunk_{};
    bool started_{false};
};

class FixedLengthFormat : public RecordFormat {
  public:
    FixedLengthFormat(ReadOptions read, FixedLengthOptions opts) : read_{read}, opts_{opts} {}

    std::unique_ptr<RecordReader> open(const std::string& path) const override {
        return std::make_unique<FixedLengthRecordReader>(ByteSource::open(path, read_), opts_);
    }

    /// Uncompressed files are measured on disk so a bad size is reported
    /// before any record is read. Compressed files are checked while reading.
    void validate(const std::string& path) const override {
        if (read_.compression == CompressionType::None)
            check_fixed_length_size(path, file_size(path), opts_);
    }

  private:
    ReadOptions read_;
    FixedLengthOptions opts_;
};

// ---------------------------------------------------------------------------
// Framed records

/**
 * @brief Reader for length prefixed, checksummed frames.
 *
 * Each frame is laid out as
 *
 *     uint64 length
 *     uint32 masked crc32c of length
 *     byte   data[length]
 *     uint32 masked crc32c of data
 *
 * with every integer little endian. Zero bytes before a header is a clean
 * end of file; any other shortfall or checksum mismatch raises
 * DataLossError. After a failure the reader keeps reporting the same error
 * rather than trying to resynchronise.
 */
class FramedRecordReader : public RecordReader {
  public:
    static constexpr std::size_t kHeaderSize = sizeof(std::uint64_t) + sizeof(std::uint32_t);
    static constexpr std::size_t kFooterSize = sizeof(std::uint32_t);

    explicit FramedRecordReader(std::unique_ptr<ByteSource> src,
                                std::uint64_t max_record = max_record_bytes())
        : src_{std::move(src)}, max_record_{max_record} {}

    bool read_record(std::string* out) override {
        if (!error_.empty())
            throw DataLossError(error_);
        std::uint64_t pos = src_->offset();
        std::size_t got = src_->read_exact(kHeaderSize, &header_);
        if (got == 0)
            return false;
        if (got < kHeaderSize)
            fail(pos, "truncated record header");
        if (crc32c::unmask(decode_fixed32(header_.data() + 8)) !=
            crc32c::value(header_.data(), sizeof(std::uint64_t)))
            fail(pos, "corrupted record length");
        std::uint64_t length = decode_fixed64(header_.data());
        if (length > max_record_)
            fail(pos, "record length " + std::to_string(length) + " exceeds limit");
        std::size_t want = static_cast<std::size_t>(length) + kFooterSize;
        if (src_->read_exact(want, out) < want)
            fail(pos, "truncated record");
        std::uint32_t masked = decode_fixed32(out->data() + length);
        if (crc32c::unmask(masked) != crc32c::value(out->data(), static_cast<std::size_t>(length)))
            fail(pos, "corrupted record data");
        out->resize(static_cast<std::size_t>(length));
        return true;
    }

  private:
    void fail(std::uint64_t pos, const std::string& what) {
        error_ = src_->path() + ": " + what + " at offset " + std::to_string(pos);
        throw DataLossError(error_);
    }

    std::unique_ptr<ByteSource> src_;
    std::uint64_t max_record_;
    std::string header_{};
    std::string error_{};
};

class FramedFormat : public RecordFormat {
  public:
    explicit FramedFormat(ReadOptions opts) : opts_{opts} {}

    std::unique_ptr<RecordReader> open(const std::string& path) const override {
        return std::make_unique<FramedRecordReader>(ByteSource::open(path, opts_));
    }

  private:
    ReadOptions opts_;
};

} // namespace recordflow
