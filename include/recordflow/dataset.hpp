#pragma once

/**
 * @file dataset.hpp
 * @brief Immutable dataset descriptions and the cursors built from them.
 *
 * A dataset is a description of a sequence, not a container. Calling
 * @ref Dataset::make_cursor resolves every @ref Param against a feed and
 * returns a fresh @ref Cursor positioned at the start of the sequence.
 * Because nothing in a description changes after construction, one source
 * dataset can be shared by any number of pipelines.
 *
 * The available datasets are:
 *   - TextLineDataset:          lines of text files
 *   - FixedLengthRecordDataset: fixed size binary records
 *   - FramedRecordDataset:      length prefixed, checksummed frames
 *   - RepeatDataset:            replay another dataset for several epochs
 *   - BatchDataset:             group consecutive elements
 *
 * Typical use:
 *
 *     auto files = placeholder<std::vector<std::string>>("filenames");
 *     auto ds = text_line_dataset(files)->repeat(10)->batch(5);
 *     Iterator it = Iterator::from_structure(ds->output_types());
 *     it.initialize(ds, {{"filenames", std::vector<std::string>{"a.txt"}}});
 */

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "recordflow/byte_source.hpp"
#include "recordflow/config.hpp"
#include "recordflow/core.hpp"
#include "recordflow/errors.hpp"
#include "recordflow/params.hpp"
#include "recordflow/record_readers.hpp"

namespace recordflow {

class Dataset;
using DatasetPtr = std::shared_ptr<const Dataset>;

/// Epoch count meaning "repeat until the consumer stops pulling".
inline constexpr std::int64_t kRepeatForever = -1;

/**
 * @brief Description of a sequence producing computation.
 *
 * Datasets are always held through @ref DatasetPtr; use the factory
 * functions below or `std::make_shared` to create them.
 */
class Dataset : public std::enable_shared_from_this<Dataset> {
  public:
    virtual ~Dataset() = default;

    /// Type and shape of every element.
    virtual OutputSignature output_signature() const = 0;

    /// Element type only, suitable for an iterator shared between datasets
    /// of different shapes.
    OutputSignature output_types() const { return OutputSignature{output_signature().dtype}; }

    /// Resolve parameters against \p feed and build a cursor at the start.
    virtual std::unique_ptr<Cursor> make_cursor(const FeedDict& feed) const = 0;

    DatasetPtr repeat(Param<std::int64_t> count = kRepeatForever) const;
    DatasetPtr batch(Param<std::int64_t> batch_size) const;
};

// ---------------------------------------------------------------------------
// File sources

/**
 * @brief Cursor walking a list of files with one record format.
 *
 * Files are opened lazily, one at a time, and closed as soon as their last
 * record has been returned.
 */
class FileListCursor : public Cursor {
  public:
    FileListCursor(std::vector<std::string> filenames, std::unique_ptr<RecordFormat> format)
        : filenames_{std::move(filenames)}, format_{std::move(format)} {}

    bool next(Value& out) override {
        while (index_ < filenames_.size()) {
            if (!reader_)
                reader_ = format_->open(filenames_[index_]);
            if (reader_->read_record(&record_)) {
                out = Value{std::move(record_)};
                record_.clear();
                return true;
            }
            reader_.reset();
            ++index_;
        }
        return false;
    }

    std::size_t file_index() const { return index_; }

  private:
    std::vector<std::string> filenames_;
    std::unique_ptr<RecordFormat> format_;
    std::unique_ptr<RecordReader> reader_{};
    std::string record_{};
    std::size_t index_{0};
};

/**
 * @brief Shared parameters of the file based datasets.
 *
 * Subclasses only decide which @ref RecordFormat reads a file.
 */
class FileListDataset : public Dataset {
  public:
    FileListDataset(Param<std::vector<std::string>> filenames, Param<std::string> compression,
                    Param<std::int64_t> buffer_size)
        : filenames_{std::move(filenames)}, compression_{std::move(compression)},
          buffer_size_{std::move(buffer_size)} {}

    OutputSignature output_signature() const override {
        return OutputSignature{Value::DType::String, PartialShape{}};
    }

    std::unique_ptr<Cursor> make_cursor(const FeedDict& feed) const override {
        auto files = filenames_.resolve(feed);
        ReadOptions read;
        read.compression = parse_compression_type(compression_.resolve(feed));
        read.buffer_size = checked_buffer_size(buffer_size_.resolve(feed));
        auto format = make_format(feed, read);
        for (const auto& f : files)
            format->validate(f);
        return std::make_unique<FileListCursor>(std::move(files), std::move(format));
    }

  protected:
    virtual std::unique_ptr<RecordFormat> make_format(const FeedDict& feed,
                                                      const ReadOptions& read) const = 0;

  private:
    Param<std::vector<std::string>> filenames_;
    Param<std::string> compression_;
    Param<std::int64_t> buffer_size_;
};

inline std::int64_t default_buffer_param() {
    return static_cast<std::int64_t>(default_buffer_size());
}

/// Lines of one or more text files.
class TextLineDataset : public FileListDataset {
  public:
    explicit TextLineDataset(Param<std::vector<std::string>> filenames,
                             Param<std::string> compression = std::string(),
                             Param<std::int64_t> buffer_size = default_buffer_param())
        : FileListDataset{std::move(filenames), std::move(compression), std::move(buffer_size)} {}

  protected:
    std::unique_ptr<RecordFormat> make_format(const FeedDict&,
                                              const ReadOptions& read) const override {
        return std::make_unique<TextLineFormat>(read);
    }
};

/// Fixed size records between an optional header and footer.
class FixedLengthRecordDataset : public FileListDataset {
  public:
    FixedLengthRecordDataset(Param<std::vector<std::string>> filenames,
                             Param<std::int64_t> record_bytes, Param<std::int64_t> header_bytes = 0,
                             Param<std::int64_t> footer_bytes = 0,
                             Param<std::int64_t> buffer_size = default_buffer_param(),
                             Param<std::string> compression = std::string())
        : FileListDataset{std::move(filenames), std::move(compression), std::move(buffer_size)},
          record_bytes_{std::move(record_bytes)}, header_bytes_{std::move(header_bytes)},
          footer_bytes_{std::move(footer_bytes)} {}

  protected:
    std::unique_ptr<RecordFormat> make_format(const FeedDict& feed,
                                              const ReadOptions& read) const override {
        auto opts = make_fixed_length_options(record_bytes_.resolve(feed),
                                              header_bytes_.resolve(feed),
                                              footer_bytes_.resolve(feed));
        return std::make_unique<FixedLengthFormat>(read, opts);
    }

  private:
    Param<std::int64_t> record_bytes_;
    Param<std::int64_t> header_bytes_;
    Param<std::int64_t> footer_bytes_;
};

/// Payloads of framed record files.
class FramedRecordDataset : public FileListDataset {
  public:
    explicit FramedRecordDataset(Param<std::vector<std::string>> filenames,
                                 Param<std::string> compression = std::string(),
                                 Param<std::int64_t> buffer_size = default_buffer_param())
        : FileListDataset{std::move(filenames), std::move(compression), std::move(buffer_size)} {}

  protected:
    std::unique_ptr<RecordFormat> make_format(const FeedDict&,
                                              const ReadOptions& read) const override {
        return std::make_unique<FramedFormat>(read);
    }
};

// ---------------------------------------------------------------------------
// Transformations

/**
 * @brief Cursor replaying an inner dataset for a number of epochs.
 *
 * Every epoch builds a new inner cursor, so files are re-opened from the
 * start of the list. If a whole epoch yields nothing the sequence ends even
 * when repeating forever.
 */
class RepeatCursor : public Cursor {
  public:
    RepeatCursor(DatasetPtr inner, FeedDict feed, std::int64_t count)
        : inner_{std::move(inner)}, feed_{std::move(feed)}, count_{count} {
        // The first epoch is built here so parameter and file errors surface
        // when the iterator is initialized. Zero epochs open nothing.
        if (count_ != 0)
            cursor_ = inner_->make_cursor(feed_);
    }

    bool next(Value& out) override {
        while (count_ < 0 || epoch_ < count_) {
            if (!cursor_) {
                cursor_ = inner_->make_cursor(feed_);
                produced_ = false;
            }
            if (cursor_->next(out)) {
                produced_ = true;
                return true;
            }
            cursor_.reset();
            ++epoch_;
            if (!produced_)
                break;
        }
        return false;
    }

    std::int64_t epoch() const { return epoch_; }

  private:
    DatasetPtr inner_;
    FeedDict feed_;
    std::int64_t count_;
    std::int64_t epoch_{0};
    std::unique_ptr<Cursor> cursor_{};
    bool produced_{false};
};

class RepeatDataset : public Dataset {
  public:
    RepeatDataset(DatasetPtr inner, Param<std::int64_t> count)
        : inner_{std::move(inner)}, count_{std::move(count)} {
        if (!inner_)
            throw InvalidArgumentError("repeat requires an input dataset");
    }

    OutputSignature output_signature() const override { return inner_->output_signature(); }

    std::unique_ptr<Cursor> make_cursor(const FeedDict& feed) const override {
        std::int64_t count = count_.resolve(feed);
        return std::make_unique<RepeatCursor>(inner_, feed, count < 0 ? kRepeatForever : count);
    }

  private:
    DatasetPtr inner_;
    Param<std::int64_t> count_;
};

/**
 * @brief Cursor grouping consecutive elements into batches.
 *
 * The last batch may be shorter than requested; an empty batch is never
 * produced. Once the inner cursor reports the end it is not polled again.
 */
class BatchCursor : public Cursor {
  public:
    BatchCursor(std::unique_ptr<Cursor> inner, std::size_t batch_size)
        : inner_{std::move(inner)}, batch_size_{batch_size} {}

    bool next(Value& out) override {
        std::vector<Value> items;
        items.reserve(batch_size_);
        Value v;
        while (items.size() < batch_size_ && !inner_done_) {
            if (inner_->next(v))
                items.push_back(std::move(v));
            else
                inner_done_ = true;
        }
        if (items.empty())
            return false;
        out = stack_values(items);
        return true;
    }

  private:
    std::unique_ptr<Cursor> inner_;
    std::size_t batch_size_;
    bool inner_done_{false};
};

class BatchDataset : public Dataset {
  public:
    BatchDataset(DatasetPtr inner, Param<std::int64_t> batch_size)
        : inner_{std::move(inner)}, batch_size_{std::move(batch_size)} {
        if (!inner_)
            throw InvalidArgumentError("batch requires an input dataset");
    }

    OutputSignature output_signature() const override {
        auto sig = inner_->output_signature();
        if (sig.shape)
            sig.shape->insert(sig.shape->begin(), kUnknownDim);
        return sig;
    }

    std::unique_ptr<Cursor> make_cursor(const FeedDict& feed) const override {
        std::int64_t size = batch_size_.resolve(feed);
        if (size <= 0)
            throw InvalidArgumentError("batch_size must be positive, got " + std::to_string(size));
        return std::make_unique<BatchCursor>(inner_->make_cursor(feed),
                                             static_cast<std::size_t>(size));
    }

  private:
    DatasetPtr inner_;
    Param<std::int64_t> batch_size_;
};

inline DatasetPtr Dataset::repeat(Param<std::int64_t> count) const {
    return std::make_shared<RepeatDataset>(shared_from_this(), std::move(count));
}

inline DatasetPtr Dataset::batch(Param<std::int64_t> batch_size) const {
    return std::make_shared<BatchDataset>(shared_from_this(), std::move(batch_size));
}

// ---------------------------------------------------------------------------
// Factories

inline DatasetPtr text_line_dataset(Param<std::vector<std::string>> filenames,
                                    Param<std::string> compression = std::string(),
                                    Param<std::int64_t> buffer_size = default_buffer_param()) {
    return std::make_shared<TextLineDataset>(std::move(filenames), std::move(compression),
                                             std::move(buffer_size));
}

inline DatasetPtr fixed_length_record_dataset(
    Param<std::vector<std::string>> filenames, Param<std::int64_t> record_bytes,
    Param<std::int64_t> header_bytes = 0, Param<std::int64_t> footer_bytes = 0,
    Param<std::int64_t> buffer_size = default_buffer_param(),
    Param<std::string> compression = std::string()) {
    return std::make_shared<FixedLengthRecordDataset>(
        std::move(filenames), std::move(record_bytes), std::move(header_bytes),
        std::move(footer_bytes), std::move(buffer_size), std::move(compression));
}

inline DatasetPtr framed_record_dataset(Param<std::vector<std::string>> filenames,
                                        Param<std::string> compression = std::string(),
                                        Param<std::int64_t> buffer_size = default_buffer_param()) {
    return std::make_shared<FramedRecordDataset>(std::move(filenames), std::move(compression),
                                                 std::move(buffer_size));
}

} // namespace recordflow
