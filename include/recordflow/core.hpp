#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include "recordflow/errors.hpp"

namespace recordflow {

/**
 * @brief Element produced by a dataset.
 *
 * A value is either a scalar holding one byte string (shape `{}`) or a dense
 * array of byte strings stored in row-major order. Records emitted by the
 * file readers are scalars; @ref BatchDataset stacks them into arrays.
 */
class Value {
  public:
    /// Supported element types.
    enum class DType { String };

    using Shape = std::vector<std::size_t>;

    Value() = default;
    explicit Value(std::string record) : data_{std::move(record)} {}
    Value(Shape s, std::vector<std::string> d) : shape_{std::move(s)}, data_{std::move(d)} {}

    const Shape& shape() const { return shape_; }
    DType dtype() const { return DType::String; }
    std::size_t rank() const { return shape_.size(); }
    bool empty() const { return data_.empty(); }

    /// Access the record of a scalar value.
    const std::string& scalar() const {
        if (!shape_.empty() || data_.size() != 1)
            throw InvalidArgumentError("value is not a scalar");
        return data_.front();
    }

    const std::vector<std::string>& data() const { return data_; }
    std::vector<std::string>& data() { return data_; }

    bool operator==(const Value& other) const {
        return shape_ == other.shape_ && data_ == other.data_;
    }
    bool operator!=(const Value& other) const { return !(*this == other); }

  private:
    Shape shape_{};
    std::vector<std::string> data_{};
};

/// Partially known shape; -1 marks a dimension of unknown size.
using PartialShape = std::vector<std::int64_t>;

inline constexpr std::int64_t kUnknownDim = -1;

/**
 * @brief Type and shape description of the elements a dataset yields.
 *
 * A signature without a shape only constrains the element type; this is the
 * form returned by @ref Dataset::output_types and lets one iterator be bound
 * to both a batched and an unbatched dataset.
 */
struct OutputSignature {
    Value::DType dtype{Value::DType::String};
    std::optional<PartialShape> shape{};

    bool operator==(const OutputSignature& other) const {
        return dtype == other.dtype && shape == other.shape;
    }
    bool operator!=(const OutputSignature& other) const { return !(*this == other); }
};

inline std::string shape_to_string(const PartialShape& s) {
    std::string out = "[";
    for (std::size_t i = 0; i < s.size(); ++i) {
        out += s[i] < 0 ? std::string("?") : std::to_string(s[i]);
        if (i + 1 < s.size())
            out += ",";
    }
    out += "]";
    return out;
}

inline std::string shape_to_string(const Value::Shape& s) {
    PartialShape p(s.begin(), s.end());
    return shape_to_string(p);
}

inline std::string signature_to_string(const OutputSignature& sig) {
    std::string out = "string";
    out += sig.shape ? shape_to_string(*sig.shape) : std::string("<any>");
    return out;
}

/// Check whether a dataset with signature \p actual can be bound where
/// \p declared is expected.
inline bool is_compatible(const OutputSignature& declared, const OutputSignature& actual) {
    if (declared.dtype != actual.dtype)
        return false;
    if (!declared.shape || !actual.shape)
        return true;
    const auto& d = *declared.shape;
    const auto& a = *actual.shape;
    if (d.size() != a.size())
        return false;
    for (std::size_t i = 0; i < d.size(); ++i) {
        if (d[i] != kUnknownDim && a[i] != kUnknownDim && d[i] != a[i])
            return false;
    }
    return true;
}

/// Stack equally shaped values along a new leading dimension.
inline Value stack_values(std::vector<Value>& values) {
    if (values.empty())
        throw InvalidArgumentError("cannot stack an empty list of values");
    const auto& first = values.front().shape();
    Value::Shape shape{values.size()};
    shape.insert(shape.end(), first.begin(), first.end());
    std::vector<std::string> data;
    data.reserve(values.size() * values.front().data().size());
    for (std::size_t i = 0; i < values.size(); ++i) {
        if (values[i].shape() != first) {
            std::ostringstream msg;
            msg << "cannot batch element " << i << " of shape "
                << shape_to_string(values[i].shape()) << " with elements of shape "
                << shape_to_string(first);
            throw InvalidArgumentError(msg.str());
        }
        for (auto& s : values[i].data())
            data.push_back(std::move(s));
    }
    return Value{std::move(shape), std::move(data)};
}

/**
 * @brief Mutable iteration state of one built dataset.
 *
 * Cursors are created by @ref Dataset::make_cursor and owned by exactly one
 * iterator. They are not thread safe.
 */
class Cursor {
  public:
    virtual ~Cursor() = default;

    /// Produce the next element. Returns false once the sequence is exhausted.
    virtual bool next(Value& out) = 0;
};

} // namespace recordflow
