#pragma once

/**
 * @file errors.hpp
 * @brief Exception types raised by the input pipeline.
 *
 * Every failure carries an @ref ErrorCode so callers can tell the normal
 * end-of-stream signal apart from real errors without inspecting message
 * text. `OutOfRangeError` is only ever thrown by @ref Iterator::get_next once
 * the bound dataset has no more elements.
 */

#include <stdexcept>
#include <string>

namespace recordflow {

/// Kinds of failure surfaced by datasets and iterators.
enum class ErrorCode { OutOfRange, InvalidArgument, NotFound, DataLoss, FailedPrecondition };

inline const char* error_code_name(ErrorCode code) {
    switch (code) {
    case ErrorCode::OutOfRange:
        return "OutOfRange";
    case ErrorCode::InvalidArgument:
        return "InvalidArgument";
    case ErrorCode::NotFound:
        return "NotFound";
    case ErrorCode::DataLoss:
        return "DataLoss";
    case ErrorCode::FailedPrecondition:
    default:
        return "FailedPrecondition";
    }
}

/** Base class of all pipeline errors. */
class Error : public std::runtime_error {
  public:
    Error(ErrorCode code, const std::string& msg) : std::runtime_error{msg}, code_{code} {}

    ErrorCode code() const { return code_; }

  private:
    ErrorCode code_;
};

/// End of the sequence. Expected; loop on get_next() until this is thrown.
class OutOfRangeError : public Error {
  public:
    explicit OutOfRangeError(const std::string& msg) : Error{ErrorCode::OutOfRange, msg} {}
};

/// Bad parameters: unknown compression, non-dividing record size, bad feeds.
class InvalidArgumentError : public Error {
  public:
    explicit InvalidArgumentError(const std::string& msg)
        : Error{ErrorCode::InvalidArgument, msg} {}
};

class NotFoundError : public Error {
  public:
    explicit NotFoundError(const std::string& msg) : Error{ErrorCode::NotFound, msg} {}
};

/// Corrupt compressed stream, checksum mismatch or truncated frame.
class DataLossError : public Error {
  public:
    explicit DataLossError(const std::string& msg) : Error{ErrorCode::DataLoss, msg} {}
};

/// Operation issued in the wrong iterator state.
class FailedPreconditionError : public Error {
  public:
    explicit FailedPreconditionError(const std::string& msg)
        : Error{ErrorCode::FailedPrecondition, msg} {}
};

} // namespace recordflow
