#pragma once

#include <memory>
#include <optional>
#include <string>
#include <utility>

#include "recordflow/core.hpp"
#include "recordflow/dataset.hpp"
#include "recordflow/errors.hpp"
#include "recordflow/params.hpp"

namespace recordflow {

/**
 * @brief Stateful, re-initializable handle pulling elements from a dataset.
 *
 * The iterator is the only mutable object in a pipeline. It owns at most one
 * cursor, and with it the file currently being read. Calls to
 * @ref get_next must come from one thread at a time.
 *
 * States:
 *   - Unbound:   created, never (successfully) initialized, or reset
 *   - Bound:     initialized and able to produce elements
 *   - Exhausted: the last get_next observed the end of the sequence
 */
class Iterator {
  public:
    enum class State { Unbound, Bound, Exhausted };

    /// Iterator adopting the signature of the first dataset it is bound to.
    Iterator() = default;

    /// Iterator whose element signature is fixed up front.
    static Iterator from_structure(OutputSignature signature) {
        Iterator it;
        it.signature_ = std::move(signature);
        return it;
    }

    /// Iterator bound to \p dataset straight away. Every placeholder of the
    /// dataset must carry a default.
    static Iterator one_shot(DatasetPtr dataset) {
        if (!dataset)
            throw InvalidArgumentError("cannot iterate a null dataset");
        Iterator it = from_structure(dataset->output_signature());
        it.initialize(std::move(dataset));
        return it;
    }

    /// The moved-from iterator is left Unbound.
    Iterator(Iterator&& other) noexcept
        : signature_{std::move(other.signature_)}, dataset_{std::move(other.dataset_)},
          cursor_{std::move(other.cursor_)}, state_{other.state_} {
        other.state_ = State::Unbound;
    }

    Iterator& operator=(Iterator&& other) noexcept {
        if (this != &other) {
            signature_ = std::move(other.signature_);
            dataset_ = std::move(other.dataset_);
            cursor_ = std::move(other.cursor_);
            state_ = other.state_;
            other.state_ = State::Unbound;
        }
        return *this;
    }

    Iterator(const Iterator&) = delete;
    Iterator& operator=(const Iterator&) = delete;

    /**
     * Bind to \p dataset, resolving placeholders from \p feed.
     *
     * The new cursor is built before the previous one is dropped, so a
     * failure leaves the iterator exactly as it was. On success any file
     * held by the previous cursor is closed.
     */
    void initialize(DatasetPtr dataset, const FeedDict& feed = {}) {
        if (!dataset)
            throw InvalidArgumentError("cannot initialize an iterator with a null dataset");
        auto sig = dataset->output_signature();
        if (signature_ && !is_compatible(*signature_, sig))
            throw InvalidArgumentError("dataset elements " + signature_to_string(sig) +
                                       " are not compatible with iterator signature " +
                                       signature_to_string(*signature_));
        auto cursor = dataset->make_cursor(feed);
        cursor_ = std::move(cursor);
        dataset_ = std::move(dataset);
        if (!signature_)
            signature_ = sig;
        state_ = State::Bound;
    }

    /**
     * Return the next element.
     *
     * @throws FailedPreconditionError if the iterator was never initialized
     * @throws OutOfRangeError at the end of the sequence, and on every call
     *         after that until the next initialize
     */
    Value get_next() {
        switch (state_) {
        case State::Unbound:
            throw FailedPreconditionError("get_next called on an uninitialized iterator");
        case State::Exhausted:
            throw OutOfRangeError("end of sequence");
        case State::Bound:
        default:
            break;
        }
        Value v;
        if (!cursor_->next(v)) {
            state_ = State::Exhausted;
            cursor_.reset();
            throw OutOfRangeError("end of sequence");
        }
        return v;
    }

    /// Drop the cursor, closing any open file, and return to Unbound.
    void reset() {
        cursor_.reset();
        dataset_.reset();
        state_ = State::Unbound;
    }

    State state() const { return state_; }
    const std::optional<OutputSignature>& output_signature() const { return signature_; }
    const DatasetPtr& dataset() const { return dataset_; }

  private:
    std::optional<OutputSignature> signature_{};
    DatasetPtr dataset_{};
    std::unique_ptr<Cursor> cursor_{};
    State state_{State::Unbound};
};

inline const char* state_name(Iterator::State s) {
    switch (s) {
    case Iterator::State::Unbound:
        return "Unbound";
    case Iterator::State::Bound:
        return "Bound";
    case Iterator::State::Exhausted:
    default:
        return "Exhausted";
    }
}

} // namespace recordflow
