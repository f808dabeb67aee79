#pragma once

/**
 * @file params.hpp
 * @brief Dataset parameters resolved when an iterator is initialized.
 *
 * A dataset description never holds concrete filenames or counts directly.
 * Each argument is a @ref Param which is either a constant captured at
 * construction or a named placeholder that is looked up in the @ref FeedDict
 * passed to @ref Iterator::initialize. The same description can therefore
 * be re-run over different files or epoch counts without being rebuilt.
 */

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include "recordflow/errors.hpp"

namespace recordflow {

/// Run-time value supplied for a placeholder.
using FeedValue = std::variant<std::int64_t, std::string, std::vector<std::string>>;

/// Placeholder name to fed value.
using FeedDict = std::map<std::string, FeedValue>;

namespace detail {

template <typename T> struct FeedTraits;

template <> struct FeedTraits<std::int64_t> {
    static constexpr const char* kName = "int64 scalar";
};

template <> struct FeedTraits<std::string> {
    static constexpr const char* kName = "string scalar";
};

template <> struct FeedTraits<std::vector<std::string>> {
    static constexpr const char* kName = "string vector";
};

inline const char* feed_value_kind(const FeedValue& v) {
    switch (v.index()) {
    case 0:
        return FeedTraits<std::int64_t>::kName;
    case 1:
        return FeedTraits<std::string>::kName;
    default:
        return FeedTraits<std::vector<std::string>>::kName;
    }
}

} // namespace detail

/**
 * @brief Constant or placeholder argument of a dataset.
 *
 * Constants convert implicitly so dataset constructors can be called with
 * plain values.
 */
template <typename T> class Param {
  public:
    Param(T value) : value_{std::move(value)} {}

    template <typename U, typename = std::enable_if_t<std::is_constructible_v<T, U&&> &&
                                                      !std::is_same_v<std::decay_t<U>, Param> &&
                                                      !std::is_same_v<std::decay_t<U>, T>>>
    Param(U&& value) : value_{T(std::forward<U>(value))} {}

    static Param placeholder(std::string name) {
        Param p;
        p.name_ = std::move(name);
        return p;
    }

    static Param placeholder_with_default(std::string name, T fallback) {
        Param p;
        p.name_ = std::move(name);
        p.value_ = std::move(fallback);
        return p;
    }

    bool is_placeholder() const { return !name_.empty(); }
    bool has_value() const { return value_.has_value(); }
    const std::string& name() const { return name_; }

    /// Resolve against \p feed, falling back to the constant or default.
    T resolve(const FeedDict& feed) const {
        if (is_placeholder()) {
            auto it = feed.find(name_);
            if (it != feed.end()) {
                if (const T* v = std::get_if<T>(&it->second))
                    return *v;
                throw InvalidArgumentError("placeholder '" + name_ + "' expects a " +
                                           detail::FeedTraits<T>::kName + " but was fed a " +
                                           detail::feed_value_kind(it->second));
            }
            if (!value_)
                throw InvalidArgumentError("no value fed for placeholder '" + name_ + "'");
        }
        return *value_;
    }

  private:
    Param() = default;

    std::string name_{};
    std::optional<T> value_{};
};

template <typename T> Param<T> placeholder(std::string name) {
    return Param<T>::placeholder(std::move(name));
}

template <typename T> Param<T> placeholder_with_default(std::string name, T fallback) {
    return Param<T>::placeholder_with_default(std::move(name), std::move(fallback));
}

} // namespace recordflow
