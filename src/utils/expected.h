/**
 * @file expected.h
 * @brief Minimal Expected<T, E> (C++23 std::expected subset) for C++17
 *
 * Usage:
 * @code
 * Expected<int, Error> Parse(const std::string& text) {
 *   if (text.empty()) {
 *     return MakeUnexpected(MakeError(ErrorCode::kInvalidArgument, "empty"));
 *   }
 *   return std::stoi(text);
 * }
 * @endcode
 */

#pragma once

#include <cassert>
#include <exception>
#include <optional>
#include <type_traits>
#include <utility>
#include <variant>

namespace graphvault::utils {

/**
 * @brief Thrown by Expected::value() when no value is held
 */
template <typename E>
class BadExpectedAccess : public std::exception {
 public:
  explicit BadExpectedAccess(E error) : error_(std::move(error)) {}

  [[nodiscard]] const char* what() const noexcept override { return "bad Expected access"; }

  [[nodiscard]] const E& error() const& { return error_; }

 private:
  E error_;
};

/**
 * @brief Wrapper marking a value as the error alternative
 */
template <typename E>
class Unexpected {
 public:
  explicit Unexpected(E error) : error_(std::move(error)) {}

  [[nodiscard]] const E& error() const& { return error_; }
  [[nodiscard]] E&& error() && { return std::move(error_); }

 private:
  E error_;
};

template <typename E>
Unexpected<std::decay_t<E>> MakeUnexpected(E&& error) {
  return Unexpected<std::decay_t<E>>(std::forward<E>(error));
}

/**
 * @brief Holds either a value of type T or an error of type E
 */
template <typename T, typename E>
class Expected {
 public:
  using value_type = T;
  using error_type = E;

  Expected() : storage_(std::in_place_index<0>) {}

  // NOLINTNEXTLINE(google-explicit-constructor)
  Expected(const T& value) : storage_(std::in_place_index<0>, value) {}

  // NOLINTNEXTLINE(google-explicit-constructor)
  Expected(T&& value) : storage_(std::in_place_index<0>, std::move(value)) {}

  template <typename U, typename = std::enable_if_t<std::is_constructible_v<T, U&&> &&
                                                    !std::is_same_v<std::decay_t<U>, Expected> &&
                                                    !std::is_same_v<std::decay_t<U>, T>>>
  // NOLINTNEXTLINE(google-explicit-constructor)
  Expected(U&& value) : storage_(std::in_place_index<0>, std::forward<U>(value)) {}

  // NOLINTNEXTLINE(google-explicit-constructor)
  Expected(const Unexpected<E>& unexpected) : storage_(std::in_place_index<1>, unexpected.error()) {}

  // NOLINTNEXTLINE(google-explicit-constructor)
  Expected(Unexpected<E>&& unexpected) : storage_(std::in_place_index<1>, std::move(unexpected).error()) {}

  [[nodiscard]] bool has_value() const { return storage_.index() == 0; }
  explicit operator bool() const { return has_value(); }

  T& value() & {
    if (!has_value()) {
      throw BadExpectedAccess<E>(std::get<1>(storage_));
    }
    return std::get<0>(storage_);
  }

  const T& value() const& {
    if (!has_value()) {
      throw BadExpectedAccess<E>(std::get<1>(storage_));
    }
    return std::get<0>(storage_);
  }

  T&& value() && {
    if (!has_value()) {
      throw BadExpectedAccess<E>(std::get<1>(storage_));
    }
    return std::move(std::get<0>(storage_));
  }

  T& operator*() & { return std::get<0>(storage_); }
  const T& operator*() const& { return std::get<0>(storage_); }
  T&& operator*() && { return std::move(std::get<0>(storage_)); }

  T* operator->() { return &std::get<0>(storage_); }
  const T* operator->() const { return &std::get<0>(storage_); }

  E& error() & {
    assert(!has_value() && "error() called on Expected containing a value");
    return std::get<1>(storage_);
  }

  const E& error() const& {
    assert(!has_value() && "error() called on Expected containing a value");
    return std::get<1>(storage_);
  }

  template <typename U>
  T value_or(U&& default_value) const& {
    return has_value() ? std::get<0>(storage_) : static_cast<T>(std::forward<U>(default_value));
  }

  template <typename U>
  T value_or(U&& default_value) && {
    return has_value() ? std::move(std::get<0>(storage_)) : static_cast<T>(std::forward<U>(default_value));
  }

  /**
   * @brief Map the value, keep the error
   */
  template <typename F>
  auto transform(F&& func) const& -> Expected<std::invoke_result_t<F, const T&>, E> {
    using U = std::invoke_result_t<F, const T&>;
    if (!has_value()) {
      return Expected<U, E>(MakeUnexpected(std::get<1>(storage_)));
    }
    return Expected<U, E>(std::forward<F>(func)(std::get<0>(storage_)));
  }

  /**
   * @brief Chain an operation returning Expected
   */
  template <typename F>
  auto and_then(F&& func) const& -> std::invoke_result_t<F, const T&> {
    using Result = std::invoke_result_t<F, const T&>;
    if (!has_value()) {
      return Result(MakeUnexpected(std::get<1>(storage_)));
    }
    return std::forward<F>(func)(std::get<0>(storage_));
  }

  /**
   * @brief Recover from the error
   */
  template <typename F>
  auto or_else(F&& func) const& -> Expected {
    if (has_value()) {
      return *this;
    }
    return std::forward<F>(func)(std::get<1>(storage_));
  }

  /**
   * @brief Map the error, keep the value
   */
  template <typename F>
  auto transform_error(F&& func) const& -> Expected<T, std::invoke_result_t<F, const E&>> {
    using G = std::invoke_result_t<F, const E&>;
    if (has_value()) {
      return Expected<T, G>(std::get<0>(storage_));
    }
    return Expected<T, G>(MakeUnexpected(std::forward<F>(func)(std::get<1>(storage_))));
  }

 private:
  std::variant<T, E> storage_;
};

/**
 * @brief Specialization for operations that return no value
 */
template <typename E>
class Expected<void, E> {
 public:
  using value_type = void;
  using error_type = E;

  Expected() = default;

  // NOLINTNEXTLINE(google-explicit-constructor)
  Expected(const Unexpected<E>& unexpected) : error_(unexpected.error()) {}

  // NOLINTNEXTLINE(google-explicit-constructor)
  Expected(Unexpected<E>&& unexpected) : error_(std::move(unexpected).error()) {}

  [[nodiscard]] bool has_value() const { return !error_.has_value(); }
  explicit operator bool() const { return has_value(); }

  void value() const {
    if (!has_value()) {
      throw BadExpectedAccess<E>(*error_);
    }
  }

  E& error() & {
    assert(!has_value() && "error() called on Expected containing a value");
    return *error_;
  }

  const E& error() const& {
    assert(!has_value() && "error() called on Expected containing a value");
    return *error_;
  }

 private:
  std::optional<E> error_;
};

}  // namespace graphvault::utils
