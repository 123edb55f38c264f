/**
 * @file expected.h
 * @brief Minimal std::expected-like result type for C++17
 *
 * Holds either a value of type T or an error of type E. Used as the return
 * channel of every fallible operation instead of exceptions.
 *
 * Example:
 * @code
 * Expected<int, Error> Parse(const std::string& s);
 *
 * auto result = Parse("42");
 * if (!result) {
 *   spdlog::error("{}", result.error().message());
 *   return;
 * }
 * Use(*result);
 * @endcode
 */

#pragma once

#include <exception>
#include <type_traits>
#include <utility>
#include <variant>

namespace semcache::utils {

/**
 * @brief Wrapper marking a value as the error alternative
 */
template <typename E>
class Unexpected {
 public:
  explicit Unexpected(E error) : error_(std::move(error)) {}

  [[nodiscard]] const E& error() const& { return error_; }
  [[nodiscard]] E& error() & { return error_; }
  [[nodiscard]] E&& error() && { return std::move(error_); }

 private:
  E error_;
};

template <typename E>
Unexpected<std::decay_t<E>> MakeUnexpected(E&& error) {
  return Unexpected<std::decay_t<E>>(std::forward<E>(error));
}

/**
 * @brief Thrown by value() when the Expected holds an error
 */
template <typename E>
class BadExpectedAccess : public std::exception {
 public:
  explicit BadExpectedAccess(E error) : error_(std::move(error)) {}

  [[nodiscard]] const char* what() const noexcept override { return "bad expected access"; }
  [[nodiscard]] const E& error() const { return error_; }

 private:
  E error_;
};

template <typename T, typename E>
class Expected;

namespace detail {
template <typename U>
struct IsExpected : std::false_type {};
template <typename U, typename G>
struct IsExpected<Expected<U, G>> : std::true_type {};
}  // namespace detail

/**
 * @brief Value-or-error result
 * @tparam T Value type
 * @tparam E Error type
 */
template <typename T, typename E>
class Expected {
 public:
  using value_type = T;
  using error_type = E;

  Expected() : storage_(std::in_place_index<0>) {}

  template <typename U = T,
            typename = std::enable_if_t<!std::is_same_v<std::decay_t<U>, Expected> &&
                                        !std::is_same_v<std::decay_t<U>, Unexpected<E>> &&
                                        std::is_constructible_v<T, U&&>>>
  Expected(U&& value)  // NOLINT(google-explicit-constructor)
      : storage_(std::in_place_index<0>, std::forward<U>(value)) {}

  template <typename G>
  Expected(const Unexpected<G>& unexpected)  // NOLINT(google-explicit-constructor)
      : storage_(std::in_place_index<1>, unexpected.error()) {}

  template <typename G>
  Expected(Unexpected<G>&& unexpected)  // NOLINT(google-explicit-constructor)
      : storage_(std::in_place_index<1>, std::move(unexpected).error()) {}

  [[nodiscard]] bool has_value() const { return storage_.index() == 0; }
  explicit operator bool() const { return has_value(); }

  T& value() & {
    ThrowIfError();
    return std::get<0>(storage_);
  }
  const T& value() const& {
    ThrowIfError();
    return std::get<0>(storage_);
  }
  T&& value() && {
    ThrowIfError();
    return std::move(std::get<0>(storage_));
  }

  const E& error() const& { return std::get<1>(storage_); }
  E& error() & { return std::get<1>(storage_); }
  E&& error() && { return std::move(std::get<1>(storage_)); }

  T& operator*() & { return std::get<0>(storage_); }
  const T& operator*() const& { return std::get<0>(storage_); }
  T&& operator*() && { return std::move(std::get<0>(storage_)); }

  T* operator->() { return &std::get<0>(storage_); }
  const T* operator->() const { return &std::get<0>(storage_); }

  template <typename U>
  T value_or(U&& default_value) const& {
    return has_value() ? std::get<0>(storage_) : static_cast<T>(std::forward<U>(default_value));
  }

  template <typename U>
  T value_or(U&& default_value) && {
    return has_value() ? std::move(std::get<0>(storage_)) : static_cast<T>(std::forward<U>(default_value));
  }

  /**
   * @brief Map the value, propagate the error
   */
  template <typename F>
  auto transform(F&& func) const& -> Expected<std::invoke_result_t<F, const T&>, E> {
    using U = std::invoke_result_t<F, const T&>;
    if (!has_value()) {
      return Expected<U, E>(MakeUnexpected(error()));
    }
    if constexpr (std::is_void_v<U>) {
      std::forward<F>(func)(**this);
      return Expected<void, E>();
    } else {
      return Expected<U, E>(std::forward<F>(func)(**this));
    }
  }

  /**
   * @brief Chain a fallible operation on the value
   */
  template <typename F>
  auto and_then(F&& func) const& -> std::invoke_result_t<F, const T&> {
    using Result = std::invoke_result_t<F, const T&>;
    static_assert(detail::IsExpected<Result>::value, "and_then callable must return Expected");
    if (!has_value()) {
      return Result(MakeUnexpected(error()));
    }
    return std::forward<F>(func)(**this);
  }

  /**
   * @brief Recover from an error
   */
  template <typename F>
  Expected or_else(F&& func) const& {
    if (has_value()) {
      return *this;
    }
    return std::forward<F>(func)(error());
  }

  /**
   * @brief Map the error, keep the value
   */
  template <typename F>
  auto transform_error(F&& func) const& -> Expected<T, std::invoke_result_t<F, const E&>> {
    using G = std::invoke_result_t<F, const E&>;
    if (has_value()) {
      return Expected<T, G>(**this);
    }
    return Expected<T, G>(MakeUnexpected(std::forward<F>(func)(error())));
  }

 private:
  void ThrowIfError() const {
    if (!has_value()) {
      throw BadExpectedAccess<E>(std::get<1>(storage_));
    }
  }

  std::variant<T, E> storage_;
};

/**
 * @brief Void specialization: success or error
 */
template <typename E>
class Expected<void, E> {
 public:
  using value_type = void;
  using error_type = E;

  Expected() = default;

  template <typename G>
  Expected(const Unexpected<G>& unexpected)  // NOLINT(google-explicit-constructor)
      : has_error_(true), error_(unexpected.error()) {}

  template <typename G>
  Expected(Unexpected<G>&& unexpected)  // NOLINT(google-explicit-constructor)
      : has_error_(true), error_(std::move(unexpected).error()) {}

  [[nodiscard]] bool has_value() const { return !has_error_; }
  explicit operator bool() const { return has_value(); }

  void value() const {
    if (has_error_) {
      throw BadExpectedAccess<E>(error_);
    }
  }

  const E& error() const& { return error_; }
  E& error() & { return error_; }
  E&& error() && { return std::move(error_); }

  template <typename F>
  auto and_then(F&& func) const -> std::invoke_result_t<F> {
    using Result = std::invoke_result_t<F>;
    static_assert(detail::IsExpected<Result>::value, "and_then callable must return Expected");
    if (has_error_) {
      return Result(MakeUnexpected(error_));
    }
    return std::forward<F>(func)();
  }

  template <typename F>
  Expected or_else(F&& func) const {
    if (!has_error_) {
      return *this;
    }
    return std::forward<F>(func)(error_);
  }

 private:
  bool has_error_ = false;
  E error_{};
};

}  // namespace semcache::utils
