#pragma once

#include <optional>
#include <type_traits>
#include <utility>
#include <variant>

namespace taskwait {

template <typename E>
class unexpected {
 public:
  explicit unexpected(const E& error) : error_(error) {}
  explicit unexpected(E&& error) : error_(std::move(error)) {}

  [[nodiscard]] const E& error() const& noexcept { return error_; }
  [[nodiscard]] E& error() & noexcept { return error_; }
  [[nodiscard]] E&& error() && noexcept { return std::move(error_); }

 private:
  E error_;
};

template <typename E>
unexpected(E) -> unexpected<E>;

/// @brief Minimal value-or-error holder used by Result<T>.
template <typename T, typename E>
class expected {
 public:
  using value_type = T;
  using error_type = E;

  template <typename U = T,
            typename = std::enable_if_t<std::is_constructible_v<T, U&&> &&
                                        !std::is_same_v<std::decay_t<U>, expected> &&
                                        !std::is_same_v<std::decay_t<U>, E> &&
                                        !std::is_same_v<std::decay_t<U>, unexpected<E>>>>
  expected(U&& value) : storage_(std::in_place_index<0>, std::forward<U>(value)) {}

  expected(const E& err) : storage_(std::in_place_index<1>, err) {}
  expected(E&& err) : storage_(std::in_place_index<1>, std::move(err)) {}
  expected(const unexpected<E>& err) : storage_(std::in_place_index<1>, err.error()) {}
  expected(unexpected<E>&& err) : storage_(std::in_place_index<1>, std::move(err).error()) {}

  [[nodiscard]] bool has_value() const noexcept { return storage_.index() == 0; }
  explicit operator bool() const noexcept { return has_value(); }

  [[nodiscard]] T& value() & { return std::get<0>(storage_); }
  [[nodiscard]] const T& value() const& { return std::get<0>(storage_); }
  [[nodiscard]] T&& value() && { return std::get<0>(std::move(storage_)); }

  [[nodiscard]] T& operator*() & noexcept { return *std::get_if<0>(&storage_); }
  [[nodiscard]] const T& operator*() const& noexcept { return *std::get_if<0>(&storage_); }
  [[nodiscard]] T* operator->() noexcept { return std::get_if<0>(&storage_); }
  [[nodiscard]] const T* operator->() const noexcept { return std::get_if<0>(&storage_); }

  [[nodiscard]] E& error() & { return std::get<1>(storage_); }
  [[nodiscard]] const E& error() const& { return std::get<1>(storage_); }
  [[nodiscard]] E&& error() && { return std::get<1>(std::move(storage_)); }

  template <typename U>
  T value_or(U&& fallback) const& {
    return has_value() ? std::get<0>(storage_) : static_cast<T>(std::forward<U>(fallback));
  }

 private:
  std::variant<T, E> storage_;
};

template <typename E>
class expected<void, E> {
 public:
  using value_type = void;
  using error_type = E;

  expected() = default;
  expected(const E& err) : error_(err) {}
  expected(E&& err) : error_(std::move(err)) {}
  expected(const unexpected<E>& err) : error_(err.error()) {}
  expected(unexpected<E>&& err) : error_(std::move(err).error()) {}

  [[nodiscard]] bool has_value() const noexcept { return !error_.has_value(); }
  explicit operator bool() const noexcept { return has_value(); }

  void value() const {}

  [[nodiscard]] E& error() & { return *error_; }
  [[nodiscard]] const E& error() const& { return *error_; }
  [[nodiscard]] E&& error() && { return std::move(*error_); }

 private:
  std::optional<E> error_;
};

}  // namespace taskwait
