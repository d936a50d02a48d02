#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

namespace McpIDE {

/**
 * @brief Value-or-error return type for fallible operations
 *
 * Holds either a value of type T or an error message. Accessing the wrong
 * alternative throws std::logic_error.
 */
template <typename T> class Result {
public:
  static Result ok(T value) { return Result(std::in_place_index<0>, std::move(value)); }

  static Result error(std::string message) {
    return Result(std::in_place_index<1>, std::move(message));
  }

  [[nodiscard]] bool isOk() const { return m_data.index() == 0; }
  [[nodiscard]] bool isError() const { return m_data.index() == 1; }
  explicit operator bool() const { return isOk(); }

  [[nodiscard]] T& value() & {
    if (!isOk()) {
      throw std::logic_error("Result::value() called on error: " + std::get<1>(m_data));
    }
    return std::get<0>(m_data);
  }

  [[nodiscard]] const T& value() const& {
    if (!isOk()) {
      throw std::logic_error("Result::value() called on error: " + std::get<1>(m_data));
    }
    return std::get<0>(m_data);
  }

  [[nodiscard]] T&& value() && {
    if (!isOk()) {
      throw std::logic_error("Result::value() called on error: " + std::get<1>(m_data));
    }
    return std::get<0>(std::move(m_data));
  }

  [[nodiscard]] T valueOr(T fallback) const {
    return isOk() ? std::get<0>(m_data) : std::move(fallback);
  }

  [[nodiscard]] const std::string& error() const {
    if (!isError()) {
      throw std::logic_error("Result::error() called on success");
    }
    return std::get<1>(m_data);
  }

private:
  template <std::size_t I, typename U>
  Result(std::in_place_index_t<I> tag, U&& payload) : m_data(tag, std::forward<U>(payload)) {}

  std::variant<T, std::string> m_data;
};

template <> class Result<void> {
public:
  static Result ok() { return Result(std::nullopt); }
  static Result error(std::string message) { return Result(std::move(message)); }

  [[nodiscard]] bool isOk() const { return !m_error.has_value(); }
  [[nodiscard]] bool isError() const { return m_error.has_value(); }
  explicit operator bool() const { return isOk(); }

  [[nodiscard]] const std::string& error() const {
    if (!m_error) {
      throw std::logic_error("Result::error() called on success");
    }
    return *m_error;
  }

private:
  explicit Result(std::optional<std::string> error) : m_error(std::move(error)) {}

  std::optional<std::string> m_error;
};

} // namespace McpIDE
