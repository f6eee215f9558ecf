#pragma once
#include <cstddef>
#include <stdexcept>
#include <utility>
#include <variant>

// Value or error, for boundaries where failure is an expected outcome that
// the caller must handle rather than an exception to propagate.
template <typename T, typename E>
class Result {
public:
  static Result ok(T value) { return Result(std::in_place_index<0>, std::move(value)); }
  static Result fail(E error) { return Result(std::in_place_index<1>, std::move(error)); }

  bool has_value() const { return v_.index() == 0; }
  explicit operator bool() const { return has_value(); }

  const T& value() const {
    if (!has_value()) throw std::logic_error("Result::value on failure");
    return std::get<0>(v_);
  }
  const E& error() const {
    if (has_value()) throw std::logic_error("Result::error on success");
    return std::get<1>(v_);
  }

private:
  template <std::size_t I, typename A>
  Result(std::in_place_index_t<I> tag, A&& a) : v_(tag, std::forward<A>(a)) {}

  std::variant<T, E> v_;
};
