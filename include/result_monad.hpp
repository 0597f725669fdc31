#pragma once

#include <optional>
#include <ostream>
#include <string>
#include <utility>
#include <variant>

namespace monad {

struct Error {
  int code{0};
  std::string what;
};

inline std::ostream &operator<<(std::ostream &os, const Error &e) {
  return os << "Error{code=" << e.code << ", what=" << e.what << "}";
}

inline Error make_error(int code, std::string what) {
  return Error{.code = code, .what = std::move(what)};
}

template <typename T, typename E = Error> class Result {
public:
  static Result Ok(T value) {
    return Result(std::in_place_index<0>, std::move(value));
  }
  static Result Err(E error) {
    return Result(std::in_place_index<1>, std::move(error));
  }

  bool is_ok() const { return state_.index() == 0; }
  bool is_err() const { return state_.index() == 1; }

  T &value() & { return std::get<0>(state_); }
  const T &value() const & { return std::get<0>(state_); }
  T &&value() && { return std::get<0>(std::move(state_)); }

  E &error() & { return std::get<1>(state_); }
  const E &error() const & { return std::get<1>(state_); }
  E &&error() && { return std::get<1>(std::move(state_)); }

private:
  template <std::size_t I, typename V>
  Result(std::in_place_index_t<I> idx, V &&v)
      : state_(idx, std::forward<V>(v)) {}

  std::variant<T, E> state_;
};

template <typename E> class Result<void, E> {
public:
  static Result Ok() { return Result(std::nullopt); }
  static Result Err(E error) { return Result(std::move(error)); }

  bool is_ok() const { return !error_.has_value(); }
  bool is_err() const { return error_.has_value(); }

  E &error() & { return *error_; }
  const E &error() const & { return *error_; }
  E &&error() && { return std::move(*error_); }

private:
  explicit Result(std::optional<E> error) : error_(std::move(error)) {}

  std::optional<E> error_;
};

template <typename T> using MyResult = Result<T, Error>;
using MyVoidResult = Result<void, Error>;

} // namespace monad
