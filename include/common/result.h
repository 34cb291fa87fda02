#pragma once
/**
 * @file result.h
 * @brief Value-or-error return type used on the service-facing APIs.
 *
 * Internals throw std::runtime_error; anything reachable from the service
 * boundary reports failures as a Result so callers always see a typed kind.
 */

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

namespace prox {

enum class IngestErrorKind : std::uint8_t
{
  INVALID_DATA     = 0,  // malformed, out-of-range or out-of-order input
  PRECISION_ERROR  = 1,  // sample below the accuracy the operation requires
  BACKPRESSURE     = 2,  // submission queue full
  INDEX_CORRUPTION = 3   // target cell halted after an invariant violation
};

enum class QueryErrorKind : std::uint8_t
{
  INVALID_RADIUS = 0,
  INVALID_DATA   = 1,
  BACKPRESSURE   = 2
};

struct IngestError
{
  IngestErrorKind kind = IngestErrorKind::INVALID_DATA;
  std::string reason;
};

struct QueryError
{
  QueryErrorKind kind = QueryErrorKind::INVALID_DATA;
  std::string reason;
};

const char* ToString(IngestErrorKind k);
const char* ToString(QueryErrorKind k);

template <typename T, typename E>
class Result {
public:
  static Result Ok(T value) { return Result(std::in_place_index<0>, std::move(value)); }
  static Result Fail(E error) { return Result(std::in_place_index<1>, std::move(error)); }

  bool ok() const { return v_.index() == 0; }
  explicit operator bool() const { return ok(); }

  const T& value() const {
    if (!ok()) throw std::runtime_error("Result::value: result holds an error");
    return std::get<0>(v_);
  }
  T& value() {
    if (!ok()) throw std::runtime_error("Result::value: result holds an error");
    return std::get<0>(v_);
  }

  const E& error() const {
    if (ok()) throw std::runtime_error("Result::error: result holds a value");
    return std::get<1>(v_);
  }

private:
  template <std::size_t I, typename U>
  Result(std::in_place_index_t<I> tag, U&& u) : v_(tag, std::forward<U>(u)) {}

  std::variant<T, E> v_;
};

} // namespace prox
