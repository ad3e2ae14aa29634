// ts_decode/decode/result.hpp - Value-or-error result type
#pragma once

#include <utility>
#include <variant>

#include "ts_decode/decode/error.hpp"

namespace ts_decode
{

/**
 * Holds either a decoded T or the single DecodeError that stopped decoding.
 *
 * Example usage:
 * @code
 *     auto result = decode_node(root, *shape);
 *     if (result) {
 *         // Use result.value() or *result
 *     } else {
 *         // Handle result.error()
 *     }
 * @endcode
 */
template <typename T>
class DecodeResult
{
public:
  using ValueType = T;
  using ErrorType = DecodeError;

  DecodeResult(T value) : data_(std::in_place_index<0>, std::move(value)) {}
  DecodeResult(DecodeError error) : data_(std::in_place_index<1>, std::move(error)) {}

  [[nodiscard]] bool has_value() const noexcept { return data_.index() == 0; }
  [[nodiscard]] bool has_error() const noexcept { return data_.index() == 1; }

  explicit operator bool() const noexcept { return has_value(); }

  // Get the value (throws std::bad_variant_access if has_error())
  T & value() & { return std::get<0>(data_); }
  [[nodiscard]] const T & value() const & { return std::get<0>(data_); }
  T && value() && { return std::get<0>(std::move(data_)); }

  // Get the error (throws std::bad_variant_access if has_value())
  DecodeError & error() & { return std::get<1>(data_); }
  [[nodiscard]] const DecodeError & error() const & { return std::get<1>(data_); }
  DecodeError && error() && { return std::get<1>(std::move(data_)); }

  T * operator->() { return &value(); }
  const T * operator->() const { return &value(); }
  T & operator*() & { return value(); }
  const T & operator*() const & { return value(); }

private:
  std::variant<T, DecodeError> data_;
};

}  // namespace ts_decode
