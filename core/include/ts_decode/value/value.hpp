// ts_decode/value/value.hpp - Decoded value model
#pragma once

#include <gsl/span>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "ts_decode/decode/shape_kinds.hpp"

namespace ts_decode
{

/**
 * Wrapper for recursive types in std::variant.
 * Provides pointer semantics with value-like construction.
 */
template <typename T>
class Box
{
public:
  Box() : ptr_(std::make_unique<T>()) {}
  Box(T value) : ptr_(std::make_unique<T>(std::move(value))) {}
  Box(const Box & other) : ptr_(std::make_unique<T>(*other.ptr_)) {}
  Box(Box &&) noexcept = default;

  Box & operator=(const Box & other)
  {
    if (this != &other) {
      ptr_ = std::make_unique<T>(*other.ptr_);
    }
    return *this;
  }
  Box & operator=(Box &&) noexcept = default;

  T & operator*() { return *ptr_; }
  const T & operator*() const { return *ptr_; }
  T * operator->() { return ptr_.get(); }
  const T * operator->() const { return ptr_.get(); }

  friend bool operator==(const Box & a, const Box & b) { return *a.ptr_ == *b.ptr_; }

private:
  std::unique_ptr<T> ptr_;
};

/// Borrowed UTF-8 bytes of a node's text.
struct Bytes
{
  gsl::span<const std::byte> data;

  friend bool operator==(const Bytes & a, const Bytes & b);
};

class Value;
struct OptionalValue;
struct ListValue;
struct RecordValue;
struct VariantValue;

enum class ValueKind : uint8_t {
  Unit,
  Bool,
  Int,
  UInt,
  Float,
  BorrowedText,
  OwnedText,
  Bytes,
  Optional,
  List,
  Record,
  Variant,
};

[[nodiscard]] std::string_view to_string(ValueKind kind) noexcept;

/**
 * A decoded value.
 *
 * Borrowed text and bytes point into the source buffer and are valid only
 * while it lives. Named wrappers are transparent and decode to their payload.
 */
class Value
{
public:
  // Alternative order matches ValueKind.
  using Storage = std::variant<
    std::monostate, bool, int64_t, uint64_t, double, std::string_view, std::string, Bytes,
    Box<OptionalValue>, Box<ListValue>, Box<RecordValue>, Box<VariantValue>>;

  Value() = default;

  [[nodiscard]] static Value unit() { return Value(); }
  [[nodiscard]] static Value boolean(bool b);
  [[nodiscard]] static Value integer(int64_t i);
  [[nodiscard]] static Value unsigned_integer(uint64_t u);
  [[nodiscard]] static Value floating(double d);
  [[nodiscard]] static Value borrowed(std::string_view text);
  [[nodiscard]] static Value owned(std::string text);
  [[nodiscard]] static Value bytes(Bytes b);
  [[nodiscard]] static Value none();
  [[nodiscard]] static Value some(Value inner);
  [[nodiscard]] static Value list(std::vector<Value> elements);
  [[nodiscard]] static Value record(
    std::string name, std::vector<std::pair<std::string, Value>> fields);
  [[nodiscard]] static Value variant(std::string tag, VariantStyle style, Value payload);

  [[nodiscard]] ValueKind kind() const noexcept { return static_cast<ValueKind>(data_.index()); }

  [[nodiscard]] bool is_unit() const noexcept { return kind() == ValueKind::Unit; }
  [[nodiscard]] bool is_text() const noexcept
  {
    return kind() == ValueKind::BorrowedText || kind() == ValueKind::OwnedText;
  }
  [[nodiscard]] bool is_none() const noexcept;

  // Typed accessors; throw std::bad_variant_access on kind mismatch.
  [[nodiscard]] bool as_bool() const { return std::get<bool>(data_); }
  [[nodiscard]] int64_t as_int() const { return std::get<int64_t>(data_); }
  [[nodiscard]] uint64_t as_uint() const { return std::get<uint64_t>(data_); }
  [[nodiscard]] double as_float() const { return std::get<double>(data_); }
  [[nodiscard]] const Bytes & as_bytes() const { return std::get<Bytes>(data_); }
  [[nodiscard]] std::string_view as_text() const;
  [[nodiscard]] const Value * as_optional() const;  // nullptr for none
  [[nodiscard]] const std::vector<Value> & as_list() const;
  [[nodiscard]] const RecordValue & as_record() const;
  [[nodiscard]] const VariantValue & as_variant() const;

  [[nodiscard]] const Storage & storage() const noexcept { return data_; }

  friend bool operator==(const Value & a, const Value & b);
  friend bool operator!=(const Value & a, const Value & b) { return !(a == b); }

private:
  template <typename A, typename Arg>
  Value(std::in_place_type_t<A> tag, Arg && arg) : data_(tag, std::forward<Arg>(arg))
  {
  }

  Storage data_;
};

struct OptionalValue
{
  std::optional<Value> inner;

  bool operator==(const OptionalValue &) const = default;
};

struct ListValue
{
  std::vector<Value> elements;

  bool operator==(const ListValue &) const = default;
};

struct RecordValue
{
  std::string name;
  std::vector<std::pair<std::string, Value>> fields;

  /// Field value by name, nullptr if the record has no such field.
  [[nodiscard]] const Value * field(std::string_view field_name) const noexcept;

  bool operator==(const RecordValue &) const = default;
};

struct VariantValue
{
  std::string tag;
  VariantStyle style = VariantStyle::Unit;
  Value payload;

  bool operator==(const VariantValue &) const = default;
};

}  // namespace ts_decode
