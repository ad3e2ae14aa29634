// ts_decode/typed.hpp - Decoding straight into C++ types
//
// Decodable<T> pairs a shape with a conversion from the decoded Value.
// Specialisations for primitives and standard containers are provided;
// records and unions specialise it themselves:
//
// @code
//   struct Pair { std::string key; int64_t value; };
//
//   template <>
//   struct ts_decode::Decodable<Pair>
//   {
//     static ShapePtr shape()
//     {
//       return Shape::record("pair", {{"key", Decodable<std::string>::shape()},
//                                     {"value", Decodable<int64_t>::shape()}});
//     }
//     static DecodeResult<Pair> from_value(const Value & v)
//     {
//       auto key = field_as<std::string>(v, "key");
//       if (!key) return std::move(key).error();
//       auto value = field_as<int64_t>(v, "value");
//       if (!value) return std::move(value).error();
//       return Pair{std::move(*key), *value};
//     }
//   };
// @endcode
//
#pragma once

#include <fmt/core.h>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include "ts_decode/decode/decode.hpp"

namespace ts_decode
{

template <typename T, typename = void>
struct Decodable;

namespace detail
{

inline DecodeError type_mismatch(std::string_view expected, const Value & v)
{
  return DecodeError::custom(
    fmt::format("expected {} value, found {}", expected, to_string(v.kind())));
}

template <typename T>
constexpr AtomKind integer_atom_kind()
{
  if constexpr (std::is_signed_v<T>) {
    if constexpr (sizeof(T) == 1) return AtomKind::I8;
    if constexpr (sizeof(T) == 2) return AtomKind::I16;
    if constexpr (sizeof(T) == 4) return AtomKind::I32;
    return AtomKind::I64;
  } else {
    if constexpr (sizeof(T) == 1) return AtomKind::U8;
    if constexpr (sizeof(T) == 2) return AtomKind::U16;
    if constexpr (sizeof(T) == 4) return AtomKind::U32;
    return AtomKind::U64;
  }
}

template <typename T>
inline constexpr bool is_decodable_integer_v =
  std::is_integral_v<T> && !std::is_same_v<T, bool> && !std::is_same_v<T, char> &&
  sizeof(T) <= 8;

}  // namespace detail

// ============================================================================
// Primitives
// ============================================================================

template <>
struct Decodable<bool>
{
  static ShapePtr shape() { return Shape::atom(AtomKind::Bool); }
  static DecodeResult<bool> from_value(const Value & v)
  {
    if (v.kind() != ValueKind::Bool) return detail::type_mismatch("bool", v);
    return v.as_bool();
  }
};

template <typename T>
struct Decodable<T, std::enable_if_t<detail::is_decodable_integer_v<T>>>
{
  static ShapePtr shape() { return Shape::atom(detail::integer_atom_kind<T>()); }
  static DecodeResult<T> from_value(const Value & v)
  {
    if constexpr (std::is_signed_v<T>) {
      if (v.kind() != ValueKind::Int) return detail::type_mismatch("integer", v);
      return static_cast<T>(v.as_int());
    } else {
      if (v.kind() != ValueKind::UInt) return detail::type_mismatch("unsigned integer", v);
      return static_cast<T>(v.as_uint());
    }
  }
};

template <typename T>
struct Decodable<T, std::enable_if_t<std::is_floating_point_v<T>>>
{
  static ShapePtr shape()
  {
    return Shape::atom(std::is_same_v<T, float> ? AtomKind::F32 : AtomKind::F64);
  }
  static DecodeResult<T> from_value(const Value & v)
  {
    if (v.kind() != ValueKind::Float) return detail::type_mismatch("float", v);
    return static_cast<T>(v.as_float());
  }
};

template <>
struct Decodable<std::string>
{
  static ShapePtr shape() { return Shape::atom(AtomKind::String); }
  static DecodeResult<std::string> from_value(const Value & v)
  {
    if (!v.is_text()) return detail::type_mismatch("text", v);
    return std::string(v.as_text());
  }
};

/// Borrows from the source buffer.
template <>
struct Decodable<std::string_view>
{
  static ShapePtr shape() { return Shape::atom(AtomKind::Str); }
  static DecodeResult<std::string_view> from_value(const Value & v)
  {
    if (!v.is_text()) return detail::type_mismatch("text", v);
    return v.as_text();
  }
};

template <>
struct Decodable<std::monostate>
{
  static ShapePtr shape() { return Shape::atom(AtomKind::Unit); }
  static DecodeResult<std::monostate> from_value(const Value &) { return std::monostate{}; }
};

// ============================================================================
// Containers
// ============================================================================

template <typename T>
struct Decodable<std::vector<T>>
{
  static ShapePtr shape() { return Shape::sequence(Decodable<T>::shape()); }
  static DecodeResult<std::vector<T>> from_value(const Value & v)
  {
    if (v.kind() != ValueKind::List) return detail::type_mismatch("list", v);
    std::vector<T> out;
    out.reserve(v.as_list().size());
    for (const auto & element : v.as_list()) {
      auto r = Decodable<T>::from_value(element);
      if (!r) return std::move(r).error();
      out.push_back(std::move(r).value());
    }
    return out;
  }
};

template <typename T>
struct Decodable<std::optional<T>>
{
  static ShapePtr shape() { return Shape::option(Decodable<T>::shape()); }
  static DecodeResult<std::optional<T>> from_value(const Value & v)
  {
    if (v.kind() != ValueKind::Optional) return detail::type_mismatch("optional", v);
    const Value * inner = v.as_optional();
    if (!inner) return std::optional<T>{};
    auto r = Decodable<T>::from_value(*inner);
    if (!r) return std::move(r).error();
    return std::optional<T>(std::move(r).value());
  }
};

template <typename... Ts>
struct Decodable<std::tuple<Ts...>>
{
  static ShapePtr shape() { return Shape::tuple({Decodable<Ts>::shape()...}); }
  static DecodeResult<std::tuple<Ts...>> from_value(const Value & v)
  {
    if (v.kind() != ValueKind::List || v.as_list().size() != sizeof...(Ts)) {
      return detail::type_mismatch(fmt::format("{}-tuple", sizeof...(Ts)), v);
    }
    return from_list(v.as_list(), std::index_sequence_for<Ts...>{});
  }

private:
  template <size_t... I>
  static DecodeResult<std::tuple<Ts...>> from_list(
    const std::vector<Value> & elements, std::index_sequence<I...>)
  {
    std::tuple<DecodeResult<Ts>...> parts{Decodable<Ts>::from_value(elements[I])...};
    std::optional<DecodeError> first_error;
    (void)((std::get<I>(parts).has_error() ? (first_error = std::get<I>(parts).error(), false)
                                          : true) &&
           ...);
    if (first_error) return *first_error;
    return std::tuple<Ts...>(std::move(std::get<I>(parts)).value()...);
  }
};

// ============================================================================
// Entry points
// ============================================================================

/// Convert the named field of a decoded record.
template <typename T>
[[nodiscard]] DecodeResult<T> field_as(const Value & record, std::string_view field_name)
{
  if (record.kind() != ValueKind::Record) return detail::type_mismatch("record", record);
  const Value * field = record.as_record().field(field_name);
  if (!field) {
    return DecodeError::custom(fmt::format(
      "record `{}` has no field `{}`", record.as_record().name, field_name));
  }
  return Decodable<T>::from_value(*field);
}

/// Decode `node` into T using Decodable<T>.
template <typename T, typename N>
[[nodiscard]] DecodeResult<T> decode_as(
  const N & node, const DecodeOptions & options = {}, const ShapeRegistry * registry = nullptr)
{
  const ShapePtr shape = Decodable<T>::shape();
  auto r = decode_node(node, *shape, options, registry);
  if (!r) return std::move(r).error();
  return Decodable<T>::from_value(*r);
}

}  // namespace ts_decode
