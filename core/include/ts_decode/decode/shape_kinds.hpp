// ts_decode/decode/shape_kinds.hpp - Enumerations shared by shapes, values and errors
#pragma once

#include <cstdint>
#include <string_view>

namespace ts_decode
{

/**
 * Primitive targets decoded from a node's source text.
 *
 * Char and ByteBuf have no mapping onto a node and always fail.
 */
enum class AtomKind : uint8_t {
  Bool,
  I8,
  I16,
  I32,
  I64,
  U8,
  U16,
  U32,
  U64,
  F32,
  F64,
  Str,     // borrowed text
  String,  // owned text
  Bytes,   // borrowed UTF-8 bytes
  Unit,
  Char,
  ByteBuf,
};

enum class ShapeKind : uint8_t {
  Atom,
  Option,
  Tuple,
  Sequence,
  NamedWrapper,
  Record,
  UnitRecord,
  TupleRecord,
  Union,
  Identifier,
  Map,
  Ref,
};

/// Payload style of a union variant.
enum class VariantStyle : uint8_t {
  Unit,
  Newtype,
  Tuple,
  Record,
};

[[nodiscard]] std::string_view to_string(AtomKind kind) noexcept;
[[nodiscard]] std::string_view to_string(ShapeKind kind) noexcept;
[[nodiscard]] std::string_view to_string(VariantStyle style) noexcept;

[[nodiscard]] constexpr bool is_signed_integer(AtomKind k) noexcept
{
  return k == AtomKind::I8 || k == AtomKind::I16 || k == AtomKind::I32 || k == AtomKind::I64;
}

[[nodiscard]] constexpr bool is_unsigned_integer(AtomKind k) noexcept
{
  return k == AtomKind::U8 || k == AtomKind::U16 || k == AtomKind::U32 || k == AtomKind::U64;
}

[[nodiscard]] constexpr bool is_float(AtomKind k) noexcept
{
  return k == AtomKind::F32 || k == AtomKind::F64;
}

}  // namespace ts_decode
