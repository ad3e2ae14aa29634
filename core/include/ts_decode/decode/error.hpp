// ts_decode/decode/error.hpp - Closed taxonomy of decode failures
//
// Errors are plain data: they carry enough context to build a diagnostic
// without re-walking the tree, and compare equal by value so tests can
// assert on them directly.
//
#pragma once

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "ts_decode/basic/source_manager.hpp"
#include "ts_decode/decode/shape_kinds.hpp"

namespace ts_decode
{

enum class DecodeErrorKind : uint8_t {
  ArityMismatch,
  FieldArityMismatch,
  NodeKindMismatch,
  UnsupportedShape,
  NumberParseError,
  BooleanParseError,
  StructuralError,
  Custom,
};

/// Why a numeric literal was rejected.
enum class ParseFailure : uint8_t {
  Empty,
  InvalidDigit,
  PosOverflow,
  NegOverflow,
  Invalid,  // float literal that is not a number
};

[[nodiscard]] std::string_view to_string(DecodeErrorKind kind) noexcept;

/// Wrong number of positional children for a tuple, option or wrapper payload.
struct ArityMismatch
{
  size_t expected = 0;
  size_t actual = 0;

  bool operator==(const ArityMismatch &) const = default;
};

/// Wrong number of children tagged with a field name.
struct FieldArityMismatch
{
  std::string field_name;
  size_t expected = 0;
  size_t actual = 0;

  bool operator==(const FieldArityMismatch &) const = default;
};

/// Node type tag differs from the declared record/wrapper name.
struct NodeKindMismatch
{
  std::string expected;
  std::string actual;

  bool operator==(const NodeKindMismatch &) const = default;
};

struct UnsupportedShape
{
  std::string description;

  bool operator==(const UnsupportedShape &) const = default;
};

struct NumberParseError
{
  AtomKind kind = AtomKind::I64;
  ParseFailure failure = ParseFailure::InvalidDigit;
  std::string input;

  bool operator==(const NumberParseError &) const = default;
};

struct BooleanParseError
{
  std::string input;

  bool operator==(const BooleanParseError &) const = default;
};

/// Parser-level error markers found by the strict pre-scan.
struct StructuralError
{
  std::vector<SourceRange> spans;

  bool operator==(const StructuralError &) const = default;
};

struct CustomError
{
  std::string message;

  bool operator==(const CustomError &) const = default;
};

class DecodeError
{
public:
  // Alternative order matches DecodeErrorKind.
  using Payload = std::variant<
    ArityMismatch, FieldArityMismatch, NodeKindMismatch, UnsupportedShape, NumberParseError,
    BooleanParseError, StructuralError, CustomError>;

  [[nodiscard]] static DecodeError arity(size_t expected, size_t actual);
  [[nodiscard]] static DecodeError field_arity(
    std::string_view field_name, size_t expected, size_t actual);
  [[nodiscard]] static DecodeError node_kind(std::string_view expected, std::string_view actual);
  [[nodiscard]] static DecodeError unsupported(std::string description);
  [[nodiscard]] static DecodeError number(
    AtomKind kind, ParseFailure failure, std::string_view input);
  [[nodiscard]] static DecodeError boolean(std::string_view input);
  [[nodiscard]] static DecodeError structural(std::vector<SourceRange> spans);
  [[nodiscard]] static DecodeError custom(std::string message);

  [[nodiscard]] DecodeErrorKind kind() const noexcept
  {
    return static_cast<DecodeErrorKind>(payload_.index());
  }

  template <typename T>
  [[nodiscard]] const T * get_if() const noexcept
  {
    return std::get_if<T>(&payload_);
  }

  template <typename T>
  [[nodiscard]] const T & get() const
  {
    return std::get<T>(payload_);
  }

  [[nodiscard]] const Payload & payload() const noexcept { return payload_; }

  /// One-line human readable description.
  [[nodiscard]] std::string message() const;

  bool operator==(const DecodeError & other) const { return payload_ == other.payload_; }
  bool operator!=(const DecodeError & other) const { return !(*this == other); }

private:
  explicit DecodeError(Payload payload) : payload_(std::move(payload)) {}

  Payload payload_;
};

/// Text of the underlying numeric/boolean parser diagnostic.
[[nodiscard]] std::string_view describe(ParseFailure failure, AtomKind kind) noexcept;

std::ostream & operator<<(std::ostream & os, const DecodeError & error);

}  // namespace ts_decode
