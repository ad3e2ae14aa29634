// ts_decode/decode/error.cpp - Decode error construction and messages
#include "ts_decode/decode/error.hpp"

#include <fmt/core.h>

#include <ostream>

namespace ts_decode
{

namespace
{

// Visitor overload helper
template <class... Ts>
struct Overloaded : Ts...
{
  using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

}  // namespace

std::string_view to_string(DecodeErrorKind kind) noexcept
{
  switch (kind) {
    case DecodeErrorKind::ArityMismatch:
      return "ArityMismatch";
    case DecodeErrorKind::FieldArityMismatch:
      return "FieldArityMismatch";
    case DecodeErrorKind::NodeKindMismatch:
      return "NodeKindMismatch";
    case DecodeErrorKind::UnsupportedShape:
      return "UnsupportedShape";
    case DecodeErrorKind::NumberParseError:
      return "NumberParseError";
    case DecodeErrorKind::BooleanParseError:
      return "BooleanParseError";
    case DecodeErrorKind::StructuralError:
      return "StructuralError";
    case DecodeErrorKind::Custom:
      return "Custom";
  }
  return "Unknown";
}

std::string_view describe(ParseFailure failure, AtomKind kind) noexcept
{
  if (is_float(kind)) {
    return failure == ParseFailure::Empty ? "cannot parse float from empty string"
                                          : "invalid float literal";
  }
  switch (failure) {
    case ParseFailure::Empty:
      return "cannot parse integer from empty string";
    case ParseFailure::InvalidDigit:
      return "invalid digit found in string";
    case ParseFailure::PosOverflow:
      return "number too large to fit in target type";
    case ParseFailure::NegOverflow:
      return "number too small to fit in target type";
    case ParseFailure::Invalid:
      return "invalid number literal";
  }
  return "invalid number literal";
}

// ============================================================================
// Factories
// ============================================================================

DecodeError DecodeError::arity(size_t expected, size_t actual)
{
  return DecodeError(ArityMismatch{expected, actual});
}

DecodeError DecodeError::field_arity(std::string_view field_name, size_t expected, size_t actual)
{
  return DecodeError(FieldArityMismatch{std::string(field_name), expected, actual});
}

DecodeError DecodeError::node_kind(std::string_view expected, std::string_view actual)
{
  return DecodeError(NodeKindMismatch{std::string(expected), std::string(actual)});
}

DecodeError DecodeError::unsupported(std::string description)
{
  return DecodeError(UnsupportedShape{std::move(description)});
}

DecodeError DecodeError::number(AtomKind kind, ParseFailure failure, std::string_view input)
{
  return DecodeError(NumberParseError{kind, failure, std::string(input)});
}

DecodeError DecodeError::boolean(std::string_view input)
{
  return DecodeError(BooleanParseError{std::string(input)});
}

DecodeError DecodeError::structural(std::vector<SourceRange> spans)
{
  return DecodeError(StructuralError{std::move(spans)});
}

DecodeError DecodeError::custom(std::string message)
{
  return DecodeError(CustomError{std::move(message)});
}

// ============================================================================
// Messages
// ============================================================================

std::string DecodeError::message() const
{
  return std::visit(
    Overloaded{
      [](const ArityMismatch & e) {
        return fmt::format(
          "Child count not match: expected={}, actual={}", e.expected, e.actual);
      },
      [](const FieldArityMismatch & e) {
        return fmt::format(
          "Node count not match(field = {}): expected={}, actual={}", e.field_name, e.expected,
          e.actual);
      },
      [](const NodeKindMismatch & e) {
        return fmt::format("Node type not match: expected={}, actual={}", e.expected, e.actual);
      },
      [](const UnsupportedShape & e) { return e.description; },
      [](const NumberParseError & e) {
        return fmt::format(
          "failed to parse `{}` as {}: {}", e.input, to_string(e.kind),
          describe(e.failure, e.kind));
      },
      [](const BooleanParseError & e) {
        return fmt::format(
          "failed to parse `{}` as bool: provided string was not `true` or `false`", e.input);
      },
      [](const StructuralError & e) {
        return fmt::format("source tree contains {} syntax error(s)", e.spans.size());
      },
      [](const CustomError & e) { return e.message; },
    },
    payload_);
}

std::ostream & operator<<(std::ostream & os, const DecodeError & error)
{
  return os << to_string(error.kind()) << ": " << error.message();
}

}  // namespace ts_decode
