// ts_decode/decode/atom.cpp - Primitive decoding from node text
#include "ts_decode/decode/atom.hpp"

#include <fmt/core.h>

#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdint>
#include <limits>
#include <string>
#include <system_error>

namespace ts_decode
{

namespace
{

bool is_digit(char c) noexcept { return c >= '0' && c <= '9'; }

template <typename Int>
DecodeResult<Int> parse_integer(std::string_view text, AtomKind kind)
{
  if (text.empty()) {
    return DecodeError::number(kind, ParseFailure::Empty, text);
  }

  std::string_view digits = text;
  bool negative = false;
  if (digits.front() == '+' || digits.front() == '-') {
    negative = digits.front() == '-';
    digits.remove_prefix(1);
  }
  if (digits.empty() || (negative && !std::numeric_limits<Int>::is_signed)) {
    return DecodeError::number(kind, ParseFailure::InvalidDigit, text);
  }
  for (char c : digits) {
    if (!is_digit(c)) {
      return DecodeError::number(kind, ParseFailure::InvalidDigit, text);
    }
  }

  // from_chars accepts a leading '-' but not '+'
  const char * first = negative ? digits.data() - 1 : digits.data();
  const char * last = digits.data() + digits.size();
  Int out{};
  auto [ptr, ec] = std::from_chars(first, last, out);
  if (ec == std::errc::result_out_of_range) {
    return DecodeError::number(
      kind, negative ? ParseFailure::NegOverflow : ParseFailure::PosOverflow, text);
  }
  if (ec != std::errc() || ptr != last) {
    return DecodeError::number(kind, ParseFailure::InvalidDigit, text);
  }
  return out;
}

bool iequals(std::string_view a, std::string_view b) noexcept
{
  if (a.size() != b.size()) return false;
  for (size_t i = 0; i < a.size(); ++i) {
    if (std::tolower(static_cast<unsigned char>(a[i])) != b[i]) return false;
  }
  return true;
}

// Decimal exponent of a finite literal, used to decide between overflow
// (infinity) and underflow (zero) when from_chars reports out of range.
long approximate_exponent(std::string_view body) noexcept
{
  long exponent = 0;
  long int_digits = 0;
  long leading_frac_zeros = 0;
  bool seen_nonzero = false;
  bool in_fraction = false;
  size_t i = 0;
  for (; i < body.size(); ++i) {
    char c = body[i];
    if (c == '.') {
      in_fraction = true;
      continue;
    }
    if (!is_digit(c)) break;
    if (!in_fraction) {
      if (seen_nonzero || c != '0') {
        seen_nonzero = true;
        ++int_digits;
      }
    } else if (!seen_nonzero) {
      if (c == '0') {
        ++leading_frac_zeros;
      } else {
        seen_nonzero = true;
      }
    }
  }
  if (i < body.size() && (body[i] == 'e' || body[i] == 'E')) {
    long e = 0;
    auto res = std::from_chars(body.data() + i + 1, body.data() + body.size(), e);
    if (res.ec == std::errc::result_out_of_range) {
      e = body[i + 1] == '-' ? std::numeric_limits<long>::min() / 2
                             : std::numeric_limits<long>::max() / 2;
    }
    exponent = e;
  }
  return exponent + (int_digits > 0 ? int_digits : -leading_frac_zeros);
}

template <typename Float>
DecodeResult<Float> parse_float(std::string_view text, AtomKind kind)
{
  if (text.empty()) {
    return DecodeError::number(kind, ParseFailure::Empty, text);
  }

  std::string_view body = text;
  bool negative = false;
  if (body.front() == '+' || body.front() == '-') {
    negative = body.front() == '-';
    body.remove_prefix(1);
  }
  if (body.empty()) {
    return DecodeError::number(kind, ParseFailure::Invalid, text);
  }

  if (iequals(body, "inf") || iequals(body, "infinity")) {
    Float inf = std::numeric_limits<Float>::infinity();
    return negative ? -inf : inf;
  }
  if (iequals(body, "nan")) {
    return std::numeric_limits<Float>::quiet_NaN();
  }

  // Only decimal digits, one point and an exponent are accepted.
  if (!is_digit(body.front()) && body.front() != '.') {
    return DecodeError::number(kind, ParseFailure::Invalid, text);
  }

  Float out{};
  const char * last = body.data() + body.size();
  auto [ptr, ec] = std::from_chars(body.data(), last, out, std::chars_format::general);
  if (ptr != last || (ec != std::errc() && ec != std::errc::result_out_of_range)) {
    return DecodeError::number(kind, ParseFailure::Invalid, text);
  }
  if (ec == std::errc::result_out_of_range) {
    out = approximate_exponent(body) > 0 ? std::numeric_limits<Float>::infinity() : Float(0);
  }
  return negative ? -out : out;
}

template <typename Int>
DecodeResult<Value> signed_value(std::string_view text, AtomKind kind)
{
  auto r = parse_integer<Int>(text, kind);
  if (!r) return std::move(r).error();
  return Value::integer(static_cast<int64_t>(*r));
}

template <typename Int>
DecodeResult<Value> unsigned_value(std::string_view text, AtomKind kind)
{
  auto r = parse_integer<Int>(text, kind);
  if (!r) return std::move(r).error();
  return Value::unsigned_integer(static_cast<uint64_t>(*r));
}

template <typename Float>
DecodeResult<Value> float_value(std::string_view text, AtomKind kind)
{
  auto r = parse_float<Float>(text, kind);
  if (!r) return std::move(r).error();
  return Value::floating(static_cast<double>(*r));
}

}  // namespace

DecodeResult<Value> decode_atom_text(std::string_view text, AtomKind kind)
{
  switch (kind) {
    case AtomKind::Bool:
      if (text == "true") return Value::boolean(true);
      if (text == "false") return Value::boolean(false);
      return DecodeError::boolean(text);
    case AtomKind::I8:
      return signed_value<int8_t>(text, kind);
    case AtomKind::I16:
      return signed_value<int16_t>(text, kind);
    case AtomKind::I32:
      return signed_value<int32_t>(text, kind);
    case AtomKind::I64:
      return signed_value<int64_t>(text, kind);
    case AtomKind::U8:
      return unsigned_value<uint8_t>(text, kind);
    case AtomKind::U16:
      return unsigned_value<uint16_t>(text, kind);
    case AtomKind::U32:
      return unsigned_value<uint32_t>(text, kind);
    case AtomKind::U64:
      return unsigned_value<uint64_t>(text, kind);
    case AtomKind::F32:
      return float_value<float>(text, kind);
    case AtomKind::F64:
      return float_value<double>(text, kind);
    case AtomKind::Str:
      return Value::borrowed(text);
    case AtomKind::String:
      return Value::owned(std::string(text));
    case AtomKind::Bytes:
      return Value::bytes(Bytes{gsl::as_bytes(gsl::span<const char>(text.data(), text.size()))});
    case AtomKind::Unit:
      return Value::unit();
    case AtomKind::Char:
    case AtomKind::ByteBuf:
      return DecodeError::unsupported(
        fmt::format("Data type `{}` is not supported", to_string(kind)));
  }
  return DecodeError::unsupported(fmt::format("Data type `{}` is not supported", to_string(kind)));
}

}  // namespace ts_decode
