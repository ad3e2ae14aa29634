// ts_decode/decode/atom.hpp - Primitive decoding from node text
#pragma once

#include <string_view>

#include "ts_decode/decode/result.hpp"
#include "ts_decode/decode/shape_kinds.hpp"
#include "ts_decode/value/value.hpp"

namespace ts_decode
{

/**
 * Decode a primitive from source text.
 *
 * Numbers use a locale-independent grammar: an optional leading sign
 * followed by digits for integers, decimal/exponent notation plus
 * `inf`/`infinity`/`nan` for floats. Str and Bytes borrow from `text`.
 */
[[nodiscard]] DecodeResult<Value> decode_atom_text(std::string_view text, AtomKind kind);

}  // namespace ts_decode
