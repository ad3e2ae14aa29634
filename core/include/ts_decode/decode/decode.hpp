// ts_decode/decode/decode.hpp - Top-level decode entry points
#pragma once

#include "ts_decode/basic/source_manager.hpp"
#include "ts_decode/decode/decoder.hpp"
#include "ts_decode/decode/error_scan.hpp"
#include "ts_decode/syntax/ts_ll.hpp"

namespace ts_decode
{

struct DecodeOptions
{
  /// Refuse trees that contain ERROR or MISSING nodes before decoding.
  bool check_errors = false;
};

/**
 * Decode `node` against `shape`.
 *
 * With `options.check_errors` set, a tree that reports parser errors fails
 * with a StructuralError listing every error span; nothing is decoded.
 */
template <typename N>
[[nodiscard]] DecodeResult<Value> decode_node(
  const N & node, const Shape & shape, const DecodeOptions & options = {},
  const ShapeRegistry * registry = nullptr)
{
  if (options.check_errors) {
    if constexpr (is_scannable_node_v<N>) {
      if (node.has_error()) {
        return DecodeError::structural(collect_error_ranges(node));
      }
    } else {
      return DecodeError::custom("strict decoding requires a node type that reports errors");
    }
  }
  return Decoder<N>(registry).decode(node, shape);
}

/// Decode the root node of a tree-sitter tree parsed from `sm`'s buffer.
[[nodiscard]] DecodeResult<Value> decode_tree(
  const ts_ll::Tree & tree, const SourceManager & sm, const Shape & shape,
  const DecodeOptions & options = {}, const ShapeRegistry * registry = nullptr);

}  // namespace ts_decode
