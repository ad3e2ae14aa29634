// ts_decode/decode/decode.cpp - Tree-sitter entry point
#include "ts_decode/decode/decode.hpp"

#include "ts_decode/syntax/ts_node.hpp"

namespace ts_decode
{

DecodeResult<Value> decode_tree(
  const ts_ll::Tree & tree, const SourceManager & sm, const Shape & shape,
  const DecodeOptions & options, const ShapeRegistry * registry)
{
  if (tree.is_null()) {
    return DecodeError::custom("cannot decode an empty tree");
  }
  return decode_node(TsNode(tree.root_node(), sm), shape, options, registry);
}

}  // namespace ts_decode
