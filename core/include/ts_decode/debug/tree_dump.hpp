// ts_decode/debug/tree_dump.hpp - Debug outline of a node's named children
//
// Useful when writing shapes for a new grammar: the outline shows exactly
// the type tags, field tags and leaf text the decoder will see.
//
// @code
//   - pair
//     - key: string "\"a\""
//     - value: number "1"
// @endcode
//
#pragma once

#include <fmt/core.h>

#include <cstddef>
#include <string>
#include <string_view>

#include "ts_decode/decode/node_traits.hpp"

namespace ts_decode
{

namespace detail
{

template <typename N>
void dump_tree_into(const N & node, std::string_view field, size_t depth, std::string & out)
{
  out.append(depth * 2, ' ');
  out += "- ";
  if (!field.empty()) {
    out += fmt::format("{}: ", field);
  }
  out += node.kind();
  if (node.named_child_count() == 0) {
    out += fmt::format(" \"{}\"", node.text());
  }
  out += '\n';

  for (const auto & [child_field, child] : node.named_children_with_fields()) {
    dump_tree_into(child, child_field, depth + 1, out);
  }
}

}  // namespace detail

/// Render `node` and its named descendants as an indented outline.
template <typename N>
[[nodiscard]] std::string dump_tree(const N & node)
{
  static_assert(is_decodable_node_v<N>, "dump_tree requires a decodable node type");
  std::string out;
  detail::dump_tree_into(node, std::string_view(), 0, out);
  return out;
}

}  // namespace ts_decode
