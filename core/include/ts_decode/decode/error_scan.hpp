// ts_decode/decode/error_scan.hpp - Strict-mode scan for parser error markers
#pragma once

#include <cstdint>
#include <vector>

#include "ts_decode/basic/source_manager.hpp"
#include "ts_decode/decode/node_traits.hpp"

namespace ts_decode
{

namespace detail
{

template <typename N>
void collect_error_ranges_into(const N & node, std::vector<SourceRange> & out)
{
  if (node.is_error() || node.is_missing()) {
    out.push_back(node.range());
  }
  if (!node.has_error()) {
    return;
  }
  const uint32_t count = node.child_count();
  for (uint32_t i = 0; i < count; ++i) {
    collect_error_ranges_into(node.child(i), out);
  }
}

}  // namespace detail

/**
 * Spans of every ERROR and MISSING node under `node`, depth-first in source
 * order. Only subtrees that report has_error() are descended into; anonymous
 * children are visited as well since MISSING tokens are usually anonymous.
 */
template <typename N>
[[nodiscard]] std::vector<SourceRange> collect_error_ranges(const N & node)
{
  static_assert(
    is_scannable_node_v<N>,
    "collect_error_ranges requires is_error/is_missing/has_error/range/child_count/child");
  std::vector<SourceRange> out;
  detail::collect_error_ranges_into(node, out);
  return out;
}

}  // namespace ts_decode
