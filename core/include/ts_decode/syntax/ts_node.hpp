// ts_decode/syntax/ts_node.hpp - Tree-sitter node adapter for the decode engine
#pragma once

#include <cstdint>
#include <string_view>
#include <utility>
#include <vector>

#include "ts_decode/basic/source_manager.hpp"
#include "ts_decode/syntax/ts_ll.hpp"

namespace ts_decode
{

/**
 * A tree-sitter node paired with the buffer it was parsed from.
 *
 * Exposes the node capability set the decoder and the error scan rely on.
 * Unnamed (anonymous) children are never reported by the named/field queries.
 * The SourceManager must outlive every TsNode created from it.
 */
class TsNode
{
public:
  TsNode(ts_ll::Node node, const SourceManager & sm) : node_(node), sm_(&sm) {}

  [[nodiscard]] std::string_view kind() const noexcept { return node_.kind(); }
  [[nodiscard]] std::string_view text() const noexcept { return node_.text(*sm_); }

  [[nodiscard]] uint32_t named_child_count() const noexcept { return node_.named_child_count(); }
  [[nodiscard]] TsNode named_child(uint32_t i) const noexcept
  {
    return TsNode(node_.named_child(i), *sm_);
  }
  [[nodiscard]] std::vector<TsNode> named_children() const;
  [[nodiscard]] std::vector<TsNode> children_by_field_name(std::string_view field) const;

  /// Named children paired with their field tag (empty when untagged).
  [[nodiscard]] std::vector<std::pair<std::string_view, TsNode>> named_children_with_fields() const;

  [[nodiscard]] bool is_error() const noexcept { return node_.is_error(); }
  [[nodiscard]] bool is_missing() const noexcept { return node_.is_missing(); }
  [[nodiscard]] bool has_error() const noexcept { return node_.has_error(); }
  [[nodiscard]] SourceRange range() const noexcept { return node_.range(); }
  [[nodiscard]] uint32_t child_count() const noexcept { return node_.child_count(); }
  [[nodiscard]] TsNode child(uint32_t i) const noexcept { return TsNode(node_.child(i), *sm_); }

  [[nodiscard]] ts_ll::Node raw() const noexcept { return node_; }

private:
  ts_ll::Node node_;
  const SourceManager * sm_;
};

}  // namespace ts_decode
