// ts_decode/syntax/ts_node.cpp - Tree-sitter node adapter
#include "ts_decode/syntax/ts_node.hpp"

namespace ts_decode
{

std::vector<TsNode> TsNode::named_children() const
{
  std::vector<TsNode> out;
  out.reserve(node_.named_child_count());

  ts_ll::Cursor cursor(node_);
  if (!cursor.goto_first_child()) return out;
  do {
    const ts_ll::Node c = cursor.current_node();
    if (c.is_named()) out.emplace_back(c, *sm_);
  } while (cursor.goto_next_sibling());

  return out;
}

std::vector<TsNode> TsNode::children_by_field_name(std::string_view field) const
{
  std::vector<TsNode> out;

  ts_ll::Cursor cursor(node_);
  if (!cursor.goto_first_child()) return out;
  do {
    const ts_ll::Node c = cursor.current_node();
    if (c.is_named() && cursor.current_field_name() == field) out.emplace_back(c, *sm_);
  } while (cursor.goto_next_sibling());

  return out;
}

std::vector<std::pair<std::string_view, TsNode>> TsNode::named_children_with_fields() const
{
  std::vector<std::pair<std::string_view, TsNode>> out;

  ts_ll::Cursor cursor(node_);
  if (!cursor.goto_first_child()) return out;
  do {
    const ts_ll::Node c = cursor.current_node();
    if (c.is_named()) out.emplace_back(cursor.current_field_name(), TsNode(c, *sm_));
  } while (cursor.goto_next_sibling());

  return out;
}

}  // namespace ts_decode
