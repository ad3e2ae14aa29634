// ts_decode/test_support/fake_node.hpp - In-memory node trees for unit tests
//
// Builds trees with the same capability set as TsNode without a grammar:
//
// @code
//   FakeTree t(tree("root")
//                .field("a", leaf("number", "123"))
//                .field("b", leaf("text", "abc")));
//   auto r = decode_node(t.root(), *shape);
// @endcode
//
#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "ts_decode/basic/source_manager.hpp"

namespace ts_decode::test_support
{

struct FakeSpec
{
  std::string kind;
  std::string text;
  std::string field_name;  // empty when untagged
  bool named = true;
  bool error = false;
  bool missing = false;
  SourceRange range;
  std::vector<FakeSpec> children;

  FakeSpec & child(FakeSpec c)
  {
    children.push_back(std::move(c));
    return *this;
  }

  FakeSpec & field(std::string name, FakeSpec c)
  {
    c.field_name = std::move(name);
    children.push_back(std::move(c));
    return *this;
  }

  /// Unnamed child (punctuation); never seen by the named/field queries.
  FakeSpec & anonymous(std::string text_value)
  {
    FakeSpec c;
    c.kind = text_value;
    c.text = std::move(text_value);
    c.named = false;
    children.push_back(std::move(c));
    return *this;
  }

  FakeSpec & at(uint32_t start, uint32_t end)
  {
    range = SourceRange(start, end);
    return *this;
  }
};

inline FakeSpec tree(std::string kind, std::string text = {})
{
  FakeSpec s;
  s.kind = std::move(kind);
  s.text = std::move(text);
  return s;
}

inline FakeSpec leaf(std::string kind, std::string text) { return tree(std::move(kind), std::move(text)); }

inline FakeSpec error_node(std::string text = {})
{
  FakeSpec s = tree("ERROR", std::move(text));
  s.error = true;
  return s;
}

/// A zero-width token the parser inserted to recover.
inline FakeSpec missing_node(std::string kind)
{
  FakeSpec s = tree(std::move(kind));
  s.named = false;
  s.missing = true;
  return s;
}

class FakeNode
{
public:
  explicit FakeNode(const FakeSpec * spec) : spec_(spec) {}

  [[nodiscard]] std::string_view kind() const noexcept { return spec_->kind; }
  [[nodiscard]] std::string_view text() const noexcept { return spec_->text; }

  [[nodiscard]] uint32_t named_child_count() const noexcept
  {
    uint32_t n = 0;
    for (const auto & c : spec_->children) {
      if (c.named) ++n;
    }
    return n;
  }

  [[nodiscard]] FakeNode named_child(uint32_t i) const
  {
    for (const auto & c : spec_->children) {
      if (c.named && i-- == 0) return FakeNode(&c);
    }
    return FakeNode(nullptr);
  }

  [[nodiscard]] std::vector<FakeNode> named_children() const
  {
    std::vector<FakeNode> out;
    for (const auto & c : spec_->children) {
      if (c.named) out.emplace_back(&c);
    }
    return out;
  }

  [[nodiscard]] std::vector<FakeNode> children_by_field_name(std::string_view field) const
  {
    std::vector<FakeNode> out;
    for (const auto & c : spec_->children) {
      if (c.named && c.field_name == field) out.emplace_back(&c);
    }
    return out;
  }

  [[nodiscard]] std::vector<std::pair<std::string_view, FakeNode>> named_children_with_fields()
    const
  {
    std::vector<std::pair<std::string_view, FakeNode>> out;
    for (const auto & c : spec_->children) {
      if (c.named) out.emplace_back(c.field_name, FakeNode(&c));
    }
    return out;
  }

  [[nodiscard]] bool is_error() const noexcept { return spec_->error; }
  [[nodiscard]] bool is_missing() const noexcept { return spec_->missing; }

  [[nodiscard]] bool has_error() const noexcept
  {
    if (spec_->error || spec_->missing) return true;
    for (const auto & c : spec_->children) {
      if (FakeNode(&c).has_error()) return true;
    }
    return false;
  }

  [[nodiscard]] SourceRange range() const noexcept { return spec_->range; }
  [[nodiscard]] uint32_t child_count() const noexcept
  {
    return static_cast<uint32_t>(spec_->children.size());
  }
  [[nodiscard]] FakeNode child(uint32_t i) const { return FakeNode(&spec_->children.at(i)); }

private:
  const FakeSpec * spec_;
};

/// Owns a FakeSpec tree; nodes handed out stay valid while the tree lives.
class FakeTree
{
public:
  explicit FakeTree(FakeSpec root) : root_(std::make_unique<FakeSpec>(std::move(root))) {}

  [[nodiscard]] FakeNode root() const { return FakeNode(root_.get()); }

private:
  std::unique_ptr<FakeSpec> root_;
};

}  // namespace ts_decode::test_support
