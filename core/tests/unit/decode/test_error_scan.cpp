#include <gtest/gtest.h>

#include <cstdint>
#include <string_view>
#include <vector>

#include "ts_decode/decode/decode.hpp"
#include "ts_decode/decode/error_scan.hpp"
#include "ts_decode/test_support/fake_node.hpp"

using ts_decode::AtomKind;
using ts_decode::collect_error_ranges;
using ts_decode::decode_node;
using ts_decode::DecodeError;
using ts_decode::DecodeOptions;
using ts_decode::is_decodable_node_v;
using ts_decode::is_scannable_node_v;
using ts_decode::Shape;
using ts_decode::SourceRange;
using ts_decode::StructuralError;
using ts_decode::test_support::error_node;
using ts_decode::test_support::FakeNode;
using ts_decode::test_support::FakeTree;
using ts_decode::test_support::leaf;
using ts_decode::test_support::missing_node;
using ts_decode::test_support::tree;

namespace
{

struct TextOnlyNode
{
  std::string_view kind() const { return "x"; }
  std::string_view text() const { return "1"; }
  uint32_t named_child_count() const { return 0; }
  TextOnlyNode named_child(uint32_t) const { return {}; }
  std::vector<TextOnlyNode> named_children() const { return {}; }
  std::vector<TextOnlyNode> children_by_field_name(std::string_view) const { return {}; }
};

static_assert(is_decodable_node_v<FakeNode>);
static_assert(is_scannable_node_v<FakeNode>);
static_assert(is_decodable_node_v<TextOnlyNode>);
static_assert(!is_scannable_node_v<TextOnlyNode>);
static_assert(!is_decodable_node_v<int>);

FakeTree broken_tree()
{
  return FakeTree(tree("list")
                    .child(leaf("n", "1").at(0, 1))
                    .child(error_node("@@").at(2, 4))
                    .child(tree("pair").at(5, 9).child(leaf("n", "2").at(5, 6)).child(missing_node(")").at(9, 9)))
                    .child(leaf("n", "3").at(10, 11)));
}

}  // namespace

TEST(ErrorScan, CleanTreeHasNoRanges)
{
  FakeTree t(tree("list").child(leaf("n", "1")).child(leaf("n", "2")));
  EXPECT_TRUE(collect_error_ranges(t.root()).empty());
}

TEST(ErrorScan, CollectsErrorAndMissingDepthFirst)
{
  const FakeTree t = broken_tree();
  const auto ranges = collect_error_ranges(t.root());
  ASSERT_EQ(ranges.size(), 2u);
  EXPECT_EQ(ranges[0], SourceRange(2, 4));
  EXPECT_EQ(ranges[1], SourceRange(9, 9));
}

TEST(ErrorScan, ErrorInsideErrorIsReportedToo)
{
  FakeTree t(tree("doc").child(error_node("a b").at(0, 3).child(error_node("b").at(2, 3))));
  const auto ranges = collect_error_ranges(t.root());
  ASSERT_EQ(ranges.size(), 2u);
  EXPECT_EQ(ranges[0], SourceRange(0, 3));
  EXPECT_EQ(ranges[1], SourceRange(2, 3));
}

TEST(ErrorScan, StrictDecodeFailsBeforeDecoding)
{
  const FakeTree t = broken_tree();
  const auto shape = Shape::sequence(Shape::atom(AtomKind::Str));

  auto strict = decode_node(t.root(), *shape, DecodeOptions{true});
  ASSERT_FALSE(strict);
  EXPECT_EQ(strict.error(), DecodeError::structural({SourceRange(2, 4), SourceRange(9, 9)}));
  EXPECT_EQ(strict.error().get<StructuralError>().spans.size(), 2u);
}

TEST(ErrorScan, LenientDecodeIgnoresErrorMarkers)
{
  const FakeTree t = broken_tree();
  const auto shape = Shape::sequence(Shape::atom(AtomKind::Str));

  // ERROR nodes are named, so they show up as elements.
  auto lenient = decode_node(t.root(), *shape);
  ASSERT_TRUE(lenient);
  EXPECT_EQ(lenient->as_list().size(), 4u);
}

TEST(ErrorScan, StrictModeNeedsScannableNodes)
{
  auto r = decode_node(TextOnlyNode{}, *Shape::atom(AtomKind::U8), DecodeOptions{true});
  ASSERT_FALSE(r);
  EXPECT_EQ(r.error().kind(), ts_decode::DecodeErrorKind::Custom);

  auto lenient = decode_node(TextOnlyNode{}, *Shape::atom(AtomKind::U8));
  ASSERT_TRUE(lenient);
  EXPECT_EQ(lenient->as_uint(), 1u);
}
