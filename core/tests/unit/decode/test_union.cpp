#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "ts_decode/decode/decode.hpp"
#include "ts_decode/test_support/fake_node.hpp"

using ts_decode::AtomKind;
using ts_decode::decode_node;
using ts_decode::DecodeError;
using ts_decode::DecodeResult;
using ts_decode::Shape;
using ts_decode::ShapePtr;
using ts_decode::Value;
using ts_decode::variant_table;
using ts_decode::VariantShape;
using ts_decode::VariantStyle;
using ts_decode::test_support::FakeTree;
using ts_decode::test_support::leaf;
using ts_decode::test_support::tree;

namespace
{

ShapePtr expr_union()
{
  return Shape::union_of(variant_table({
    {"unit_variant", VariantShape::unit()},
    {"newtype_variant", VariantShape::newtype_of(Shape::atom(AtomKind::U32))},
    {"tuple_variant",
     VariantShape::tuple_of({Shape::atom(AtomKind::String), Shape::atom(AtomKind::I32)})},
    {"record_variant", VariantShape::record_of({{"name", Shape::atom(AtomKind::Str)}})},
  }));
}

}  // namespace

TEST(DecodeUnion, UnitVariantIgnoresChildren)
{
  FakeTree t(tree("unit_variant").child(leaf("n", "junk")));
  auto r = decode_node(t.root(), *expr_union());
  ASSERT_TRUE(r);
  EXPECT_EQ(*r, Value::variant("unit_variant", VariantStyle::Unit, Value::unit()));
}

TEST(DecodeUnion, NewtypeVariantDecodesTheSameNode)
{
  FakeTree t(tree("newtype_variant", "77"));
  auto r = decode_node(t.root(), *expr_union());
  ASSERT_TRUE(r);
  EXPECT_EQ(
    *r, Value::variant("newtype_variant", VariantStyle::Newtype, Value::unsigned_integer(77)));
}

TEST(DecodeUnion, TupleVariant)
{
  FakeTree t(tree("tuple_variant").child(leaf("string", "foo")).child(leaf("number", "333")));
  auto r = decode_node(t.root(), *expr_union());
  ASSERT_TRUE(r) << r.error().message();
  const auto & v = r->as_variant();
  EXPECT_EQ(v.tag, "tuple_variant");
  EXPECT_EQ(v.style, VariantStyle::Tuple);
  EXPECT_EQ(v.payload, Value::list({Value::owned("foo"), Value::integer(333)}));
}

TEST(DecodeUnion, TupleVariantArityMismatch)
{
  FakeTree t(tree("tuple_variant").child(leaf("string", "foo")));
  auto r = decode_node(t.root(), *expr_union());
  ASSERT_FALSE(r);
  EXPECT_EQ(r.error(), DecodeError::arity(2, 1));
}

TEST(DecodeUnion, RecordVariantUsesTagAsRecordName)
{
  FakeTree t(tree("record_variant").field("name", leaf("identifier", "x")));
  auto r = decode_node(t.root(), *expr_union());
  ASSERT_TRUE(r);
  EXPECT_EQ(
    *r, Value::variant(
          "record_variant", VariantStyle::Record,
          Value::record("record_variant", {{"name", Value::borrowed("x")}})));
}

TEST(DecodeUnion, UnknownTagIsRejectedByResolver)
{
  FakeTree t(tree("mystery"));
  auto r = decode_node(t.root(), *expr_union());
  ASSERT_FALSE(r);
  EXPECT_EQ(
    r.error(), DecodeError::custom("unknown variant `mystery`, expected one of `unit_variant`, "
                                   "`newtype_variant`, `tuple_variant`, `record_variant`"));
}

TEST(DecodeUnion, VariantTableMessagesForSmallTables)
{
  auto single = variant_table({{"only", VariantShape::unit()}});
  auto r1 = single("other");
  ASSERT_FALSE(r1);
  EXPECT_EQ(r1.error(), DecodeError::custom("unknown variant `other`, expected `only`"));

  auto empty = variant_table({});
  auto r0 = empty("other");
  ASSERT_FALSE(r0);
  EXPECT_EQ(r0.error(), DecodeError::custom("unknown variant `other`, there are no variants"));
}

TEST(DecodeUnion, OpenResolverAcceptsAnyTag)
{
  std::vector<std::string> seen;
  const auto shape = Shape::union_of([&seen](std::string_view tag) -> DecodeResult<VariantShape> {
    seen.emplace_back(tag);
    return VariantShape::newtype_of(Shape::atom(AtomKind::Str));
  });

  FakeTree t(tree("whatever_kind", "payload"));
  auto r = decode_node(t.root(), *shape);
  ASSERT_TRUE(r);
  EXPECT_EQ(r->as_variant().tag, "whatever_kind");
  EXPECT_EQ(r->as_variant().payload.as_text(), "payload");
  EXPECT_EQ(seen, std::vector<std::string>{"whatever_kind"});
}

TEST(DecodeUnion, UnionInsideSequence)
{
  const auto shape = Shape::sequence(expr_union());
  FakeTree t(tree("list").child(tree("unit_variant")).child(tree("newtype_variant", "5")));

  auto r = decode_node(t.root(), *shape);
  ASSERT_TRUE(r);
  ASSERT_EQ(r->as_list().size(), 2u);
  EXPECT_EQ(r->as_list()[1].as_variant().payload, Value::unsigned_integer(5));
}
