// End-to-end decoding of documents parsed by the tree-sitter JSON grammar.
#include <gtest/gtest.h>
#include <tree_sitter/api.h>

#include <string>

#include "ts_decode/basic/source_manager.hpp"
#include "ts_decode/debug/tree_dump.hpp"
#include "ts_decode/decode/decode.hpp"
#include "ts_decode/schema/schema_loader.hpp"
#include "ts_decode/syntax/ts_ll.hpp"
#include "ts_decode/syntax/ts_node.hpp"
#include "ts_decode/value/json_value.hpp"

extern "C" const TSLanguage * tree_sitter_json(void);

using ts_decode::decode_tree;
using ts_decode::decode_with_schema;
using ts_decode::DecodeErrorKind;
using ts_decode::DecodeOptions;
using ts_decode::dump_tree;
using ts_decode::parse_schema;
using ts_decode::Schema;
using ts_decode::SourceManager;
using ts_decode::StructuralError;
using ts_decode::TsNode;
using ts_decode::Value;
using ts_decode::VariantStyle;
namespace ts_ll = ts_decode::ts_ll;

namespace
{

constexpr const char * k_json_schema = R"(
options: { strict: true }
root: document
shapes:
  document: { wrapper: document, of: { seq: { ref: value } } }
  value:
    union:
      object: { newtype: { seq: { ref: pair } } }
      array: { newtype: { seq: { ref: value } } }
      number: { newtype: f64 }
      string: { newtype: string }
      true: unit
      false: unit
      null: unit
  pair:
    record: pair
    fields:
      key: { wrapper: string, of: string }
      value: { ref: value }
)";

class JsonGrammarTest : public ::testing::Test
{
protected:
  void SetUp() override
  {
    auto loaded = parse_schema(k_json_schema);
    ASSERT_TRUE(loaded.success) << loaded.error;
    schema_ = std::move(loaded.schema);
  }

  ts_ll::Tree parse(const SourceManager & sm) const
  {
    const ts_ll::Parser parser(tree_sitter_json());
    return ts_ll::Tree(parser.parse_string(sm.get_source()));
  }

  Schema schema_;
};

}  // namespace

TEST_F(JsonGrammarTest, DecodesObjectDocument)
{
  const SourceManager sm(R"({"a": [1, 2.5, true, null], "b": "x"})");
  const ts_ll::Tree tree = parse(sm);
  ASSERT_FALSE(tree.is_null());

  auto r = decode_with_schema(TsNode(tree.root_node(), sm), schema_);
  ASSERT_TRUE(r) << r.error().message() << "\n" << dump_tree(TsNode(tree.root_node(), sm));

  const auto & top = r->as_list();
  ASSERT_EQ(top.size(), 1u);
  const auto & object = top[0].as_variant();
  EXPECT_EQ(object.tag, "object");

  const auto & pairs = object.payload.as_list();
  ASSERT_EQ(pairs.size(), 2u);
  EXPECT_EQ(pairs[0].as_record().field("key")->as_text(), "\"a\"");
  EXPECT_EQ(pairs[1].as_record().field("key")->as_text(), "\"b\"");

  const auto & array = pairs[0].as_record().field("value")->as_variant();
  EXPECT_EQ(array.tag, "array");
  ASSERT_EQ(array.payload.as_list().size(), 4u);
  EXPECT_EQ(
    array.payload.as_list()[1], Value::variant("number", VariantStyle::Newtype, Value::floating(2.5)));
  EXPECT_EQ(array.payload.as_list()[3].as_variant().tag, "null");

  const auto json = ts_decode::to_json(*r);
  EXPECT_EQ(json[0]["$variant"], "object");
}

TEST_F(JsonGrammarTest, StrictSchemaRejectsSyntaxErrors)
{
  const SourceManager sm("[1, 2,, 3]");
  const ts_ll::Tree tree = parse(sm);
  ASSERT_FALSE(tree.is_null());

  auto r = decode_with_schema(TsNode(tree.root_node(), sm), schema_);
  ASSERT_FALSE(r);
  ASSERT_EQ(r.error().kind(), DecodeErrorKind::StructuralError);
  EXPECT_FALSE(r.error().get<StructuralError>().spans.empty());
}

TEST_F(JsonGrammarTest, DecodeTreeWithExplicitShape)
{
  const SourceManager sm("[true, false]");
  const ts_ll::Tree tree = parse(sm);

  auto r = decode_tree(tree, sm, *schema_.root_shape(), DecodeOptions{}, &schema_.shapes);
  ASSERT_TRUE(r) << r.error().message();
  const auto & items = r->as_list()[0].as_variant().payload.as_list();
  ASSERT_EQ(items.size(), 2u);
  EXPECT_EQ(items[0].as_variant().tag, "true");
  EXPECT_EQ(items[1].as_variant().tag, "false");
}

TEST_F(JsonGrammarTest, NumberOutsideUnionFailsWithNodeKind)
{
  const SourceManager sm("42");
  const ts_ll::Tree tree = parse(sm);

  auto r = decode_with_schema(TsNode(tree.root_node(), sm), schema_, "pair");
  ASSERT_FALSE(r);
  EXPECT_EQ(r.error().kind(), DecodeErrorKind::NodeKindMismatch);
}
