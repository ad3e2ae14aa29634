#include <gtest/gtest.h>

#include <string>

#include "ts_decode/debug/tree_dump.hpp"
#include "ts_decode/test_support/fake_node.hpp"

using ts_decode::dump_tree;
using ts_decode::test_support::FakeTree;
using ts_decode::test_support::leaf;
using ts_decode::test_support::tree;

TEST(TreeDump, OutlinesNamedChildrenWithFields)
{
  FakeTree t(tree("object", "{\"a\": 1}")
               .anonymous("{")
               .child(tree("pair")
                        .field("key", leaf("string", "\"a\""))
                        .anonymous(":")
                        .field("value", leaf("number", "1")))
               .anonymous("}"));

  const std::string expected =
    "- object\n"
    "  - pair\n"
    "    - key: string \"\"a\"\"\n"
    "    - value: number \"1\"\n";
  EXPECT_EQ(dump_tree(t.root()), expected);
}

TEST(TreeDump, SingleLeaf)
{
  FakeTree t(leaf("number", "42"));
  EXPECT_EQ(dump_tree(t.root()), "- number \"42\"\n");
}
