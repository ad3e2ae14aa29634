#include <gtest/gtest.h>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <vector>

#include "ts_decode/test_support/fake_node.hpp"
#include "ts_decode/typed.hpp"

using ts_decode::decode_as;
using ts_decode::Decodable;
using ts_decode::DecodeError;
using ts_decode::DecodeErrorKind;
using ts_decode::DecodeResult;
using ts_decode::field_as;
using ts_decode::Shape;
using ts_decode::ShapePtr;
using ts_decode::Value;
using ts_decode::test_support::FakeTree;
using ts_decode::test_support::leaf;
using ts_decode::test_support::tree;

namespace
{

struct Setting
{
  std::string key;
  std::optional<int32_t> value;
  std::vector<std::string_view> tags;
};

}  // namespace

template <>
struct ts_decode::Decodable<Setting>
{
  static ShapePtr shape()
  {
    return Shape::record(
      "setting", {{"key", Decodable<std::string>::shape()},
                  {"value", Decodable<std::optional<int32_t>>::shape()},
                  {"tag", Decodable<std::vector<std::string_view>>::shape()}});
  }

  static DecodeResult<Setting> from_value(const Value & v)
  {
    auto key = field_as<std::string>(v, "key");
    if (!key) return std::move(key).error();
    auto value = field_as<std::optional<int32_t>>(v, "value");
    if (!value) return std::move(value).error();
    auto tags = field_as<std::vector<std::string_view>>(v, "tag");
    if (!tags) return std::move(tags).error();
    return Setting{std::move(*key), *value, std::move(*tags)};
  }
};

TEST(TypedDecode, Primitives)
{
  FakeTree n(leaf("number", "-42"));
  auto i = decode_as<int16_t>(n.root());
  ASSERT_TRUE(i);
  EXPECT_EQ(*i, -42);

  auto u = decode_as<uint8_t>(n.root());
  ASSERT_FALSE(u);
  EXPECT_EQ(u.error().kind(), DecodeErrorKind::NumberParseError);

  FakeTree f(leaf("number", "0.25"));
  auto d = decode_as<float>(f.root());
  ASSERT_TRUE(d);
  EXPECT_FLOAT_EQ(*d, 0.25f);

  FakeTree b(leaf("bool", "true"));
  auto flag = decode_as<bool>(b.root());
  ASSERT_TRUE(flag);
  EXPECT_TRUE(*flag);

  auto s = decode_as<std::string>(b.root());
  ASSERT_TRUE(s);
  EXPECT_EQ(*s, "true");
}

TEST(TypedDecode, Containers)
{
  FakeTree t(tree("list").child(leaf("n", "1")).child(leaf("n", "2")));

  auto v = decode_as<std::vector<uint64_t>>(t.root());
  ASSERT_TRUE(v);
  EXPECT_EQ(*v, (std::vector<uint64_t>{1, 2}));

  auto tup = decode_as<std::tuple<int32_t, std::string>>(t.root());
  ASSERT_TRUE(tup);
  EXPECT_EQ(std::get<0>(*tup), 1);
  EXPECT_EQ(std::get<1>(*tup), "2");

  auto opt = decode_as<std::optional<int32_t>>(t.root());
  ASSERT_FALSE(opt);
  EXPECT_EQ(opt.error(), DecodeError::arity(1, 2));
}

TEST(TypedDecode, UserRecord)
{
  FakeTree t(tree("setting")
               .field("key", leaf("name", "timeout"))
               .field("value", leaf("number", "30"))
               .field("tag", leaf("word", "net"))
               .field("tag", leaf("word", "slow")));

  auto r = decode_as<Setting>(t.root());
  ASSERT_TRUE(r) << r.error().message();
  EXPECT_EQ(r->key, "timeout");
  EXPECT_EQ(r->value, 30);
  EXPECT_EQ(r->tags, (std::vector<std::string_view>{"net", "slow"}));

  FakeTree bare(tree("setting").field("key", leaf("name", "retries")));
  auto r2 = decode_as<Setting>(bare.root());
  ASSERT_TRUE(r2);
  EXPECT_FALSE(r2->value.has_value());
  EXPECT_TRUE(r2->tags.empty());
}

TEST(TypedDecode, FromValueChecksValueKind)
{
  auto wrong = Decodable<bool>::from_value(Value::integer(1));
  ASSERT_FALSE(wrong);
  EXPECT_EQ(wrong.error(), DecodeError::custom("expected bool value, found integer"));

  auto missing = field_as<int32_t>(Value::record("r", {}), "x");
  ASSERT_FALSE(missing);
  EXPECT_EQ(missing.error(), DecodeError::custom("record `r` has no field `x`"));
}
