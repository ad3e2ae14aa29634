#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <nlohmann/json.hpp>
#include <string>

#include "ts_decode/decode/atom.hpp"
#include "ts_decode/value/json_value.hpp"
#include "ts_decode/value/value.hpp"

using nlohmann::json;
using ts_decode::AtomKind;
using ts_decode::decode_atom_text;
using ts_decode::to_json;
using ts_decode::Value;
using ts_decode::VariantStyle;

TEST(JsonValue, Scalars)
{
  EXPECT_EQ(to_json(Value::unit()), json(nullptr));
  EXPECT_EQ(to_json(Value::boolean(true)), json(true));
  EXPECT_EQ(to_json(Value::integer(-3)), json(-3));
  EXPECT_EQ(to_json(Value::unsigned_integer(18446744073709551615ull)), json(18446744073709551615ull));
  EXPECT_EQ(to_json(Value::floating(0.5)), json(0.5));
  EXPECT_EQ(to_json(Value::borrowed("abc")), json("abc"));
  EXPECT_EQ(to_json(Value::owned("def")), json("def"));
}

TEST(JsonValue, NonFiniteFloatsBecomeNull)
{
  EXPECT_TRUE(to_json(Value::floating(std::numeric_limits<double>::infinity())).is_null());
  EXPECT_TRUE(to_json(Value::floating(std::nan(""))).is_null());
}

TEST(JsonValue, BytesBecomeNumberArray)
{
  const std::string text = "AB";
  auto r = decode_atom_text(text, AtomKind::Bytes);
  ASSERT_TRUE(r);
  EXPECT_EQ(to_json(*r), json::array({65, 66}));
}

TEST(JsonValue, OptionsCollapse)
{
  EXPECT_TRUE(to_json(Value::none()).is_null());
  EXPECT_EQ(to_json(Value::some(Value::integer(1))), json(1));
}

TEST(JsonValue, ListsRecordsVariants)
{
  const Value v = Value::record(
    "pair", {{"key", Value::owned("a")},
             {"items", Value::list({Value::integer(1), Value::integer(2)})},
             {"kind", Value::variant("number", VariantStyle::Newtype, Value::floating(2.0))},
             {"flag", Value::variant("none", VariantStyle::Unit, Value::unit())}});

  const json expected = json::parse(R"({
    "$type": "pair",
    "fields": {
      "key": "a",
      "items": [1, 2],
      "kind": {"$variant": "number", "value": 2.0},
      "flag": {"$variant": "none", "value": null}
    }
  })");
  EXPECT_EQ(to_json(v), expected);
}

TEST(JsonValue, RecordFieldNamedLikeTagKeepsRecordName)
{
  const Value v = Value::record("node", {{"$type", Value::owned("field")}});
  const json out = to_json(v);
  EXPECT_EQ(out["$type"], "node");
  EXPECT_EQ(out["fields"]["$type"], "field");
}
