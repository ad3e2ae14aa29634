// ts_decode/value/value.cpp - Decoded value model
#include "ts_decode/value/value.hpp"

#include <algorithm>

namespace ts_decode
{

std::string_view to_string(ValueKind kind) noexcept
{
  switch (kind) {
    case ValueKind::Unit:
      return "unit";
    case ValueKind::Bool:
      return "bool";
    case ValueKind::Int:
      return "integer";
    case ValueKind::UInt:
      return "unsigned integer";
    case ValueKind::Float:
      return "float";
    case ValueKind::BorrowedText:
    case ValueKind::OwnedText:
      return "text";
    case ValueKind::Bytes:
      return "bytes";
    case ValueKind::Optional:
      return "optional";
    case ValueKind::List:
      return "list";
    case ValueKind::Record:
      return "record";
    case ValueKind::Variant:
      return "variant";
  }
  return "unknown";
}

bool operator==(const Bytes & a, const Bytes & b)
{
  return std::equal(a.data.begin(), a.data.end(), b.data.begin(), b.data.end());
}

bool operator==(const Value & a, const Value & b) { return a.data_ == b.data_; }

Value Value::boolean(bool b) { return Value(std::in_place_type<bool>, b); }

Value Value::integer(int64_t i) { return Value(std::in_place_type<int64_t>, i); }

Value Value::unsigned_integer(uint64_t u) { return Value(std::in_place_type<uint64_t>, u); }

Value Value::floating(double d) { return Value(std::in_place_type<double>, d); }

Value Value::borrowed(std::string_view text)
{
  return Value(std::in_place_type<std::string_view>, text);
}

Value Value::owned(std::string text)
{
  return Value(std::in_place_type<std::string>, std::move(text));
}

Value Value::bytes(Bytes b) { return Value(std::in_place_type<Bytes>, b); }

Value Value::none() { return Value(std::in_place_type<Box<OptionalValue>>, OptionalValue{}); }

Value Value::some(Value inner)
{
  return Value(std::in_place_type<Box<OptionalValue>>, OptionalValue{std::move(inner)});
}

Value Value::list(std::vector<Value> elements)
{
  return Value(std::in_place_type<Box<ListValue>>, ListValue{std::move(elements)});
}

Value Value::record(std::string name, std::vector<std::pair<std::string, Value>> fields)
{
  return Value(
    std::in_place_type<Box<RecordValue>>, RecordValue{std::move(name), std::move(fields)});
}

Value Value::variant(std::string tag, VariantStyle style, Value payload)
{
  return Value(
    std::in_place_type<Box<VariantValue>>,
    VariantValue{std::move(tag), style, std::move(payload)});
}

bool Value::is_none() const noexcept
{
  const auto * opt = std::get_if<Box<OptionalValue>>(&data_);
  return opt != nullptr && !(*opt)->inner.has_value();
}

std::string_view Value::as_text() const
{
  if (const auto * owned = std::get_if<std::string>(&data_)) {
    return *owned;
  }
  return std::get<std::string_view>(data_);
}

const Value * Value::as_optional() const
{
  const auto & opt = std::get<Box<OptionalValue>>(data_);
  return opt->inner ? &*opt->inner : nullptr;
}

const std::vector<Value> & Value::as_list() const
{
  return std::get<Box<ListValue>>(data_)->elements;
}

const RecordValue & Value::as_record() const { return *std::get<Box<RecordValue>>(data_); }

const VariantValue & Value::as_variant() const { return *std::get<Box<VariantValue>>(data_); }

const Value * RecordValue::field(std::string_view field_name) const noexcept
{
  for (const auto & [name, value] : fields) {
    if (name == field_name) return &value;
  }
  return nullptr;
}

}  // namespace ts_decode
