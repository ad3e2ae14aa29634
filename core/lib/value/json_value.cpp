// ts_decode/value/json_value.cpp - JSON rendering of decoded values
#include "ts_decode/value/json_value.hpp"

#include <cmath>
#include <string>
#include <utility>

namespace ts_decode
{
namespace
{

using nlohmann::json;

json j_float(double d)
{
  // JSON has no representation for NaN or infinities.
  if (!std::isfinite(d)) return nullptr;
  return d;
}

json j_bytes(const Bytes & b)
{
  json out = json::array();
  for (std::byte byte : b.data) {
    out.push_back(std::to_integer<unsigned>(byte));
  }
  return out;
}

json j_record(const RecordValue & r)
{
  json fields = json::object();
  for (const auto & [name, value] : r.fields) {
    fields[name] = to_json(value);
  }
  return json{{"$type", r.name}, {"fields", std::move(fields)}};
}

}  // namespace

json to_json(const Value & value)
{
  switch (value.kind()) {
    case ValueKind::Unit:
      return nullptr;
    case ValueKind::Bool:
      return value.as_bool();
    case ValueKind::Int:
      return value.as_int();
    case ValueKind::UInt:
      return value.as_uint();
    case ValueKind::Float:
      return j_float(value.as_float());
    case ValueKind::BorrowedText:
    case ValueKind::OwnedText:
      return std::string(value.as_text());
    case ValueKind::Bytes:
      return j_bytes(value.as_bytes());
    case ValueKind::Optional: {
      const Value * inner = value.as_optional();
      return inner ? to_json(*inner) : json(nullptr);
    }
    case ValueKind::List: {
      json out = json::array();
      for (const auto & element : value.as_list()) {
        out.push_back(to_json(element));
      }
      return out;
    }
    case ValueKind::Record:
      return j_record(value.as_record());
    case ValueKind::Variant: {
      const auto & v = value.as_variant();
      return json{{"$variant", v.tag}, {"value", to_json(v.payload)}};
    }
  }
  return nullptr;
}

}  // namespace ts_decode
