// ts_decode/value/json_value.hpp - JSON rendering of decoded values
//
// Records become {"$type": name, "fields": {...}} and union variants become
// {"$variant": tag, "value": payload}. Options collapse to null or their
// inner value; bytes become arrays of numbers.
//
#pragma once

#include <nlohmann/json.hpp>

#include "ts_decode/value/value.hpp"

namespace ts_decode
{

[[nodiscard]] nlohmann::json to_json(const Value & value);

}  // namespace ts_decode
