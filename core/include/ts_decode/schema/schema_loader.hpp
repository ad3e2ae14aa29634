// ts_decode/schema/schema_loader.hpp - Declarative shape schemas (YAML)
//
// A schema names a set of shapes that may refer to each other through
// `ref`, an optional root shape, and decode options:
//
//   options:
//     strict: true
//   root: document
//   shapes:
//     document: { wrapper: document, of: { seq: { ref: value } } }
//     value:
//       union:
//         number: { newtype: f64 }
//         null: unit
//
#pragma once

#include <fmt/core.h>

#include <filesystem>
#include <string>
#include <string_view>

#include "ts_decode/decode/decode.hpp"
#include "ts_decode/decode/shape.hpp"

namespace ts_decode
{

// ============================================================================
// Schema
// ============================================================================

struct SchemaOptions
{
  /// Refuse trees with parser errors (DecodeOptions::check_errors)
  bool strict = false;
};

struct Schema
{
  SchemaOptions options;

  /// Name of the default shape, empty if the schema declares none
  std::string root;

  ShapeRegistry shapes;

  /// Shape named by `root`, nullptr if there is none.
  [[nodiscard]] ShapePtr root_shape() const;

  [[nodiscard]] DecodeOptions decode_options() const { return DecodeOptions{options.strict}; }
};

// ============================================================================
// Loading
// ============================================================================

/**
 * Result of loading a schema.
 */
struct SchemaLoadResult
{
  /// Loaded schema (only valid if success == true)
  Schema schema;

  bool success = false;

  /// Error message, prefixed with the path of the offending entry
  std::string error;

  static SchemaLoadResult ok(Schema s)
  {
    SchemaLoadResult r;
    r.schema = std::move(s);
    r.success = true;
    return r;
  }

  static SchemaLoadResult fail(std::string msg)
  {
    SchemaLoadResult r;
    r.error = std::move(msg);
    r.success = false;
    return r;
  }
};

[[nodiscard]] SchemaLoadResult load_schema(const std::filesystem::path & schema_path);

[[nodiscard]] SchemaLoadResult parse_schema(std::string_view yaml_text);

// ============================================================================
// Decoding
// ============================================================================

/// Decode `node` against the schema's root shape with the schema's options.
template <typename N>
[[nodiscard]] DecodeResult<Value> decode_with_schema(const N & node, const Schema & schema)
{
  const ShapePtr root = schema.root_shape();
  if (!root) {
    return DecodeError::custom("schema declares no root shape");
  }
  return decode_node(node, *root, schema.decode_options(), &schema.shapes);
}

/// Decode `node` against the named shape of the schema.
template <typename N>
[[nodiscard]] DecodeResult<Value> decode_with_schema(
  const N & node, const Schema & schema, std::string_view shape_name)
{
  const Shape * shape = schema.shapes.find(shape_name);
  if (!shape) {
    return DecodeError::custom(fmt::format("unknown shape reference `{}`", shape_name));
  }
  return decode_node(node, *shape, schema.decode_options(), &schema.shapes);
}

}  // namespace ts_decode
