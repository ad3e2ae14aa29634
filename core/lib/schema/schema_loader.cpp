// ts_decode/schema/schema_loader.cpp - Declarative shape schemas (YAML)
#include "ts_decode/schema/schema_loader.hpp"

#include <fmt/core.h>
#include <yaml-cpp/yaml.h>

#include <optional>
#include <unordered_map>
#include <utility>
#include <vector>

namespace ts_decode
{

namespace
{

const std::unordered_map<std::string, AtomKind> & atom_names()
{
  static const std::unordered_map<std::string, AtomKind> names = {
    {"bool", AtomKind::Bool},       {"i8", AtomKind::I8},       {"i16", AtomKind::I16},
    {"i32", AtomKind::I32},         {"i64", AtomKind::I64},     {"u8", AtomKind::U8},
    {"u16", AtomKind::U16},         {"u32", AtomKind::U32},     {"u64", AtomKind::U64},
    {"f32", AtomKind::F32},         {"f64", AtomKind::F64},     {"str", AtomKind::Str},
    {"string", AtomKind::String},   {"bytes", AtomKind::Bytes}, {"unit", AtomKind::Unit},
    {"char", AtomKind::Char},       {"byte_buf", AtomKind::ByteBuf},
  };
  return names;
}

/// A `ref` seen while parsing, validated once every shape is known.
struct PendingRef
{
  std::string name;
  std::string path;
};

/// Recursive-descent reader for the shape grammar.
class ShapeReader
{
public:
  /// Returns nullptr and sets error_ on failure.
  ShapePtr read(const YAML::Node & node, const std::string & path)
  {
    if (node.IsScalar()) {
      return read_scalar(node.as<std::string>(), path);
    }
    if (node.IsMap()) {
      return read_map(node, path);
    }
    return fail(path, "expected a shape name or a map");
  }

  [[nodiscard]] const std::string & error() const noexcept { return error_; }
  [[nodiscard]] const std::vector<PendingRef> & refs() const noexcept { return refs_; }

private:
  ShapePtr fail(const std::string & path, const std::string & msg)
  {
    if (error_.empty()) {
      error_ = fmt::format("{}: {}", path, msg);
    }
    return nullptr;
  }

  ShapePtr read_scalar(const std::string & name, const std::string & path)
  {
    const auto & atoms = atom_names();
    if (auto it = atoms.find(name); it != atoms.end()) {
      return Shape::atom(it->second);
    }
    if (name == "identifier") return Shape::identifier();
    if (name == "map") return Shape::map();
    return fail(path, fmt::format("unknown shape `{}`", name));
  }

  static bool is_kind_key(const std::string & key)
  {
    return key == "option" || key == "seq" || key == "tuple" || key == "ref" ||
           key == "wrapper" || key == "record" || key == "unit_record" ||
           key == "tuple_record" || key == "union";
  }

  ShapePtr read_map(const YAML::Node & node, const std::string & path)
  {
    std::optional<std::string> kind;
    for (const auto & kv : node) {
      const auto key = kv.first.as<std::string>();
      if (is_kind_key(key)) {
        if (kind) {
          return fail(path, fmt::format("`{}` and `{}` cannot be combined", *kind, key));
        }
        kind = key;
      } else if (key != "of" && key != "fields") {
        return fail(path, fmt::format("unknown key `{}`", key));
      }
    }
    if (!kind) {
      return fail(path, "map does not name a shape kind");
    }
    // `of` and `fields` only qualify the kinds that read them.
    if (node["of"] && *kind != "wrapper" && *kind != "tuple_record") {
      return fail(path, "unknown key `of`");
    }
    if (node["fields"] && *kind != "record") {
      return fail(path, "unknown key `fields`");
    }

    const std::string sub = fmt::format("{}.{}", path, *kind);
    const YAML::Node value = node[*kind];

    if (*kind == "option" || *kind == "seq") {
      ShapePtr inner = read(value, sub);
      if (!inner) return nullptr;
      return *kind == "option" ? Shape::option(std::move(inner))
                               : Shape::sequence(std::move(inner));
    }
    if (*kind == "tuple") {
      auto elements = read_list(value, sub);
      if (!elements) return nullptr;
      return Shape::tuple(std::move(*elements));
    }
    if (*kind == "ref") {
      if (!value.IsScalar()) return fail(sub, "expected a shape name");
      refs_.push_back(PendingRef{value.as<std::string>(), sub});
      return Shape::ref(value.as<std::string>());
    }
    if (*kind == "union") {
      return read_union(value, sub);
    }

    // Named kinds
    if (!value.IsScalar()) return fail(sub, "expected a node type name");
    auto name = value.as<std::string>();

    if (*kind == "wrapper") {
      if (!node["of"]) return fail(path, "wrapper requires `of`");
      ShapePtr inner = read(node["of"], path + ".of");
      if (!inner) return nullptr;
      return Shape::wrapper(std::move(name), std::move(inner));
    }
    if (*kind == "record") {
      std::vector<FieldShape> fields;
      if (node["fields"]) {
        auto parsed = read_fields(node["fields"], path + ".fields");
        if (!parsed) return nullptr;
        fields = std::move(*parsed);
      }
      return Shape::record(std::move(name), std::move(fields));
    }
    if (*kind == "unit_record") {
      return Shape::unit_record(std::move(name));
    }
    // tuple_record
    if (!node["of"]) return fail(path, "tuple_record requires `of`");
    auto elements = read_list(node["of"], path + ".of");
    if (!elements) return nullptr;
    return Shape::tuple_record(std::move(name), std::move(*elements));
  }

  std::optional<std::vector<ShapePtr>> read_list(const YAML::Node & node, const std::string & path)
  {
    if (!node.IsSequence()) {
      fail(path, "expected a list of shapes");
      return std::nullopt;
    }
    std::vector<ShapePtr> out;
    for (size_t i = 0; i < node.size(); ++i) {
      ShapePtr s = read(node[i], fmt::format("{}[{}]", path, i));
      if (!s) return std::nullopt;
      out.push_back(std::move(s));
    }
    return out;
  }

  std::optional<std::vector<FieldShape>> read_fields(
    const YAML::Node & node, const std::string & path)
  {
    if (!node.IsMap()) {
      fail(path, "expected a map of field names to shapes");
      return std::nullopt;
    }
    std::vector<FieldShape> out;
    for (const auto & kv : node) {
      auto field_name = kv.first.as<std::string>();
      ShapePtr s = read(kv.second, fmt::format("{}.{}", path, field_name));
      if (!s) return std::nullopt;
      out.push_back(FieldShape{std::move(field_name), std::move(s)});
    }
    return out;
  }

  std::optional<VariantShape> read_variant(const YAML::Node & node, const std::string & path)
  {
    if (node.IsScalar() && node.as<std::string>() == "unit") {
      return VariantShape::unit();
    }
    if (!node.IsMap() || node.size() != 1) {
      fail(path, "expected `unit` or a map with one of `newtype`, `tuple`, `record`");
      return std::nullopt;
    }
    const auto key = node.begin()->first.as<std::string>();
    const YAML::Node value = node.begin()->second;
    const std::string sub = fmt::format("{}.{}", path, key);
    if (key == "newtype") {
      ShapePtr inner = read(value, sub);
      if (!inner) return std::nullopt;
      return VariantShape::newtype_of(std::move(inner));
    }
    if (key == "tuple") {
      auto elements = read_list(value, sub);
      if (!elements) return std::nullopt;
      return VariantShape::tuple_of(std::move(*elements));
    }
    if (key == "record") {
      auto fields = read_fields(value, sub);
      if (!fields) return std::nullopt;
      return VariantShape::record_of(std::move(*fields));
    }
    fail(path, fmt::format("unknown variant style `{}`", key));
    return std::nullopt;
  }

  ShapePtr read_union(const YAML::Node & node, const std::string & path)
  {
    if (!node.IsMap()) {
      return fail(path, "expected a map of variant names");
    }
    std::vector<std::pair<std::string, VariantShape>> variants;
    for (const auto & kv : node) {
      auto variant_name = kv.first.as<std::string>();
      auto variant = read_variant(kv.second, fmt::format("{}.{}", path, variant_name));
      if (!variant) return nullptr;
      variants.emplace_back(std::move(variant_name), std::move(*variant));
    }
    return Shape::union_of(variant_table(std::move(variants)));
  }

  std::string error_;
  std::vector<PendingRef> refs_;
};

SchemaLoadResult build_schema(const YAML::Node & root)
{
  if (!root.IsMap()) {
    return SchemaLoadResult::fail("schema must be a map");
  }

  Schema schema;

  // Parse 'options' section
  if (root["options"]) {
    const auto & options = root["options"];
    if (!options.IsMap()) {
      return SchemaLoadResult::fail("options must be a map");
    }
    if (options["strict"]) {
      schema.options.strict = options["strict"].as<bool>();
    }
  }

  if (root["root"]) {
    schema.root = root["root"].as<std::string>();
  }

  // Parse 'shapes' section
  if (!root["shapes"] || !root["shapes"].IsMap()) {
    return SchemaLoadResult::fail("shapes must be a map");
  }
  ShapeReader reader;
  for (const auto & kv : root["shapes"]) {
    auto name = kv.first.as<std::string>();
    const std::string path = "shapes." + name;
    ShapePtr shape = reader.read(kv.second, path);
    if (!shape) {
      return SchemaLoadResult::fail(reader.error());
    }
    if (!schema.shapes.define(name, std::move(shape))) {
      return SchemaLoadResult::fail(path + ": duplicate shape name");
    }
  }

  for (const auto & ref : reader.refs()) {
    if (!schema.shapes.contains(ref.name)) {
      return SchemaLoadResult::fail(
        fmt::format("{}: unknown shape reference `{}`", ref.path, ref.name));
    }
  }
  if (!schema.root.empty() && !schema.shapes.contains(schema.root)) {
    return SchemaLoadResult::fail(fmt::format("root: unknown shape `{}`", schema.root));
  }

  return SchemaLoadResult::ok(std::move(schema));
}

}  // namespace

ShapePtr Schema::root_shape() const
{
  if (root.empty()) return nullptr;
  return shapes.find_ptr(root);
}

SchemaLoadResult load_schema(const std::filesystem::path & schema_path)
{
  if (!std::filesystem::exists(schema_path)) {
    return SchemaLoadResult::fail("schema file not found: " + schema_path.string());
  }

  YAML::Node root;
  try {
    root = YAML::LoadFile(schema_path.string());
    return build_schema(root);
  } catch (const YAML::Exception & e) {
    return SchemaLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }
}

SchemaLoadResult parse_schema(std::string_view yaml_text)
{
  try {
    return build_schema(YAML::Load(std::string(yaml_text)));
  } catch (const YAML::Exception & e) {
    return SchemaLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }
}

}  // namespace ts_decode
