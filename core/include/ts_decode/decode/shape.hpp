// ts_decode/decode/shape.hpp - Shape descriptors: what a node must decode into
//
// Shapes are immutable and shared. They are typically built once per target
// type (by hand, by the typed layer, or from a YAML schema) and reused across
// decode calls.
//
#pragma once

#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include "ts_decode/decode/result.hpp"
#include "ts_decode/decode/shape_kinds.hpp"

namespace ts_decode
{

class Shape;
using ShapePtr = std::shared_ptr<const Shape>;

/// A named field of a record, resolved through the children tagged with `name`.
struct FieldShape
{
  std::string name;
  ShapePtr shape;
};

/// The payload shape of one union variant.
struct VariantShape
{
  VariantStyle style = VariantStyle::Unit;
  ShapePtr newtype;                 // Newtype
  std::vector<ShapePtr> elements;   // Tuple
  std::vector<FieldShape> fields;   // Record

  [[nodiscard]] static VariantShape unit() { return {}; }
  [[nodiscard]] static VariantShape newtype_of(ShapePtr inner);
  [[nodiscard]] static VariantShape tuple_of(std::vector<ShapePtr> elements);
  [[nodiscard]] static VariantShape record_of(std::vector<FieldShape> fields);
};

/// Maps a node's type tag to the variant it selects.
using VariantResolver = std::function<DecodeResult<VariantShape>(std::string_view tag)>;

class Shape
{
public:
  [[nodiscard]] static ShapePtr atom(AtomKind kind);
  [[nodiscard]] static ShapePtr option(ShapePtr inner);
  [[nodiscard]] static ShapePtr tuple(std::vector<ShapePtr> elements);
  [[nodiscard]] static ShapePtr sequence(ShapePtr inner);
  [[nodiscard]] static ShapePtr wrapper(std::string name, ShapePtr inner);
  [[nodiscard]] static ShapePtr record(std::string name, std::vector<FieldShape> fields);
  [[nodiscard]] static ShapePtr unit_record(std::string name);
  [[nodiscard]] static ShapePtr tuple_record(std::string name, std::vector<ShapePtr> elements);
  [[nodiscard]] static ShapePtr union_of(VariantResolver resolver, std::string name = {});
  [[nodiscard]] static ShapePtr identifier();
  [[nodiscard]] static ShapePtr map();
  [[nodiscard]] static ShapePtr ref(std::string name);

  [[nodiscard]] ShapeKind kind() const noexcept { return kind_; }
  [[nodiscard]] AtomKind atom_kind() const noexcept { return atom_; }

  /// Record/wrapper name, union name, or ref target.
  [[nodiscard]] const std::string & name() const noexcept { return name_; }

  /// Inner shape of Option, Sequence and NamedWrapper.
  [[nodiscard]] const Shape & inner() const noexcept { return *elements_.front(); }

  /// Positional shapes of Tuple and TupleRecord.
  [[nodiscard]] const std::vector<ShapePtr> & elements() const noexcept { return elements_; }

  [[nodiscard]] const std::vector<FieldShape> & fields() const noexcept { return fields_; }
  [[nodiscard]] const VariantResolver & resolver() const noexcept { return resolver_; }

  /// Short description used in error messages, e.g. "option<u32>".
  [[nodiscard]] std::string describe() const;

private:
  explicit Shape(ShapeKind kind) : kind_(kind) {}

  ShapeKind kind_;
  AtomKind atom_ = AtomKind::Unit;
  std::string name_;
  std::vector<ShapePtr> elements_;
  std::vector<FieldShape> fields_;
  VariantResolver resolver_;
};

/**
 * Named shapes, used to resolve Ref shapes. This is what makes recursive
 * descriptors expressible.
 */
class ShapeRegistry
{
public:
  /// Returns false if `name` was already defined (the first definition wins).
  bool define(std::string name, ShapePtr shape);

  [[nodiscard]] const Shape * find(std::string_view name) const;
  [[nodiscard]] ShapePtr find_ptr(std::string_view name) const;
  [[nodiscard]] bool contains(std::string_view name) const
  {
    return find(name) != nullptr;
  }
  [[nodiscard]] size_t size() const noexcept { return shapes_.size(); }

  /// Names in definition order.
  [[nodiscard]] const std::vector<std::string> & names() const noexcept { return order_; }

private:
  std::unordered_map<std::string, ShapePtr> shapes_;
  std::vector<std::string> order_;
};

/**
 * Build a resolver from a declared variant list.
 *
 * Unknown tags fail with a Custom error naming the accepted variants.
 */
[[nodiscard]] VariantResolver variant_table(
  std::vector<std::pair<std::string, VariantShape>> variants);

}  // namespace ts_decode
