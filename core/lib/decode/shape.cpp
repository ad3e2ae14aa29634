// ts_decode/decode/shape.cpp - Shape descriptor construction
#include "ts_decode/decode/shape.hpp"

#include <fmt/core.h>

#include <algorithm>

namespace ts_decode
{

std::string_view to_string(AtomKind kind) noexcept
{
  switch (kind) {
    case AtomKind::Bool:
      return "bool";
    case AtomKind::I8:
      return "i8";
    case AtomKind::I16:
      return "i16";
    case AtomKind::I32:
      return "i32";
    case AtomKind::I64:
      return "i64";
    case AtomKind::U8:
      return "u8";
    case AtomKind::U16:
      return "u16";
    case AtomKind::U32:
      return "u32";
    case AtomKind::U64:
      return "u64";
    case AtomKind::F32:
      return "f32";
    case AtomKind::F64:
      return "f64";
    case AtomKind::Str:
      return "str";
    case AtomKind::String:
      return "string";
    case AtomKind::Bytes:
      return "bytes";
    case AtomKind::Unit:
      return "unit";
    case AtomKind::Char:
      return "char";
    case AtomKind::ByteBuf:
      return "byte_buf";
  }
  return "unknown";
}

std::string_view to_string(ShapeKind kind) noexcept
{
  switch (kind) {
    case ShapeKind::Atom:
      return "atom";
    case ShapeKind::Option:
      return "option";
    case ShapeKind::Tuple:
      return "tuple";
    case ShapeKind::Sequence:
      return "seq";
    case ShapeKind::NamedWrapper:
      return "wrapper";
    case ShapeKind::Record:
      return "record";
    case ShapeKind::UnitRecord:
      return "unit_record";
    case ShapeKind::TupleRecord:
      return "tuple_record";
    case ShapeKind::Union:
      return "union";
    case ShapeKind::Identifier:
      return "identifier";
    case ShapeKind::Map:
      return "map";
    case ShapeKind::Ref:
      return "ref";
  }
  return "unknown";
}

std::string_view to_string(VariantStyle style) noexcept
{
  switch (style) {
    case VariantStyle::Unit:
      return "unit";
    case VariantStyle::Newtype:
      return "newtype";
    case VariantStyle::Tuple:
      return "tuple";
    case VariantStyle::Record:
      return "record";
  }
  return "unknown";
}

// ============================================================================
// VariantShape
// ============================================================================

VariantShape VariantShape::newtype_of(ShapePtr inner)
{
  VariantShape v;
  v.style = VariantStyle::Newtype;
  v.newtype = std::move(inner);
  return v;
}

VariantShape VariantShape::tuple_of(std::vector<ShapePtr> elements)
{
  VariantShape v;
  v.style = VariantStyle::Tuple;
  v.elements = std::move(elements);
  return v;
}

VariantShape VariantShape::record_of(std::vector<FieldShape> fields)
{
  VariantShape v;
  v.style = VariantStyle::Record;
  v.fields = std::move(fields);
  return v;
}

// ============================================================================
// Shape factories
// ============================================================================

ShapePtr Shape::atom(AtomKind kind)
{
  auto s = std::shared_ptr<Shape>(new Shape(ShapeKind::Atom));
  s->atom_ = kind;
  return s;
}

ShapePtr Shape::option(ShapePtr inner)
{
  auto s = std::shared_ptr<Shape>(new Shape(ShapeKind::Option));
  s->elements_.push_back(std::move(inner));
  return s;
}

ShapePtr Shape::tuple(std::vector<ShapePtr> elements)
{
  auto s = std::shared_ptr<Shape>(new Shape(ShapeKind::Tuple));
  s->elements_ = std::move(elements);
  return s;
}

ShapePtr Shape::sequence(ShapePtr inner)
{
  auto s = std::shared_ptr<Shape>(new Shape(ShapeKind::Sequence));
  s->elements_.push_back(std::move(inner));
  return s;
}

ShapePtr Shape::wrapper(std::string name, ShapePtr inner)
{
  auto s = std::shared_ptr<Shape>(new Shape(ShapeKind::NamedWrapper));
  s->name_ = std::move(name);
  s->elements_.push_back(std::move(inner));
  return s;
}

ShapePtr Shape::record(std::string name, std::vector<FieldShape> fields)
{
  auto s = std::shared_ptr<Shape>(new Shape(ShapeKind::Record));
  s->name_ = std::move(name);
  s->fields_ = std::move(fields);
  return s;
}

ShapePtr Shape::unit_record(std::string name)
{
  auto s = std::shared_ptr<Shape>(new Shape(ShapeKind::UnitRecord));
  s->name_ = std::move(name);
  return s;
}

ShapePtr Shape::tuple_record(std::string name, std::vector<ShapePtr> elements)
{
  auto s = std::shared_ptr<Shape>(new Shape(ShapeKind::TupleRecord));
  s->name_ = std::move(name);
  s->elements_ = std::move(elements);
  return s;
}

ShapePtr Shape::union_of(VariantResolver resolver, std::string name)
{
  auto s = std::shared_ptr<Shape>(new Shape(ShapeKind::Union));
  s->name_ = std::move(name);
  s->resolver_ = std::move(resolver);
  return s;
}

ShapePtr Shape::identifier() { return std::shared_ptr<Shape>(new Shape(ShapeKind::Identifier)); }

ShapePtr Shape::map() { return std::shared_ptr<Shape>(new Shape(ShapeKind::Map)); }

ShapePtr Shape::ref(std::string name)
{
  auto s = std::shared_ptr<Shape>(new Shape(ShapeKind::Ref));
  s->name_ = std::move(name);
  return s;
}

std::string Shape::describe() const
{
  switch (kind_) {
    case ShapeKind::Atom:
      return std::string(to_string(atom_));
    case ShapeKind::Option:
      return fmt::format("option<{}>", inner().describe());
    case ShapeKind::Sequence:
      return fmt::format("seq<{}>", inner().describe());
    case ShapeKind::Tuple: {
      std::string out = "(";
      for (size_t i = 0; i < elements_.size(); ++i) {
        if (i > 0) out += ", ";
        out += elements_[i]->describe();
      }
      return out + ")";
    }
    case ShapeKind::NamedWrapper:
      return fmt::format("wrapper `{}`", name_);
    case ShapeKind::Record:
      return fmt::format("record `{}`", name_);
    case ShapeKind::UnitRecord:
      return fmt::format("unit record `{}`", name_);
    case ShapeKind::TupleRecord:
      return fmt::format("tuple record `{}`", name_);
    case ShapeKind::Union:
      return name_.empty() ? std::string("union") : fmt::format("union `{}`", name_);
    case ShapeKind::Identifier:
      return "identifier";
    case ShapeKind::Map:
      return "map";
    case ShapeKind::Ref:
      return fmt::format("ref `{}`", name_);
  }
  return "unknown";
}

// ============================================================================
// ShapeRegistry
// ============================================================================

bool ShapeRegistry::define(std::string name, ShapePtr shape)
{
  if (shapes_.count(name) != 0) {
    return false;
  }
  order_.push_back(name);
  shapes_.emplace(std::move(name), std::move(shape));
  return true;
}

const Shape * ShapeRegistry::find(std::string_view name) const
{
  auto it = shapes_.find(std::string(name));
  return it == shapes_.end() ? nullptr : it->second.get();
}

ShapePtr ShapeRegistry::find_ptr(std::string_view name) const
{
  auto it = shapes_.find(std::string(name));
  return it == shapes_.end() ? nullptr : it->second;
}

// ============================================================================
// variant_table
// ============================================================================

VariantResolver variant_table(std::vector<std::pair<std::string, VariantShape>> variants)
{
  return [variants = std::move(variants)](std::string_view tag) -> DecodeResult<VariantShape> {
    auto it = std::find_if(variants.begin(), variants.end(), [&](const auto & v) {
      return v.first == tag;
    });
    if (it != variants.end()) {
      return it->second;
    }

    std::string expected;
    for (size_t i = 0; i < variants.size(); ++i) {
      if (i > 0) expected += ", ";
      expected += fmt::format("`{}`", variants[i].first);
    }
    if (variants.empty()) {
      return DecodeError::custom(fmt::format("unknown variant `{}`, there are no variants", tag));
    }
    if (variants.size() == 1) {
      return DecodeError::custom(fmt::format("unknown variant `{}`, expected {}", tag, expected));
    }
    return DecodeError::custom(
      fmt::format("unknown variant `{}`, expected one of {}", tag, expected));
  };
}

}  // namespace ts_decode
