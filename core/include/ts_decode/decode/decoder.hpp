// ts_decode/decode/decoder.hpp - Shape-driven decoding of a concrete syntax tree
//
// The decoder is a recursive descent over (node, shape) pairs. It never
// mutates the tree and keeps no state between calls, so one instance may be
// shared freely. Every operation fails fast: the first error is returned
// unchanged and nothing decoded so far is kept.
//
#pragma once

#include <fmt/core.h>

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "ts_decode/decode/atom.hpp"
#include "ts_decode/decode/node_traits.hpp"
#include "ts_decode/decode/result.hpp"
#include "ts_decode/decode/shape.hpp"
#include "ts_decode/value/value.hpp"

namespace ts_decode
{

/// Upper bound on consecutive Ref hops before a reference is treated as cyclic.
inline constexpr size_t kMaxRefHops = 64;

template <typename N>
class Decoder;

/**
 * Single-pass reader that decodes a node list element by element.
 *
 * next() yields an empty optional once the list is exhausted. After the
 * first error the reader is finished and yields nothing further.
 */
template <typename N>
class SeqReader
{
public:
  SeqReader(const Decoder<N> & decoder, std::vector<N> nodes, const Shape & inner)
  : decoder_(&decoder), nodes_(std::move(nodes)), inner_(&inner)
  {
  }

  [[nodiscard]] DecodeResult<std::optional<Value>> next()
  {
    if (done_ || pos_ >= nodes_.size()) {
      return std::optional<Value>{};
    }
    auto r = decoder_->decode(nodes_[pos_++], *inner_);
    if (!r) {
      done_ = true;
      return std::move(r).error();
    }
    return std::optional<Value>(std::move(r).value());
  }

  [[nodiscard]] size_t remaining() const noexcept { return done_ ? 0 : nodes_.size() - pos_; }

private:
  const Decoder<N> * decoder_;
  std::vector<N> nodes_;
  const Shape * inner_;
  size_t pos_ = 0;
  bool done_ = false;
};

template <typename N>
class Decoder
{
  static_assert(
    is_decodable_node_v<N>,
    "Decoder requires kind/text/named_child_count/named_child/named_children/"
    "children_by_field_name");

public:
  /// `registry` resolves Ref shapes; it must outlive the decoder.
  explicit Decoder(const ShapeRegistry * registry = nullptr) : registry_(registry) {}

  // ==========================================================================
  // Node level
  // ==========================================================================

  [[nodiscard]] DecodeResult<Value> decode(const N & node, const Shape & shape) const
  {
    switch (shape.kind()) {
      case ShapeKind::Atom:
        return decode_atom(node, shape.atom_kind());
      case ShapeKind::Option:
        return decode_option(node.named_children(), shape.inner());
      case ShapeKind::Tuple:
        return decode_tuple(node.named_children(), shape.elements());
      case ShapeKind::Sequence:
        return decode_seq(node.named_children(), shape.inner());
      case ShapeKind::NamedWrapper:
        return decode_wrapper(node, std::string_view(shape.name()), shape.inner());
      case ShapeKind::Record:
        return decode_record(node, shape.name(), shape.fields());
      case ShapeKind::UnitRecord:
        if (node.kind() != shape.name()) {
          return DecodeError::node_kind(shape.name(), node.kind());
        }
        return Value::unit();
      case ShapeKind::TupleRecord:
        if (node.kind() != shape.name()) {
          return DecodeError::node_kind(shape.name(), node.kind());
        }
        return decode_tuple(node.named_children(), shape.elements());
      case ShapeKind::Union:
        return decode_union(node, shape.resolver());
      case ShapeKind::Identifier:
        return Value::borrowed(node.kind());
      case ShapeKind::Map:
        return DecodeError::unsupported("Data type `map` is not supported");
      case ShapeKind::Ref: {
        auto target = resolve(shape);
        if (!target) return std::move(target).error();
        return decode(node, **target);
      }
    }
    return DecodeError::custom(fmt::format("unhandled shape `{}`", shape.describe()));
  }

  [[nodiscard]] DecodeResult<Value> decode_atom(const N & node, AtomKind kind) const
  {
    return decode_atom_text(node.text(), kind);
  }

  // ==========================================================================
  // Sequences, tuples, options
  // ==========================================================================

  [[nodiscard]] SeqReader<N> read_seq(std::vector<N> nodes, const Shape & inner) const
  {
    return SeqReader<N>(*this, std::move(nodes), inner);
  }

  [[nodiscard]] DecodeResult<Value> decode_seq(std::vector<N> nodes, const Shape & inner) const
  {
    std::vector<Value> out;
    out.reserve(nodes.size());
    auto reader = read_seq(std::move(nodes), inner);
    while (true) {
      auto item = reader.next();
      if (!item) return std::move(item).error();
      if (!item->has_value()) break;
      out.push_back(std::move(**item));
    }
    return Value::list(std::move(out));
  }

  [[nodiscard]] DecodeResult<Value> decode_tuple(
    const std::vector<N> & nodes, const std::vector<ShapePtr> & elements) const
  {
    if (nodes.size() != elements.size()) {
      return DecodeError::arity(elements.size(), nodes.size());
    }
    std::vector<Value> out;
    out.reserve(nodes.size());
    for (size_t i = 0; i < nodes.size(); ++i) {
      auto r = decode(nodes[i], *elements[i]);
      if (!r) return std::move(r).error();
      out.push_back(std::move(r).value());
    }
    return Value::list(std::move(out));
  }

  /// More than one node is always reported as expecting exactly one.
  [[nodiscard]] DecodeResult<Value> decode_option(
    const std::vector<N> & nodes, const Shape & inner) const
  {
    if (nodes.empty()) {
      return Value::none();
    }
    if (nodes.size() > 1) {
      return DecodeError::arity(1, nodes.size());
    }
    auto r = decode(nodes.front(), inner);
    if (!r) return std::move(r).error();
    return Value::some(std::move(r).value());
  }

  // ==========================================================================
  // Records and fields
  // ==========================================================================

  [[nodiscard]] DecodeResult<Value> decode_record(
    const N & node, std::string_view name, const std::vector<FieldShape> & fields) const
  {
    if (node.kind() != name) {
      return DecodeError::node_kind(name, node.kind());
    }
    return decode_fields(node, name, fields);
  }

  /// Decode `fields` in declared order without checking the node's type tag.
  [[nodiscard]] DecodeResult<Value> decode_fields(
    const N & node, std::string_view name, const std::vector<FieldShape> & fields) const
  {
    std::vector<std::pair<std::string, Value>> out;
    out.reserve(fields.size());
    for (const auto & field : fields) {
      auto r = decode_field(node, field);
      if (!r) return std::move(r).error();
      out.emplace_back(field.name, std::move(r).value());
    }
    return Value::record(std::string(name), std::move(out));
  }

  /// Decode the children of `node` tagged with `field.name`.
  [[nodiscard]] DecodeResult<Value> decode_field(const N & node, const FieldShape & field) const
  {
    auto target = resolve(*field.shape);
    if (!target) return std::move(target).error();
    const Shape & shape = **target;

    std::vector<N> children = node.children_by_field_name(field.name);
    switch (shape.kind()) {
      case ShapeKind::Tuple:
        if (children.size() != shape.elements().size()) {
          return DecodeError::field_arity(field.name, shape.elements().size(), children.size());
        }
        return decode_tuple(children, shape.elements());
      case ShapeKind::Sequence:
        return decode_seq(std::move(children), shape.inner());
      case ShapeKind::Option:
        if (children.size() > 1) {
          return DecodeError::field_arity(field.name, 1, children.size());
        }
        return decode_option(children, shape.inner());
      default:
        if (children.size() != 1) {
          return DecodeError::field_arity(field.name, 1, children.size());
        }
        return decode(children.front(), shape);
    }
  }

  // ==========================================================================
  // Unions
  // ==========================================================================

  /// The node's type tag selects the variant; its payload lives on the same node.
  [[nodiscard]] DecodeResult<Value> decode_union(
    const N & node, const VariantResolver & resolver) const
  {
    auto tag_value = decode(node, *identifier_shape());
    if (!tag_value) return std::move(tag_value).error();
    const std::string_view tag = tag_value->as_text();

    if (!resolver) {
      return DecodeError::custom(fmt::format("no variant resolver for tag `{}`", tag));
    }
    auto variant = resolver(tag);
    if (!variant) return std::move(variant).error();

    switch (variant->style) {
      case VariantStyle::Unit:
        return Value::variant(std::string(tag), VariantStyle::Unit, Value::unit());
      case VariantStyle::Newtype: {
        if (!variant->newtype) {
          return DecodeError::custom(fmt::format("variant `{}` has no payload shape", tag));
        }
        auto r = decode_wrapper(node, std::nullopt, *variant->newtype);
        if (!r) return std::move(r).error();
        return Value::variant(std::string(tag), VariantStyle::Newtype, std::move(r).value());
      }
      case VariantStyle::Tuple: {
        const size_t arity = variant->elements.size();
        if (node.named_child_count() != arity) {
          return DecodeError::arity(arity, node.named_child_count());
        }
        auto r = decode_tuple(node.named_children(), variant->elements);
        if (!r) return std::move(r).error();
        return Value::variant(std::string(tag), VariantStyle::Tuple, std::move(r).value());
      }
      case VariantStyle::Record: {
        auto r = decode_fields(node, tag, variant->fields);
        if (!r) return std::move(r).error();
        return Value::variant(std::string(tag), VariantStyle::Record, std::move(r).value());
      }
    }
    return DecodeError::custom(fmt::format("unhandled variant style for `{}`", tag));
  }

  // ==========================================================================
  // Named wrappers
  // ==========================================================================

  /**
   * Decode `node` as the payload of a named wrapper.
   *
   * `name` is checked against the type tag when present; union newtype
   * variants pass no name because the tag has already been consumed.
   */
  [[nodiscard]] DecodeResult<Value> decode_wrapper(
    const N & node, std::optional<std::string_view> name, const Shape & inner) const
  {
    if (name && node.kind() != *name) {
      return DecodeError::node_kind(*name, node.kind());
    }

    auto target = resolve(inner);
    if (!target) return std::move(target).error();
    const Shape & shape = **target;

    switch (shape.kind()) {
      case ShapeKind::Atom: {
        const AtomKind atom = shape.atom_kind();
        if (atom == AtomKind::Char || atom == AtomKind::Bytes || atom == AtomKind::ByteBuf) {
          return unsupported_payload(to_string(atom), name);
        }
        return decode_atom(node, atom);
      }
      case ShapeKind::Sequence:
        return decode_seq(node.named_children(), shape.inner());
      case ShapeKind::Option:
        return decode_option(node.named_children(), shape.inner());
      case ShapeKind::Tuple:
        return decode_tuple(node.named_children(), shape.elements());
      case ShapeKind::Record:
      case ShapeKind::UnitRecord:
      case ShapeKind::TupleRecord:
      case ShapeKind::Union:
      case ShapeKind::NamedWrapper: {
        const uint32_t count = node.named_child_count();
        if (count != 1) {
          return DecodeError::arity(1, count);
        }
        return decode(node.named_child(0), shape);
      }
      case ShapeKind::Identifier:
      case ShapeKind::Map:
      case ShapeKind::Ref:
        return unsupported_payload(to_string(shape.kind()), name);
    }
    return unsupported_payload(to_string(shape.kind()), name);
  }

private:
  static const ShapePtr & identifier_shape()
  {
    static const ShapePtr shape = Shape::identifier();
    return shape;
  }

  static DecodeError unsupported_payload(
    std::string_view data_type, std::optional<std::string_view> wrapper)
  {
    if (wrapper) {
      return DecodeError::unsupported(fmt::format(
        "Data type `{}` is not supported as the payload of wrapper `{}`", data_type, *wrapper));
    }
    return DecodeError::unsupported(
      fmt::format("Data type `{}` is not supported as a newtype payload", data_type));
  }

  /// Follow Ref shapes to the shape they name.
  [[nodiscard]] DecodeResult<const Shape *> resolve(const Shape & shape) const
  {
    const Shape * current = &shape;
    for (size_t hops = 0; current->kind() == ShapeKind::Ref; ++hops) {
      if (hops >= kMaxRefHops) {
        return DecodeError::custom(
          fmt::format("shape reference `{}` does not resolve to a concrete shape", shape.name()));
      }
      const Shape * next = registry_ ? registry_->find(current->name()) : nullptr;
      if (!next) {
        return DecodeError::custom(fmt::format("unknown shape reference `{}`", current->name()));
      }
      current = next;
    }
    return current;
  }

  const ShapeRegistry * registry_;
};

}  // namespace ts_decode
