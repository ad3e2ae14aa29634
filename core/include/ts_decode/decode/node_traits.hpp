// ts_decode/decode/node_traits.hpp - Compile-time checks for node handle types
//
// The decoder and the error scan are templates over a node handle type.
// These traits spell out the capability set each of them needs so a
// mismatch is reported by a static_assert instead of deep inside the engine.
//
#pragma once

#include <cstdint>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#include "ts_decode/basic/source_manager.hpp"

namespace ts_decode
{

namespace detail
{

template <typename N, typename = void>
struct IsDecodableNode : std::false_type
{
};

template <typename N>
struct IsDecodableNode<
  N, std::void_t<
       decltype(std::string_view(std::declval<const N &>().kind())),
       decltype(std::string_view(std::declval<const N &>().text())),
       decltype(static_cast<uint32_t>(std::declval<const N &>().named_child_count())),
       decltype(N(std::declval<const N &>().named_child(uint32_t{}))),
       decltype(std::vector<N>(std::declval<const N &>().named_children())),
       decltype(std::vector<N>(
         std::declval<const N &>().children_by_field_name(std::string_view{})))>>
: std::is_copy_constructible<N>
{
};

template <typename N, typename = void>
struct IsScannableNode : std::false_type
{
};

template <typename N>
struct IsScannableNode<
  N, std::void_t<
       decltype(static_cast<bool>(std::declval<const N &>().is_error())),
       decltype(static_cast<bool>(std::declval<const N &>().is_missing())),
       decltype(static_cast<bool>(std::declval<const N &>().has_error())),
       decltype(SourceRange(std::declval<const N &>().range())),
       decltype(static_cast<uint32_t>(std::declval<const N &>().child_count())),
       decltype(N(std::declval<const N &>().child(uint32_t{})))>>
: std::is_copy_constructible<N>
{
};

}  // namespace detail

/// N exposes the type tag, text, named children and field-tagged children.
template <typename N>
inline constexpr bool is_decodable_node_v = detail::IsDecodableNode<N>::value;

/// N additionally exposes error markers, spans and all (named and anonymous) children.
template <typename N>
inline constexpr bool is_scannable_node_v =
  is_decodable_node_v<N> && detail::IsScannableNode<N>::value;

}  // namespace ts_decode
