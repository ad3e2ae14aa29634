// ts_decode/syntax/ts_ll.cpp - Low-level Tree-sitter wrapper implementation
#include "ts_decode/syntax/ts_ll.hpp"

#include <stdexcept>

namespace ts_decode::ts_ll
{

Parser::Parser(const TSLanguage * language)
{
  if (language == nullptr) {
    throw std::invalid_argument("tree-sitter language must not be null");
  }

  parser_ = ts_parser_new();
  if (parser_ == nullptr) {
    throw std::runtime_error("ts_parser_new() failed");
  }

  // Fails when the grammar was generated for an incompatible ABI version.
  if (!ts_parser_set_language(parser_, language)) {
    ts_parser_delete(parser_);
    parser_ = nullptr;
    throw std::runtime_error("ts_parser_set_language() failed: incompatible language version");
  }
}

Parser::~Parser()
{
  if (parser_) ts_parser_delete(parser_);
  parser_ = nullptr;
}

TSTree * Parser::parse_string(std::string_view source) const
{
  // Tree-sitter consumes bytes; grammars expect UTF-8.
  return ts_parser_parse_string(
    parser_, /*old_tree*/ nullptr, source.data(), static_cast<uint32_t>(source.size()));
}

}  // namespace ts_decode::ts_ll
