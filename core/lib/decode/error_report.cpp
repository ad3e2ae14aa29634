// ts_decode/decode/error_report.cpp - DecodeError to Diagnostic conversion
#include "ts_decode/decode/error_report.hpp"

#include <fmt/core.h>

namespace ts_decode
{

std::string diagnostic_code(DecodeErrorKind kind)
{
  return fmt::format("D{:04}", static_cast<unsigned>(kind) + 1);
}

Diagnostic to_diagnostic(const DecodeError & error, SourceRange at)
{
  Diagnostic diag;
  diag.severity = Severity::Error;
  diag.code = diagnostic_code(error.kind());
  diag.message = error.message();

  if (const auto * structural = error.get_if<StructuralError>()) {
    for (const auto & span : structural->spans) {
      diag.labels.push_back(Label{span, "syntax error", LabelStyle::Primary});
    }
    diag.help_message = "decode without error checking to accept partial trees";
    return diag;
  }

  if (at.is_valid()) {
    diag.labels.push_back(Label{at, "while decoding this node", LabelStyle::Primary});
  }

  switch (error.kind()) {
    case DecodeErrorKind::NodeKindMismatch: {
      const auto & e = error.get<NodeKindMismatch>();
      diag.help_message = fmt::format("expected a `{}` node here", e.expected);
      break;
    }
    case DecodeErrorKind::FieldArityMismatch: {
      const auto & e = error.get<FieldArityMismatch>();
      diag.help_message = fmt::format(
        "declare field `{}` as a sequence or option to accept a varying number of nodes",
        e.field_name);
      break;
    }
    default:
      break;
  }
  return diag;
}

void report(DiagnosticBag & bag, const DecodeError & error, SourceRange at)
{
  bag.add(to_diagnostic(error, at));
}

}  // namespace ts_decode
