// ts_decode/decode/error_report.hpp - DecodeError to Diagnostic conversion
#pragma once

#include <string>

#include "ts_decode/basic/diagnostic.hpp"
#include "ts_decode/decode/error.hpp"

namespace ts_decode
{

/// Stable diagnostic code for an error category ("D0001".."D0008").
[[nodiscard]] std::string diagnostic_code(DecodeErrorKind kind);

/**
 * Build a diagnostic for `error`.
 *
 * StructuralError carries its own spans and gets one label per span. For the
 * other categories `at` (usually the decoded node's range) becomes the
 * primary label when valid.
 */
[[nodiscard]] Diagnostic to_diagnostic(const DecodeError & error, SourceRange at = {});

void report(DiagnosticBag & bag, const DecodeError & error, SourceRange at = {});

}  // namespace ts_decode
